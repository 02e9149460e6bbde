// /////////////////////////////////////////////////////////////////////////////
/// @file Sample.hpp
/// @brief A single 3D point produced by a capture source.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/core/Types.hpp>

namespace synapse::stream {

/// @brief One point (x, y, z).
///
/// Synthetic data is drawn in [0, 1) per coordinate; captured data is
/// unconstrained.
struct Sample
{
    core::f64 x{0.0};
    core::f64 y{0.0};
    core::f64 z{0.0};

    bool operator==(const Sample&) const = default;
};

} // namespace synapse::stream
