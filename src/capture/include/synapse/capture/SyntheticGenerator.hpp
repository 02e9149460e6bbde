/**
 * @file SyntheticGenerator.hpp
 * @brief Uniform random point generator for simulation without hardware.
 *
 * Deterministic for tests (fixed seed), stochastic for live simulation
 * (seed 0 draws from std::random_device).
 *
 * @code
 *   SyntheticGenerator gen(42);
 *   auto batch = gen.generate(256); // 256 points in [0, 1)^3
 * @endcode
 *
 * @copyright MIT License
 */

#pragma once

#include <synapse/stream/Sample.hpp>
#include <synapse/core/Types.hpp>

#include <random>
#include <vector>

namespace synapse::capture {

class SyntheticGenerator {
public:
    explicit SyntheticGenerator(core::u64 seed = 0);

    /**
     * @brief Draws @p count samples, each coordinate independent and
     *        uniform in [0, 1).
     */
    [[nodiscard]] std::vector<stream::Sample> generate(core::usize count);

    [[nodiscard]] core::u64 seed() const noexcept { return _seed; }

private:
    core::u64 _seed;
    std::mt19937_64 _rng;
    std::uniform_real_distribution<core::f64> _unit{0.0, 1.0};
};

} // namespace synapse::capture
