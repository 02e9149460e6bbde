// /////////////////////////////////////////////////////////////////////////////
/// @file Envelope.hpp
/// @brief JSON wire envelope for point-cloud messages.
///
/// One envelope per text frame:
/// @code
///   {"type":"pointcloud","timestamp":1700000000000,
///    "data":[{"x":0.1,"y":0.2,"z":0.3}, ...]}
/// @endcode
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/stream/Message.hpp>
#include <synapse/core/Expected.hpp>

#include <string>
#include <string_view>

namespace synapse::protocol {

/// @brief Serializes a Message into its envelope text.
///
/// Coordinates are written with shortest round-trip precision.  Fails with
/// kSerializationFailed only for values JSON cannot carry (NaN, infinity).
[[nodiscard]] core::Expected<std::string> serialize(const stream::Message& message);

/// @brief Parses an envelope back into a Message.
/// @return kDeserializationFailed for malformed JSON, kProtocolViolation for
///         well-formed JSON that is not an envelope.
[[nodiscard]] core::Expected<stream::Message> parse(std::string_view text);

} // namespace synapse::protocol
