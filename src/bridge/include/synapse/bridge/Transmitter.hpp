// /////////////////////////////////////////////////////////////////////////////
/// @file Transmitter.hpp
/// @brief Frames a Message into the wire envelope and writes it.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/net/ConnectionManager.hpp>
#include <synapse/stream/Message.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/Types.hpp>

namespace synapse::bridge {

struct TransmitStats
{
    core::u64 messagesSent{0};
    core::u64 samplesSent{0};
    core::u64 rejected{0};              ///< send() while not Connected
    core::u64 serializationFailures{0};
    core::u64 writeFailures{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Transmitter
/// @brief Fire-and-forget sender: no retry, no buffering.
///
/// The connection state is checked before anything else, so a rejected
/// send neither serializes nor touches the transport.
// /////////////////////////////////////////////////////////////////////////////
class Transmitter
{
public:
    /// @return kNotConnected unless @p connection is Connected,
    ///         kSerializationFailed if the message cannot be framed
    ///         (logged, message dropped), or the transport's write error.
    [[nodiscard]] core::Expected<void> send(net::ConnectionManager& connection,
                                            const stream::Message& message);

    [[nodiscard]] const TransmitStats& stats() const noexcept { return stats_; }

private:
    TransmitStats stats_;
};

} // namespace synapse::bridge
