// /////////////////////////////////////////////////////////////////////////////
/// @file Transmitter.cpp
/// @brief Transmitter implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/bridge/Transmitter.hpp>
#include <synapse/protocol/Envelope.hpp>
#include <synapse/core/Log.hpp>

#include <string>

namespace synapse::bridge {

core::Expected<void> Transmitter::send(net::ConnectionManager& connection,
                                       const stream::Message& message)
{
    if (!connection.isConnected())
    {
        ++stats_.rejected;
        return core::makeError(core::ErrorCode::kNotConnected,
                               "not connected to the WebSocket server");
    }

    auto payload = protocol::serialize(message);
    if (!payload)
    {
        ++stats_.serializationFailures;
        core::Log::error("TX", "dropping message: " + payload.error().describe());
        return std::unexpected(std::move(payload.error()));
    }

    if (auto written = connection.write(std::move(*payload)); !written)
    {
        ++stats_.writeFailures;
        core::Log::error("TX", "write failed: " + written.error().describe());
        return written;
    }

    ++stats_.messagesSent;
    stats_.samplesSent += message.size();
    core::Log::debug("TX", "sent " + std::to_string(message.size()) + " samples");
    return {};
}

} // namespace synapse::bridge
