// /////////////////////////////////////////////////////////////////////////////
/// @file SinkServer.hpp
/// @brief Reference WebSocket receiver for point-cloud envelopes.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/sink/SinkConfig.hpp>
#include <synapse/stream/Message.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/NonCopyable.hpp>
#include <synapse/core/Types.hpp>

#include <functional>
#include <memory>

namespace boost::asio {
class io_context;
} // namespace boost::asio

namespace synapse::sink {

struct SinkStats
{
    core::u64 connectionsAccepted{0};
    core::u32 activeSessions{0};
    core::u64 framesReceived{0};
    core::u64 samplesReceived{0};
    core::u64 framesRejected{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class SinkServer
/// @brief Accepts WebSocket clients and consumes their envelopes.
///
/// Each text frame is parsed as an envelope.  Valid frames are answered
/// with "ACK"; anything else gets "ERROR: <reason>" and the session stays
/// open.  Runs entirely on the given io_context.
// /////////////////////////////////////////////////////////////////////////////
class SinkServer final : public core::NonCopyable<SinkServer>
{
public:
    using FrameListener = std::function<void(const stream::Message&)>;

    SinkServer(boost::asio::io_context& io, SinkConfig config);
    ~SinkServer();

    /// @brief Binds, listens and starts accepting.
    /// @return kInvalidArgument for a bad address, kConnectionFailed when
    ///         the port cannot be bound, kAlreadyRunning when started.
    [[nodiscard]] core::Expected<void> start();

    /// @brief Stops accepting and closes every session.
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept;

    /// @brief Bound port (resolved after start() when configured as 0).
    [[nodiscard]] core::u16 port() const noexcept;

    [[nodiscard]] SinkStats stats() const noexcept;

    /// @brief Observer invoked for every accepted envelope.
    void setFrameListener(FrameListener listener);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace synapse::sink
