// /////////////////////////////////////////////////////////////////////////////
/// @file WebSocketTransport.hpp
/// @brief Boost.Beast WebSocket client transport.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/net/transport/ITransport.hpp>
#include <synapse/core/NonCopyable.hpp>

#include <memory>

namespace boost::asio {
class io_context;
} // namespace boost::asio

namespace synapse::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class WebSocketTransport
/// @brief Asynchronous WebSocket client (resolve, connect, handshake, read
///        loop, FIFO write queue) running on a single io_context.
///
/// The socket state lives in a shared implementation object kept alive by
/// its pending handlers, so destroying the transport while a close
/// handshake is still in flight is safe.
// /////////////////////////////////////////////////////////////////////////////
class WebSocketTransport final : public ITransport,
                                 public core::NonCopyable<WebSocketTransport>
{
public:
    explicit WebSocketTransport(boost::asio::io_context& io);
    ~WebSocketTransport() override;

    void open(const Endpoint& endpoint, TransportEvents events) override;
    void close() noexcept override;

    [[nodiscard]] core::Expected<void> write(std::string payload) override;

    [[nodiscard]] bool isOpen() const noexcept override;
    [[nodiscard]] const char* name() const noexcept override;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace synapse::net::transport
