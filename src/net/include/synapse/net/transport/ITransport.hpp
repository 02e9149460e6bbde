// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract message transport (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/net/Endpoint.hpp>
#include <synapse/core/Expected.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace synapse::net::transport {

/// @brief Callbacks a transport raises on the event loop.
struct TransportEvents
{
    /// Handshake completed; writes are accepted from now on.
    std::function<void()> onOpen;
    /// Open failed, peer closed, or I/O error.  Raised at most once.
    std::function<void(core::Error)> onClosed;
    /// One inbound text frame.
    std::function<void(std::string_view)> onMessage;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Strategy interface for a persistent message-oriented connection.
///
/// Concrete implementations:
///   - @c WebSocketTransport: Boost.Beast WebSocket client.
///
/// All calls and all events happen on the owning event loop.  After
/// @ref close returns, no event is raised any more even if the socket
/// teardown completes later.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Starts connecting; completion is reported through @p events.
    virtual void open(const Endpoint& endpoint, TransportEvents events) = 0;

    /// @brief Closes the connection and drops all registered events.
    virtual void close() noexcept = 0;

    /// @brief Queues one text frame.  Frames leave in call order.
    [[nodiscard]] virtual core::Expected<void> write(std::string payload) = 0;

    /// @brief True between onOpen and close/onClosed.
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/// @brief Creates a fresh, unopened transport for each connection attempt.
using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

} // namespace synapse::net::transport
