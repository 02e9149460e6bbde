// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectionManager.hpp
/// @brief Owner of the bridge's single persistent connection.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/net/ConnectionState.hpp>
#include <synapse/net/Endpoint.hpp>
#include <synapse/net/transport/ITransport.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace synapse::net {

// /////////////////////////////////////////////////////////////////////////////
/// @class ConnectionManager
/// @brief Opens, tracks and closes at most one transport at a time.
///
/// State transitions:
///   - connect():     Disconnected -> Connecting (immediately)
///   - transport open: Connecting  -> Connected
///   - open failure, remote close or I/O error -> Disconnected (+ cause)
///   - disconnect():  any -> Disconnected (synchronously)
///
/// Every transition is reported to the state listener.  A failure is
/// never fatal; connect() may be called again at any time.
// /////////////////////////////////////////////////////////////////////////////
class ConnectionManager final : public core::NonCopyable<ConnectionManager>
{
public:
    /// @brief Called on every transition; @p cause is set when the
    ///        transition to Disconnected was not requested locally.
    using StateListener   = std::function<void(ConnectionState state, const std::optional<core::Error>& cause)>;
    using MessageListener = std::function<void(std::string_view frame)>;

    explicit ConnectionManager(transport::TransportFactory factory);
    ~ConnectionManager();

    /// @brief Starts connecting; no-op unless Disconnected.
    void connect(const Endpoint& endpoint);

    /// @brief Closes the connection; no-op when already Disconnected.
    void disconnect();

    [[nodiscard]] ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] bool isConnected() const noexcept { return state_ == ConnectionState::Connected; }

    /// @brief Writes one text frame on the open connection.
    /// @return kNotConnected unless Connected, or the transport's error.
    [[nodiscard]] core::Expected<void> write(std::string payload);

    void setStateListener(StateListener listener);
    void setMessageListener(MessageListener listener);

    /// @brief 1 while a transport is held (Connecting or Connected), else 0.
    [[nodiscard]] core::u32 openConnections() const noexcept { return transport_ ? 1u : 0u; }

    /// @brief Number of successful opens since construction.
    [[nodiscard]] core::u64 connectCount() const noexcept { return connectCount_; }

    /// @brief Endpoint of the current or last connection attempt.
    [[nodiscard]] const std::optional<Endpoint>& endpoint() const noexcept { return endpoint_; }

private:
    void onOpen(core::u64 generation);
    void onClosed(core::u64 generation, core::Error cause);
    void onMessage(core::u64 generation, std::string_view frame);
    void setState(ConnectionState next, const std::optional<core::Error>& cause);

    transport::TransportFactory              factory_;
    std::unique_ptr<transport::ITransport>   transport_;
    ConnectionState                          state_{ConnectionState::Disconnected};
    core::u64                                generation_{0};
    core::u64                                connectCount_{0};
    std::optional<Endpoint>                  endpoint_;
    StateListener                            stateListener_;
    MessageListener                          messageListener_;
};

} // namespace synapse::net
