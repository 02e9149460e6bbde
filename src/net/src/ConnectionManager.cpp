// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectionManager.cpp
/// @brief Connection lifecycle and state transitions.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/net/ConnectionManager.hpp>
#include <synapse/core/Log.hpp>

#include <utility>

namespace synapse::net {

ConnectionManager::ConnectionManager(transport::TransportFactory factory)
    : factory_{std::move(factory)}
{
}

ConnectionManager::~ConnectionManager()
{
    if (transport_)
    {
        ++generation_;
        transport_->close();
        transport_.reset();
    }
}

void ConnectionManager::connect(const Endpoint& endpoint)
{
    if (state_ != ConnectionState::Disconnected)
    {
        core::Log::debug("NET", "ConnectionManager: connect ignored, already " + std::string{toString(state_)});
        return;
    }

    std::unique_ptr<transport::ITransport> fresh;
    if (factory_)
        fresh = factory_();
    if (!fresh)
    {
        core::Log::error("NET", "ConnectionManager: no transport available");
        setState(ConnectionState::Disconnected,
                 core::Error{core::ErrorCode::kInternalError, "transport factory returned no transport"});
        return;
    }

    const core::u64 generation = ++generation_;
    transport_ = std::move(fresh);
    endpoint_ = endpoint;
    setState(ConnectionState::Connecting, std::nullopt);
    if (generation != generation_ || !transport_)
        return; // listener disconnected re-entrantly

    transport::TransportEvents events;
    events.onOpen    = [this, generation]() { onOpen(generation); };
    events.onClosed  = [this, generation](core::Error cause) { onClosed(generation, std::move(cause)); };
    events.onMessage = [this, generation](std::string_view frame) { onMessage(generation, frame); };

    core::Log::info("NET", "ConnectionManager: connecting to " + endpoint.toString()
                           + " via " + transport_->name());
    transport_->open(endpoint, std::move(events));
}

void ConnectionManager::disconnect()
{
    if (state_ == ConnectionState::Disconnected)
        return;

    ++generation_;
    if (transport_)
    {
        transport_->close();
        transport_.reset();
    }
    core::Log::info("NET", "ConnectionManager: disconnected");
    setState(ConnectionState::Disconnected, std::nullopt);
}

core::Expected<void> ConnectionManager::write(std::string payload)
{
    if (state_ != ConnectionState::Connected || !transport_)
    {
        return core::makeError(core::ErrorCode::kNotConnected,
                               "connection is " + std::string{toString(state_)});
    }
    return transport_->write(std::move(payload));
}

void ConnectionManager::setStateListener(StateListener listener)
{
    stateListener_ = std::move(listener);
}

void ConnectionManager::setMessageListener(MessageListener listener)
{
    messageListener_ = std::move(listener);
}

void ConnectionManager::onOpen(core::u64 generation)
{
    if (generation != generation_ || state_ != ConnectionState::Connecting)
        return;

    ++connectCount_;
    core::Log::info("NET", "ConnectionManager: connected");
    setState(ConnectionState::Connected, std::nullopt);
}

void ConnectionManager::onClosed(core::u64 generation, core::Error cause)
{
    if (generation != generation_)
        return;

    ++generation_;
    core::Log::warn("NET", "ConnectionManager: connection lost (" + cause.describe() + ")");
    if (transport_)
    {
        transport_->close();
        transport_.reset();
    }
    setState(ConnectionState::Disconnected, cause);
}

void ConnectionManager::onMessage(core::u64 generation, std::string_view frame)
{
    if (generation != generation_)
        return;

    core::Log::debug("NET", "from server: " + std::string{frame});
    if (messageListener_)
        messageListener_(frame);
}

void ConnectionManager::setState(ConnectionState next, const std::optional<core::Error>& cause)
{
    if (next == state_ && !cause)
        return;

    state_ = next;
    if (stateListener_)
        stateListener_(state_, cause);
}

} // namespace synapse::net
