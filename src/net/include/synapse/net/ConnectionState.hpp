// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectionState.hpp
/// @brief Lifecycle states of the bridge's single connection.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/core/Types.hpp>

#include <string_view>

namespace synapse::net {

// /////////////////////////////////////////////////////////////////////////////
/// @enum ConnectionState
/// @brief Owned and mutated only by ConnectionManager.
// /////////////////////////////////////////////////////////////////////////////
enum class ConnectionState : core::u8
{
    Disconnected,
    Connecting,
    Connected
};

[[nodiscard]] constexpr std::string_view toString(ConnectionState state) noexcept
{
    switch (state)
    {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

} // namespace synapse::net
