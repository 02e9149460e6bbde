// /////////////////////////////////////////////////////////////////////////////
/// @file Endpoint.hpp
/// @brief WebSocket endpoint address (ws://host:port/target).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/core/Constants.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/Types.hpp>

#include <string>
#include <string_view>

namespace synapse::net {

struct Endpoint
{
    std::string host{core::kDefaultHost};
    core::u16   port{core::kDefaultPort};
    std::string target{core::kDefaultTarget};

    /// @brief Renders "ws://host:port/target".
    [[nodiscard]] std::string toString() const;

    bool operator==(const Endpoint&) const = default;
};

/// @brief Parses a ws:// URL.
///
/// The port defaults to 8081 and the target to "/".  Any other scheme, an
/// empty host, or a port outside [1, 65535] is rejected.
[[nodiscard]] core::Expected<Endpoint> parseEndpoint(std::string_view url);

} // namespace synapse::net
