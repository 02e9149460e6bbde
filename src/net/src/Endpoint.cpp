// /////////////////////////////////////////////////////////////////////////////
/// @file Endpoint.cpp
/// @brief ws:// URL parsing.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/net/Endpoint.hpp>

#include <charconv>

namespace synapse::net {

std::string Endpoint::toString() const
{
    std::string out{"ws://"};
    out += host;
    out += ':';
    out += std::to_string(port);
    out += target;
    return out;
}

core::Expected<Endpoint> parseEndpoint(std::string_view url)
{
    constexpr std::string_view kScheme = "ws://";
    if (!url.starts_with(kScheme))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "unsupported endpoint '" + std::string{url} + "' (expected ws://host:port)");
    }

    std::string_view body = url.substr(kScheme.size());
    Endpoint ep;

    const auto slash = body.find('/');
    if (slash != std::string_view::npos)
    {
        ep.target = std::string{body.substr(slash)};
        body = body.substr(0, slash);
    }

    const auto colon = body.rfind(':');
    if (colon != std::string_view::npos)
    {
        const std::string_view portText = body.substr(colon + 1);
        unsigned value = 0;
        const auto [end, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), value);
        if (ec != std::errc{} || end != portText.data() + portText.size() || value == 0 || value > 65535)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "invalid port '" + std::string{portText} + "'");
        }
        ep.port = static_cast<core::u16>(value);
        body = body.substr(0, colon);
    }

    if (body.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "endpoint host is empty");
    }
    ep.host = std::string{body};
    return ep;
}

} // namespace synapse::net
