// /////////////////////////////////////////////////////////////////////////////
/// @file Operator.hpp
/// @brief Operator-facing notifications (Observer pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/net/ConnectionState.hpp>
#include <synapse/core/Types.hpp>

#include <string>
#include <string_view>

namespace synapse::bridge {

enum class AlertKind : core::u8
{
    NotConnected,
    CaptureDropped,
    TransmitFailed,
    ConnectionError
};

[[nodiscard]] constexpr std::string_view toString(AlertKind kind) noexcept
{
    switch (kind)
    {
        case AlertKind::NotConnected:    return "not-connected";
        case AlertKind::CaptureDropped:  return "capture-dropped";
        case AlertKind::TransmitFailed:  return "transmit-failed";
        case AlertKind::ConnectionError: return "connection-error";
    }
    return "unknown";
}

/// @brief One operator-visible alert (a dialog or a console line).
struct Alert
{
    AlertKind   kind;
    std::string title;
    std::string detail;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IOperatorSink
/// @brief Receives everything the operator surface displays.
///
/// Every callback runs on the bridge's event loop.
// /////////////////////////////////////////////////////////////////////////////
class IOperatorSink
{
public:
    virtual ~IOperatorSink() = default;

    virtual void onStateChanged(net::ConnectionState state) = 0;
    virtual void onStreamingChanged(bool streaming) = 0;
    virtual void onAlert(const Alert& alert) = 0;

    /// @brief Text frame received from the remote consumer.
    virtual void onServerMessage(std::string_view /*frame*/) {}
};

} // namespace synapse::bridge
