// /////////////////////////////////////////////////////////////////////////////
/// @file Message.cpp
/// @brief Message construction helpers.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/stream/Message.hpp>
#include <synapse/core/Constants.hpp>

#include <chrono>
#include <utility>

namespace synapse::stream {

core::i64 nowMillis() noexcept
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

Message::Message(std::string type, core::i64 timestampMs, std::vector<Sample> data)
    : type_{std::move(type)}
    , timestamp_{timestampMs}
    , data_{std::move(data)}
{
}

Message Message::pointCloud(std::vector<Sample> data)
{
    return Message{std::string{core::kPointCloudType}, nowMillis(), std::move(data)};
}

} // namespace synapse::stream
