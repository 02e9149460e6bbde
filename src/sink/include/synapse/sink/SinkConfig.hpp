// /////////////////////////////////////////////////////////////////////////////
/// @file SinkConfig.hpp
/// @brief Reference receiver configuration.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/core/Constants.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/Log.hpp>
#include <synapse/core/Types.hpp>

#include <string>
#include <string_view>

namespace synapse::sink {

struct SinkConfig
{
    std::string    address{core::kDefaultListen};
    core::u16      port{core::kDefaultPort};      ///< 0 picks an ephemeral port
    core::LogLevel logLevel{core::LogLevel::kInfo};
    bool           helpRequested{false};

    /// @brief Parses @c --listen, @c --port, @c --log-level and @c --help.
    [[nodiscard]] static core::Expected<SinkConfig> fromArgs(int argc, const char* const* argv);

    [[nodiscard]] static std::string usage(std::string_view program);
};

} // namespace synapse::sink
