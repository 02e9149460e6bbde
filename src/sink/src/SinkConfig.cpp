// /////////////////////////////////////////////////////////////////////////////
/// @file SinkConfig.cpp
/// @brief Command-line parsing for the reference receiver.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/sink/SinkConfig.hpp>

#include <charconv>

namespace synapse::sink {

core::Expected<SinkConfig> SinkConfig::fromArgs(int argc, const char* const* argv)
{
    SinkConfig cfg;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view flag{argv[i]};

        if (flag == "--help" || flag == "-h")
        {
            cfg.helpRequested = true;
            return cfg;
        }

        if (i + 1 >= argc)
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::string{flag} + ": missing value");
        const std::string_view value{argv[++i]};

        if (flag == "--listen")
        {
            if (value.empty())
                return core::makeError(core::ErrorCode::kInvalidArgument, "--listen: empty address");
            cfg.address = std::string{value};
        }
        else if (flag == "--port")
        {
            core::u32 port{0};
            const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
            if (ec != std::errc{} || end != value.data() + value.size() || port > 65535)
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "--port: invalid value '" + std::string{value} + "'");
            cfg.port = static_cast<core::u16>(port);
        }
        else if (flag == "--log-level")
            cfg.logLevel = SYNAPSE_TRY(core::parseLogLevel(value));
        else
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "unknown option '" + std::string{flag} + "'");
    }

    return cfg;
}

std::string SinkConfig::usage(std::string_view program)
{
    std::string text = "usage: ";
    text += program;
    text += " [options]\n"
            "  --listen <address>   bind address (default 0.0.0.0)\n"
            "  --port <n>           listen port, 0 = ephemeral (default 8081)\n"
            "  --log-level <level>  debug|info|warn|error|fatal (default info)\n"
            "  --help               show this text\n";
    return text;
}

} // namespace synapse::sink
