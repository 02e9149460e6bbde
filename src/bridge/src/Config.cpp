// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder and command-line parsing.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/bridge/Config.hpp>

#include <charconv>
#include <limits>
#include <utility>

namespace synapse::bridge {

namespace {

template <typename T>
core::Expected<T> parseUnsigned(std::string_view flag, std::string_view text, T min, T max)
{
    core::u64 value{0};
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [end, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || end != last || value < min || value > max)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::string{flag} + ": invalid value '" + std::string{text} + "'");
    }
    return static_cast<T>(value);
}

} // namespace

// ========================================================================== //
//  Builder                                                                   //
// ========================================================================== //

Config::Builder& Config::Builder::host(std::string value)
{
    host_ = std::move(value);
    return *this;
}

Config::Builder& Config::Builder::port(core::u16 value) noexcept
{
    port_ = value;
    return *this;
}

Config::Builder& Config::Builder::path(std::string value)
{
    path_ = std::move(value);
    return *this;
}

Config::Builder& Config::Builder::endpoint(const net::Endpoint& value)
{
    host_ = value.host;
    port_ = value.port;
    path_ = value.target;
    return *this;
}

Config::Builder& Config::Builder::cadence(std::chrono::milliseconds value) noexcept
{
    cadence_ = value;
    return *this;
}

Config::Builder& Config::Builder::batchSize(core::usize value) noexcept
{
    batchSize_ = value;
    return *this;
}

Config::Builder& Config::Builder::seed(core::u64 value) noexcept
{
    seed_ = value;
    return *this;
}

Config::Builder& Config::Builder::producer(capture::ProducerMode mode) noexcept
{
    producer_ = mode;
    return *this;
}

Config::Builder& Config::Builder::replayFile(std::string value)
{
    replayFile_ = std::move(value);
    return *this;
}

Config::Builder& Config::Builder::loop(bool enabled) noexcept
{
    loop_ = enabled;
    return *this;
}

Config::Builder& Config::Builder::checkpointDirectory(std::string value)
{
    checkpointDirectory_ = std::move(value);
    return *this;
}

Config::Builder& Config::Builder::imagesDirectory(std::string value)
{
    imagesDirectory_ = std::move(value);
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg.host_       = host_;
    cfg.port_       = port_;
    cfg.path_       = path_.empty() || path_.front() != '/' ? "/" + path_ : path_;
    cfg.cadence_    = cadence_;
    cfg.batchSize_  = batchSize_;
    cfg.seed_       = seed_;
    cfg.producer_   = producer_;
    cfg.replayFile_ = replayFile_;
    cfg.loop_       = loop_;
    cfg.directories_.checkpointDirectory = checkpointDirectory_;
    cfg.directories_.imagesDirectory     = imagesDirectory_;
    cfg.logLevel_   = logLevel_;
    return cfg;
}

// ========================================================================== //
//  Config                                                                    //
// ========================================================================== //

core::Expected<Config> Config::fromArgs(int argc, const char* const* argv)
{
    Builder builder;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view flag{argv[i]};

        if (flag == "--help" || flag == "-h")
        {
            Config cfg = builder.build();
            cfg.helpRequested_ = true;
            return cfg;
        }
        if (flag == "--loop")
        {
            builder.loop(true);
            continue;
        }

        if (i + 1 >= argc)
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::string{flag} + ": missing value");
        const std::string_view value{argv[++i]};

        if (flag == "--host")
        {
            if (value.empty())
                return core::makeError(core::ErrorCode::kInvalidArgument, "--host: empty host");
            builder.host(std::string{value});
        }
        else if (flag == "--port")
            builder.port(SYNAPSE_TRY(parseUnsigned<core::u16>(flag, value, 1, 65535)));
        else if (flag == "--path")
            builder.path(std::string{value});
        else if (flag == "--endpoint")
            builder.endpoint(SYNAPSE_TRY(net::parseEndpoint(value)));
        else if (flag == "--cadence-ms")
            builder.cadence(std::chrono::milliseconds{
                SYNAPSE_TRY(parseUnsigned<core::u32>(flag, value, 1, std::numeric_limits<core::u32>::max()))});
        else if (flag == "--batch")
            builder.batchSize(SYNAPSE_TRY(parseUnsigned<core::usize>(flag, value, 1, 1'000'000)));
        else if (flag == "--seed")
            builder.seed(SYNAPSE_TRY(parseUnsigned<core::u64>(flag, value, 0, std::numeric_limits<core::u64>::max())));
        else if (flag == "--producer")
            builder.producer(SYNAPSE_TRY(capture::parseProducerMode(value)));
        else if (flag == "--replay-file")
            builder.replayFile(std::string{value});
        else if (flag == "--checkpoint-dir")
            builder.checkpointDirectory(std::string{value});
        else if (flag == "--images-dir")
            builder.imagesDirectory(std::string{value});
        else if (flag == "--log-level")
            builder.logLevel(SYNAPSE_TRY(core::parseLogLevel(value)));
        else
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "unknown option '" + std::string{flag} + "'");
    }

    Config cfg = builder.build();
    if (cfg.producer_ == capture::ProducerMode::kCsvReplay && cfg.replayFile_.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "--producer replay requires --replay-file");
    return cfg;
}

std::string Config::usage(std::string_view program)
{
    std::string text = "usage: ";
    text += program;
    text += " [options]\n"
            "  --host <name>            server host (default localhost)\n"
            "  --port <n>               server port (default 8081)\n"
            "  --path <target>          WebSocket path (default /)\n"
            "  --endpoint <url>         ws://host:port/path, replaces host, port and path\n"
            "  --cadence-ms <n>         simulated stream period (default 500)\n"
            "  --batch <n>              samples per batch (default 256)\n"
            "  --seed <n>               synthetic seed, 0 = random (default 0)\n"
            "  --producer <mode>        none|synthetic|replay|external (default none)\n"
            "  --replay-file <path>     x,y,z CSV for the replay producer\n"
            "  --loop                   loop the replay file\n"
            "  --checkpoint-dir <path>  capture checkpoint directory\n"
            "  --images-dir <path>      capture images directory\n"
            "  --log-level <level>      debug|info|warn|error|fatal (default info)\n"
            "  --help                   show this text\n";
    return text;
}

net::Endpoint Config::endpoint() const
{
    return net::Endpoint{host_, port_, path_};
}

capture::ProducerConfig Config::producerConfig() const
{
    capture::ProducerConfig cfg;
    cfg.mode        = producer_;
    cfg.seed        = seed_;
    cfg.batchSize   = batchSize_;
    cfg.cadence     = cadence_;
    cfg.replayFile  = replayFile_;
    cfg.loop        = loop_;
    cfg.directories = directories_;
    return cfg;
}

} // namespace synapse::bridge
