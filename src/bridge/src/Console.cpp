// /////////////////////////////////////////////////////////////////////////////
/// @file Console.cpp
/// @brief Console implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/bridge/Console.hpp>
#include <synapse/bridge/Bridge.hpp>
#include <synapse/net/Endpoint.hpp>

#include <charconv>
#include <chrono>
#include <vector>

namespace synapse::bridge {

namespace {

std::vector<std::string_view> tokenize(std::string_view line)
{
    std::vector<std::string_view> tokens;
    while (!line.empty())
    {
        const auto begin = line.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            break;
        line.remove_prefix(begin);
        const auto end = line.find_first_of(" \t\r\n");
        tokens.push_back(line.substr(0, end));
        if (end == std::string_view::npos)
            break;
        line.remove_prefix(end);
    }
    return tokens;
}

} // namespace

Console::Console(Bridge& bridge)
    : bridge_{bridge}
{
}

std::string_view Console::help() noexcept
{
    return "commands:\n"
           "  connect [url]      open the WebSocket connection (ws://host:port/path)\n"
           "  disconnect         stop streaming and close the connection\n"
           "  start [ms]         start the simulated stream\n"
           "  stop               stop the simulated stream\n"
           "  state              show connection and stream state\n"
           "  stats              show transmission counters\n"
           "  help               show this text\n"
           "  quit               shut down and exit";
}

core::Expected<std::string> Console::execute(std::string_view line)
{
    const auto args = tokenize(line);
    if (args.empty())
        return std::string{};

    const auto command = args.front();

    if (command == "connect")
    {
        if (args.size() > 1)
        {
            const auto endpoint = SYNAPSE_TRY(net::parseEndpoint(args[1]));
            bridge_.connect(endpoint);
            return "connecting to " + endpoint.toString();
        }
        bridge_.connect();
        return "connecting to " + bridge_.config().endpoint().toString();
    }
    if (command == "disconnect")
    {
        bridge_.disconnect();
        return std::string{"disconnected"};
    }
    if (command == "start")
    {
        auto cadence = bridge_.config().cadence();
        if (args.size() > 1)
        {
            core::u32 ms{0};
            const auto text = args[1];
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
            if (ec != std::errc{} || end != text.data() + text.size() || ms == 0)
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "start: invalid cadence '" + std::string{text} + "'");
            cadence = std::chrono::milliseconds{ms};
        }
        SYNAPSE_TRY_VOID(bridge_.startSimulatedStream(cadence));
        return "streaming every " + std::to_string(cadence.count()) + " ms";
    }
    if (command == "stop")
    {
        bridge_.stopSimulatedStream();
        return std::string{"stream stopped"};
    }
    if (command == "state")
    {
        std::string reply{net::toString(bridge_.state())};
        reply += bridge_.isStreaming() ? ", streaming" : ", idle";
        if (bridge_.hasCaptureProducer())
            reply += ", capture attached";
        return reply;
    }
    if (command == "stats")
    {
        const auto s = bridge_.stats();
        return "sent=" + std::to_string(s.messagesSent)
             + " samples=" + std::to_string(s.samplesSent)
             + " rejected=" + std::to_string(s.sendRejections)
             + " dropped=" + std::to_string(s.captureDrops)
             + " reconnects=" + std::to_string(s.reconnects);
    }
    if (command == "help")
        return std::string{help()};
    if (command == "quit" || command == "exit")
    {
        quit_ = true;
        bridge_.shutdown();
        return std::string{"bye"};
    }

    return core::makeError(core::ErrorCode::kInvalidArgument,
                           "unknown command '" + std::string{command} + "' (try 'help')");
}

} // namespace synapse::bridge
