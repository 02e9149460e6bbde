// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief synapse-bridge entry-point.
///
/// Runs the bridge on one io_context and reads operator commands from
/// stdin.  Exits on quit, end of input, SIGINT or SIGTERM.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/bridge/Bridge.hpp>
#include <synapse/bridge/Config.hpp>
#include <synapse/bridge/Console.hpp>
#include <synapse/bridge/Operator.hpp>
#include <synapse/capture/ProducerFactory.hpp>
#include <synapse/core/Log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/streambuf.hpp>

#include <csignal>
#include <cstdio>
#include <functional>
#include <istream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace {

namespace asio = boost::asio;

/// Prints operator notifications on stdout.
class TerminalOperator final : public synapse::bridge::IOperatorSink
{
public:
    void onStateChanged(synapse::net::ConnectionState state) override
    {
        std::printf("* connection %s\n", std::string{synapse::net::toString(state)}.c_str());
        std::fflush(stdout);
    }

    void onStreamingChanged(bool streaming) override
    {
        std::printf("* simulated stream %s\n", streaming ? "started" : "stopped");
        std::fflush(stdout);
    }

    void onAlert(const synapse::bridge::Alert& alert) override
    {
        std::printf("! %s: %s\n", alert.title.c_str(), alert.detail.c_str());
        std::fflush(stdout);
    }

    void onServerMessage(std::string_view frame) override
    {
        std::printf("< %.*s\n", static_cast<int>(frame.size()), frame.data());
        std::fflush(stdout);
    }
};

/// Reads stdin line by line on the io_context.
class CommandReader
{
public:
    CommandReader(asio::io_context& io, synapse::bridge::Console& console, synapse::bridge::Bridge& bridge)
        : input_{io, ::dup(STDIN_FILENO)}
        , console_{console}
        , bridge_{bridge}
    {
    }

    void start() { readLine(); }

    void cancel()
    {
        boost::system::error_code ignored;
        input_.cancel(ignored);
        input_.close(ignored);
    }

    std::function<void()> onExit;

private:
    void readLine()
    {
        asio::async_read_until(input_, buffer_, '\n',
            [this](const boost::system::error_code& ec, std::size_t)
            {
                if (ec)
                {
                    if (ec != asio::error::operation_aborted)
                        exit();
                    return;
                }

                std::istream stream{&buffer_};
                std::string line;
                std::getline(stream, line);

                auto reply = console_.execute(line);
                if (reply)
                {
                    if (!reply->empty())
                        std::printf("%s\n", reply->c_str());
                }
                else
                {
                    std::printf("error: %s\n", reply.error().describe().c_str());
                }
                std::fflush(stdout);

                if (console_.quitRequested())
                    return exit();
                readLine();
            });
    }

    void exit()
    {
        bridge_.shutdown();
        if (onExit)
            onExit();
    }

    asio::posix::stream_descriptor input_;
    asio::streambuf                buffer_;
    synapse::bridge::Console&      console_;
    synapse::bridge::Bridge&       bridge_;
};

} // namespace

int main(int argc, char* argv[])
{
    using namespace synapse;

    auto config = bridge::Config::fromArgs(argc, argv);
    if (!config)
    {
        std::fprintf(stderr, "%s\n%s", config.error().describe().c_str(),
                     bridge::Config::usage(argv[0]).c_str());
        return 2;
    }
    if (config->helpRequested())
    {
        std::printf("%s", bridge::Config::usage(argv[0]).c_str());
        return 0;
    }

    core::Log::setMinLevel(config->logLevel());
    core::Log::info("APP", "=== Synapse Bridge ===");

    asio::io_context io;
    TerminalOperator terminal;
    bridge::Bridge bridge{io, *config, terminal};
    bridge::Console console{bridge};

    if (config->producer() != capture::ProducerMode::kNone)
    {
        auto producer = capture::ProducerFactory::create(io, config->producerConfig());
        if (!producer)
        {
            core::Log::fatal("APP", producer.error().describe());
            return 1;
        }
        if (auto attached = bridge.attachCaptureProducer(std::move(*producer)); !attached)
        {
            core::Log::fatal("APP", "capture producer failed: " + attached.error().describe());
            return 1;
        }
        if (config->producer() == capture::ProducerMode::kExternal)
            core::Log::warn("APP", "external producer attached; batches arrive only from a native pipeline");
    }

    CommandReader reader{io, console, bridge};
    asio::signal_set signals{io, SIGINT, SIGTERM};

    reader.onExit = [&] {
        boost::system::error_code ignored;
        signals.cancel(ignored);
        reader.cancel();
    };

    signals.async_wait(
        [&](const boost::system::error_code& ec, int signal)
        {
            if (ec)
                return;
            core::Log::info("APP", "signal " + std::to_string(signal) + ", shutting down");
            bridge.shutdown();
            reader.cancel();
        });

    std::printf("%s\n", std::string{bridge::Console::help()}.c_str());
    std::fflush(stdout);
    reader.start();

    io.run();

    bridge.shutdown();
    core::Log::info("APP", "bridge exited cleanly");
    return 0;
}
