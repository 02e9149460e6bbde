// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief synapse-sink entry-point.
///
/// Reference receiver: accepts bridge connections, logs every envelope and
/// answers "ACK".  Exits on SIGINT or SIGTERM.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/sink/SinkConfig.hpp>
#include <synapse/sink/SinkServer.hpp>
#include <synapse/core/Log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdio>
#include <string>

int main(int argc, char* argv[])
{
    using namespace synapse;
    namespace asio = boost::asio;

    auto config = sink::SinkConfig::fromArgs(argc, argv);
    if (!config)
    {
        std::fprintf(stderr, "%s\n%s", config.error().describe().c_str(),
                     sink::SinkConfig::usage(argv[0]).c_str());
        return 2;
    }
    if (config->helpRequested)
    {
        std::printf("%s", sink::SinkConfig::usage(argv[0]).c_str());
        return 0;
    }

    core::Log::setMinLevel(config->logLevel);
    core::Log::info("APP", "=== Synapse Sink ===");

    asio::io_context io;
    sink::SinkServer server{io, *config};

    if (auto started = server.start(); !started)
    {
        core::Log::fatal("APP", started.error().describe());
        return 1;
    }

    asio::signal_set signals{io, SIGINT, SIGTERM};
    signals.async_wait(
        [&](const boost::system::error_code& ec, int)
        {
            if (ec)
                return;
            server.stop();
        });

    io.run();

    const auto stats = server.stats();
    core::Log::info("APP", "frames=" + std::to_string(stats.framesReceived)
                    + " samples=" + std::to_string(stats.samplesReceived)
                    + " rejected=" + std::to_string(stats.framesRejected));
    return 0;
}
