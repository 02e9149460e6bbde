/**
 * @file TestConsole.cpp
 * @brief Unit tests for synapse::bridge::Console.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/bridge/Bridge.hpp>
#include <synapse/bridge/Console.hpp>

#include "support/FakeTransport.hpp"
#include "support/RecordingOperator.hpp"

using namespace synapse;
using namespace synapse::bridge;
using synapse::test::FakeNetwork;

namespace {

struct Fixture
{
    boost::asio::io_context      io;
    std::shared_ptr<FakeNetwork> network{std::make_shared<FakeNetwork>()};
    test::RecordingOperator      op;
    Bridge                       bridge{io, Config::Builder{}.build(), op, test::fakeFactory(network)};
    Console                      console{bridge};
};

} // namespace

TEST_CASE("Console drives the connection", "[bridge][console]")
{
    Fixture f;

    auto reply = f.console.execute("connect");
    REQUIRE(reply.has_value());
    REQUIRE(*reply == "connecting to ws://localhost:8081/");
    f.network->acceptOpen();
    REQUIRE(f.console.execute("state").value() == "connected, idle");

    REQUIRE(f.console.execute("  disconnect  ").has_value());
    REQUIRE(f.bridge.state() == net::ConnectionState::Disconnected);
}

TEST_CASE("Console starts and stops the simulated stream", "[bridge][console]")
{
    Fixture f;
    REQUIRE(f.console.execute("connect").has_value());
    f.network->acceptOpen();

    REQUIRE(f.console.execute("start 250").value() == "streaming every 250 ms");
    REQUIRE(f.bridge.isStreaming());
    REQUIRE(f.console.execute("state").value() == "connected, streaming");

    REQUIRE(f.console.execute("stop").has_value());
    REQUIRE_FALSE(f.bridge.isStreaming());
}

TEST_CASE("Console reports operation errors", "[bridge][console]")
{
    Fixture f;

    auto start = f.console.execute("start");
    REQUIRE_FALSE(start.has_value());
    REQUIRE(start.error().code() == core::ErrorCode::kNotConnected);

    auto bad = f.console.execute("start fast");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == core::ErrorCode::kInvalidArgument);

    auto unknown = f.console.execute("launch");
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Console prints counters and help", "[bridge][console]")
{
    Fixture f;
    REQUIRE(f.console.execute("stats").value() == "sent=0 samples=0 rejected=0 dropped=0 reconnects=0");
    REQUIRE(f.console.execute("help").value().find("start [ms]") != std::string::npos);
    REQUIRE(f.console.execute("").value().empty());
}

TEST_CASE("Console quit shuts the bridge down", "[bridge][console]")
{
    Fixture f;
    REQUIRE(f.console.execute("connect").has_value());
    f.network->acceptOpen();
    REQUIRE(f.console.execute("start").has_value());

    REQUIRE(f.console.execute("quit").has_value());
    REQUIRE(f.console.quitRequested());
    REQUIRE(f.bridge.state() == net::ConnectionState::Disconnected);
    REQUIRE_FALSE(f.bridge.isStreaming());
    REQUIRE(test::idle(f.io));
}

TEST_CASE("Console connects to an endpoint given on the command line", "[bridge][console]")
{
    Fixture f;

    auto reply = f.console.execute("connect ws://scanner.local:9100/points");
    REQUIRE(reply.has_value());
    REQUIRE(*reply == "connecting to ws://scanner.local:9100/points");
    REQUIRE(f.network->lastEndpoint.has_value());
    REQUIRE(f.network->lastEndpoint->host == "scanner.local");
    REQUIRE(f.network->lastEndpoint->port == 9100);
    REQUIRE(f.network->lastEndpoint->target == "/points");

    f.network->acceptOpen();
    REQUIRE(f.bridge.state() == net::ConnectionState::Connected);
}

TEST_CASE("Console rejects a connect URL that is not ws://", "[bridge][console]")
{
    Fixture f;

    auto reply = f.console.execute("connect http://scanner.local:9100");
    REQUIRE_FALSE(reply.has_value());
    REQUIRE(reply.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(f.bridge.state() == net::ConnectionState::Disconnected);
    REQUIRE(f.network->opened == 0);
}
