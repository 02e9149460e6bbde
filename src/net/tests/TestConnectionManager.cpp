/**
 * @file TestConnectionManager.cpp
 * @brief Unit tests for synapse::net::ConnectionManager.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/net/ConnectionManager.hpp>

#include "support/FakeTransport.hpp"

#include <vector>

using namespace synapse;
using namespace synapse::net;
using synapse::test::FakeNetwork;

namespace {

struct Recorder
{
    std::vector<ConnectionState> states;
    std::vector<core::ErrorCode> causes;

    ConnectionManager::StateListener listener()
    {
        return [this](ConnectionState state, const std::optional<core::Error>& cause) {
            states.push_back(state);
            if (cause)
                causes.push_back(cause->code());
        };
    }
};

} // namespace

TEST_CASE("ConnectionManager starts Disconnected", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};

    REQUIRE(cm.state() == ConnectionState::Disconnected);
    REQUIRE(cm.openConnections() == 0);
    REQUIRE(network->opened == 0);
}

TEST_CASE("ConnectionManager goes Connecting then Connected", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};
    Recorder rec;
    cm.setStateListener(rec.listener());

    cm.connect(Endpoint{});
    REQUIRE(cm.state() == ConnectionState::Connecting);
    REQUIRE(network->opened == 1);
    REQUIRE(network->lastEndpoint == Endpoint{});

    network->acceptOpen();
    REQUIRE(cm.state() == ConnectionState::Connected);
    REQUIRE(cm.connectCount() == 1);
    REQUIRE(rec.states == std::vector{ConnectionState::Connecting, ConnectionState::Connected});
    REQUIRE(rec.causes.empty());
}

TEST_CASE("ConnectionManager::connect is a no-op unless Disconnected", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};

    cm.connect(Endpoint{});
    cm.connect(Endpoint{});
    REQUIRE(network->opened == 1);

    network->acceptOpen();
    cm.connect(Endpoint{});
    REQUIRE(network->opened == 1);
    REQUIRE(cm.openConnections() == 1);
}

TEST_CASE("ConnectionManager::disconnect is synchronous", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};

    cm.connect(Endpoint{});
    network->acceptOpen();
    cm.disconnect();

    REQUIRE(cm.state() == ConnectionState::Disconnected);
    REQUIRE(cm.openConnections() == 0);
    REQUIRE(network->live == 0);

    auto written = cm.write("late");
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().code() == core::ErrorCode::kNotConnected);
    REQUIRE(network->writes.empty());
}

TEST_CASE("ConnectionManager::disconnect while Disconnected does nothing", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};
    Recorder rec;
    cm.setStateListener(rec.listener());

    cm.disconnect();
    REQUIRE(rec.states.empty());
}

TEST_CASE("ConnectionManager cancels a pending open on disconnect", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};

    cm.connect(Endpoint{});
    auto staleOpen = network->events.onOpen;
    cm.disconnect();
    REQUIRE(cm.state() == ConnectionState::Disconnected);

    // A completion that raced the disconnect is ignored.
    staleOpen();
    REQUIRE(cm.state() == ConnectionState::Disconnected);
    REQUIRE(cm.connectCount() == 0);
}

TEST_CASE("ConnectionManager reports a remote close as a cause", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};
    Recorder rec;
    cm.setStateListener(rec.listener());

    cm.connect(Endpoint{});
    network->acceptOpen();
    network->remoteClose();

    REQUIRE(cm.state() == ConnectionState::Disconnected);
    REQUIRE(cm.openConnections() == 0);
    REQUIRE(network->live == 0);
    REQUIRE(rec.causes == std::vector{core::ErrorCode::kConnectionClosed});
}

TEST_CASE("ConnectionManager recovers from a failed open", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};
    Recorder rec;
    cm.setStateListener(rec.listener());

    cm.connect(Endpoint{});
    network->remoteClose(core::ErrorCode::kConnectionFailed, "refused");
    REQUIRE(cm.state() == ConnectionState::Disconnected);
    REQUIRE(rec.causes == std::vector{core::ErrorCode::kConnectionFailed});

    cm.connect(Endpoint{});
    network->acceptOpen();
    REQUIRE(cm.state() == ConnectionState::Connected);
    REQUIRE(network->opened == 2);
}

TEST_CASE("ConnectionManager forwards inbound frames", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};
    std::vector<std::string> frames;
    cm.setMessageListener([&](std::string_view frame) { frames.emplace_back(frame); });

    cm.connect(Endpoint{});
    network->acceptOpen();
    network->inbound("ACK");
    network->inbound("ACK");

    REQUIRE(frames == std::vector<std::string>{"ACK", "ACK"});
    REQUIRE(cm.state() == ConnectionState::Connected);
}

TEST_CASE("ConnectionManager writes only while Connected", "[net][connection]")
{
    auto network = std::make_shared<FakeNetwork>();
    ConnectionManager cm{test::fakeFactory(network)};

    cm.connect(Endpoint{});
    REQUIRE_FALSE(cm.write("early").has_value());

    network->acceptOpen();
    REQUIRE(cm.write("a").has_value());
    REQUIRE(cm.write("b").has_value());
    REQUIRE(network->writes == std::vector<std::string>{"a", "b"});
}

TEST_CASE("ConnectionManager reports a factory without transport", "[net][connection]")
{
    ConnectionManager cm{[] { return std::unique_ptr<transport::ITransport>{}; }};
    Recorder rec;
    cm.setStateListener(rec.listener());

    cm.connect(Endpoint{});
    REQUIRE(cm.state() == ConnectionState::Disconnected);
    REQUIRE(rec.causes == std::vector{core::ErrorCode::kInternalError});
}
