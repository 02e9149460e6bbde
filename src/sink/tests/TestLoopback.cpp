/**
 * @file TestLoopback.cpp
 * @brief Integration tests: Beast client transport against the sink server.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/bridge/Bridge.hpp>
#include <synapse/bridge/Transmitter.hpp>
#include <synapse/net/ConnectionManager.hpp>
#include <synapse/net/transport/WebSocketTransport.hpp>
#include <synapse/sink/SinkServer.hpp>

#include "support/FakeTransport.hpp"
#include "support/RecordingOperator.hpp"

using namespace synapse;
using namespace std::chrono_literals;

namespace {

sink::SinkConfig loopbackConfig()
{
    sink::SinkConfig cfg;
    cfg.address = "127.0.0.1";
    cfg.port    = 0;
    return cfg;
}

} // namespace

TEST_CASE("Bridge streams point clouds to the sink", "[sink][loopback]")
{
    boost::asio::io_context io;
    sink::SinkServer server{io, loopbackConfig()};
    REQUIRE(server.start().has_value());
    REQUIRE(server.port() != 0);

    std::vector<std::size_t> received;
    server.setFrameListener([&](const stream::Message& msg) { received.push_back(msg.size()); });

    test::RecordingOperator op;
    bridge::Bridge bridge{io,
                          bridge::Config::Builder{}.host("127.0.0.1").port(server.port()).batchSize(64).build(),
                          op};

    bridge.connect();
    REQUIRE(test::runUntil(io, [&] { return bridge.state() == net::ConnectionState::Connected; }));

    REQUIRE(bridge.startSimulatedStream(30ms).has_value());
    REQUIRE(test::runUntil(io, [&] { return op.serverMessages.size() >= 3; }));

    REQUIRE(received.size() >= 3);
    for (auto n : received)
        REQUIRE(n == 64);
    for (const auto& reply : op.serverMessages)
        REQUIRE(reply == "ACK");
    REQUIRE(server.stats().framesRejected == 0);
    REQUIRE(server.stats().connectionsAccepted == 1);

    bridge.shutdown();
    server.stop();
    REQUIRE(test::runUntil(io, [&] { return io.stopped(); }, 3000ms));
    REQUIRE(server.stats().activeSessions == 0);
}

TEST_CASE("Back-to-back sends arrive in send order", "[sink][loopback]")
{
    boost::asio::io_context io;
    sink::SinkServer server{io, loopbackConfig()};
    REQUIRE(server.start().has_value());

    std::vector<core::i64> timestamps;
    std::vector<double>    firstX;
    server.setFrameListener([&](const stream::Message& msg) {
        timestamps.push_back(msg.timestamp());
        firstX.push_back(msg.data().front().x);
    });

    net::ConnectionManager connection{[&io]() -> std::unique_ptr<net::transport::ITransport> {
        return std::make_unique<net::transport::WebSocketTransport>(io);
    }};
    connection.connect(net::Endpoint{"127.0.0.1", server.port(), "/"});
    REQUIRE(test::runUntil(io, [&] { return connection.isConnected(); }));

    // All sends happen in one handler, so every frame after the first
    // waits behind an in-flight write.
    constexpr int kMessages = 40;
    bridge::Transmitter transmitter;
    for (int i = 0; i < kMessages; ++i)
    {
        std::vector<stream::Sample> data(512, stream::Sample{0.5, 0.5, 0.5});
        data.front().x = static_cast<double>(i);
        const stream::Message msg{"pointcloud", 1'000 + i, std::move(data)};
        REQUIRE(transmitter.send(connection, msg).has_value());
    }
    REQUIRE(transmitter.stats().messagesSent == kMessages);

    REQUIRE(test::runUntil(io, [&] { return timestamps.size() == kMessages; }, 5000ms));
    for (int i = 0; i < kMessages; ++i)
    {
        REQUIRE(timestamps[static_cast<std::size_t>(i)] == 1'000 + i);
        REQUIRE(firstX[static_cast<std::size_t>(i)] == static_cast<double>(i));
    }
    REQUIRE(server.stats().framesRejected == 0);

    connection.disconnect();
    server.stop();
}

TEST_CASE("Sink answers non-envelope frames with an error", "[sink][loopback]")
{
    boost::asio::io_context io;
    sink::SinkServer server{io, loopbackConfig()};
    REQUIRE(server.start().has_value());

    net::transport::WebSocketTransport client{io};
    bool opened = false;
    std::vector<std::string> replies;

    net::transport::TransportEvents events;
    events.onOpen    = [&] { opened = true; };
    events.onClosed  = [](const core::Error&) {};
    events.onMessage = [&](std::string_view frame) { replies.emplace_back(frame); };
    client.open(net::Endpoint{"127.0.0.1", server.port(), "/"}, std::move(events));

    REQUIRE(test::runUntil(io, [&] { return opened; }));
    REQUIRE(client.write("hello").has_value());
    REQUIRE(client.write(R"({"type":"pointcloud","timestamp":1,"data":[]})").has_value());
    REQUIRE(test::runUntil(io, [&] { return replies.size() == 2; }));

    REQUIRE(replies[0].rfind("ERROR: ", 0) == 0);
    REQUIRE(replies[1] == "ACK");
    REQUIRE(server.stats().framesRejected == 1);
    REQUIRE(server.stats().framesReceived == 1);

    client.close();
    server.stop();
}

TEST_CASE("Peer close during queued writes is reported once", "[sink][loopback]")
{
    boost::asio::io_context io;
    sink::SinkServer server{io, loopbackConfig()};
    REQUIRE(server.start().has_value());

    net::transport::WebSocketTransport client{io};
    bool opened = false;
    int  closed = 0;

    net::transport::TransportEvents events;
    events.onOpen    = [&] { opened = true; };
    events.onClosed  = [&](const core::Error&) { ++closed; };
    events.onMessage = [](std::string_view) {};
    client.open(net::Endpoint{"127.0.0.1", server.port(), "/"}, std::move(events));
    REQUIRE(test::runUntil(io, [&] { return opened; }));

    for (int i = 0; i < 8; ++i)
        REQUIRE(client.write(std::string(512 * 1024, 'x')).has_value());
    server.stop();

    REQUIRE(test::runUntil(io, [&] { return closed > 0; }, 5000ms));
    REQUIRE_FALSE(client.isOpen());
    auto late = client.write("late");
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code() == core::ErrorCode::kNotConnected);

    test::runFor(io, 200ms);
    REQUIRE(closed == 1);
}

TEST_CASE("Sink shutdown surfaces as a connection error", "[sink][loopback]")
{
    boost::asio::io_context io;
    sink::SinkServer server{io, loopbackConfig()};
    REQUIRE(server.start().has_value());

    test::RecordingOperator op;
    bridge::Bridge bridge{io, bridge::Config::Builder{}.host("127.0.0.1").port(server.port()).build(), op};

    bridge.connect();
    REQUIRE(test::runUntil(io, [&] { return bridge.state() == net::ConnectionState::Connected; }));

    server.stop();
    REQUIRE(test::runUntil(io, [&] { return bridge.state() == net::ConnectionState::Disconnected; }, 3000ms));
    REQUIRE(op.alertCount(bridge::AlertKind::ConnectionError) == 1);
    REQUIRE(bridge.openConnections() == 0);
}

TEST_CASE("Connecting to a closed port fails without crashing", "[sink][loopback]")
{
    boost::asio::io_context io;

    // Grab a free port, then release it.
    core::u16 port = 0;
    {
        sink::SinkServer scratch{io, loopbackConfig()};
        REQUIRE(scratch.start().has_value());
        port = scratch.port();
        scratch.stop();
    }
    io.restart();
    io.poll();

    test::RecordingOperator op;
    bridge::Bridge bridge{io, bridge::Config::Builder{}.host("127.0.0.1").port(port).build(), op};
    bridge.connect();

    REQUIRE(test::runUntil(io, [&] { return !op.alerts.empty(); }, 3000ms));
    REQUIRE(bridge.state() == net::ConnectionState::Disconnected);
    REQUIRE(op.alerts.front().kind == bridge::AlertKind::ConnectionError);
}

TEST_CASE("SinkServer refuses a port already in use", "[sink][loopback]")
{
    boost::asio::io_context io;
    sink::SinkServer first{io, loopbackConfig()};
    REQUIRE(first.start().has_value());

    sink::SinkConfig cfg = loopbackConfig();
    cfg.port = first.port();
    sink::SinkServer second{io, cfg};

    // SO_REUSEADDR does not allow two listeners on one port.
    auto result = second.start();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kConnectionFailed);

    auto again = first.start();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyRunning);
}
