/**
 * @file TestTransmitter.cpp
 * @brief Unit tests for synapse::bridge::Transmitter.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/bridge/Transmitter.hpp>
#include <synapse/protocol/Envelope.hpp>

#include "support/FakeTransport.hpp"

#include <limits>

using namespace synapse;
using namespace synapse::bridge;
using synapse::test::FakeNetwork;

namespace {

stream::Message sampleMessage()
{
    return stream::Message{"pointcloud", 1700000000000, {{0.1, 0.2, 0.3}, {0.4, 0.5, 0.6}}};
}

} // namespace

TEST_CASE("Transmitter refuses to send unless Connected", "[bridge][transmitter]")
{
    auto network = std::make_shared<FakeNetwork>();
    net::ConnectionManager cm{test::fakeFactory(network)};
    Transmitter tx;

    SECTION("Disconnected")
    {
        auto sent = tx.send(cm, sampleMessage());
        REQUIRE_FALSE(sent.has_value());
        REQUIRE(sent.error().code() == core::ErrorCode::kNotConnected);
    }

    SECTION("Connecting")
    {
        cm.connect(net::Endpoint{});
        REQUIRE(cm.state() == net::ConnectionState::Connecting);
        network->isOpen = true; // even a transport that would accept the write

        auto sent = tx.send(cm, sampleMessage());
        REQUIRE_FALSE(sent.has_value());
        REQUIRE(sent.error().code() == core::ErrorCode::kNotConnected);
    }

    REQUIRE(network->writes.empty());
    REQUIRE(tx.stats().rejected == 1);
    REQUIRE(tx.stats().messagesSent == 0);
}

TEST_CASE("Transmitter writes one envelope per message", "[bridge][transmitter]")
{
    auto network = std::make_shared<FakeNetwork>();
    net::ConnectionManager cm{test::fakeFactory(network)};
    Transmitter tx;

    cm.connect(net::Endpoint{});
    network->acceptOpen();

    const auto msg = sampleMessage();
    REQUIRE(tx.send(cm, msg).has_value());
    REQUIRE(network->writes.size() == 1);

    auto decoded = protocol::parse(network->writes.front());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->timestamp() == msg.timestamp());
    REQUIRE(decoded->size() == 2);
    REQUIRE(decoded->data()[1] == msg.data()[1]);

    REQUIRE(tx.stats().messagesSent == 1);
    REQUIRE(tx.stats().samplesSent == 2);
}

TEST_CASE("Transmitter drops messages it cannot serialize", "[bridge][transmitter]")
{
    auto network = std::make_shared<FakeNetwork>();
    net::ConnectionManager cm{test::fakeFactory(network)};
    Transmitter tx;

    cm.connect(net::Endpoint{});
    network->acceptOpen();

    stream::Message bad{"pointcloud", 0, {{std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0}}};
    auto sent = tx.send(cm, bad);
    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().code() == core::ErrorCode::kSerializationFailed);
    REQUIRE(network->writes.empty());
    REQUIRE(tx.stats().serializationFailures == 1);

    // The connection is unaffected.
    REQUIRE(cm.isConnected());
    REQUIRE(tx.send(cm, sampleMessage()).has_value());
}
