/**
 * @file TestCaptureBridge.cpp
 * @brief Unit tests for synapse::bridge::CaptureBridge.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/bridge/CaptureBridge.hpp>
#include <synapse/bridge/Transmitter.hpp>
#include <synapse/capture/ExternalProducer.hpp>
#include <synapse/protocol/Envelope.hpp>

#include "support/FakeTransport.hpp"

#include <limits>

using namespace synapse;
using namespace synapse::bridge;
using synapse::test::FakeNetwork;

namespace {

struct Fixture
{
    boost::asio::io_context      io;
    std::shared_ptr<FakeNetwork> network{std::make_shared<FakeNetwork>()};
    net::ConnectionManager       cm{test::fakeFactory(network)};
    Transmitter                  tx;
    CaptureBridge                bridge{tx, cm};
    std::vector<core::usize>     drops;
    std::vector<core::ErrorCode> errors;

    Fixture()
    {
        bridge.setDropListener([this](core::usize n) { drops.push_back(n); });
        bridge.setTransmitErrorListener([this](const core::Error& e) { errors.push_back(e.code()); });
    }

    capture::CaptureInlet attachExternal()
    {
        auto producer = std::make_unique<capture::ExternalProducer>(io, "test-cam");
        auto inlet = producer->inlet();
        REQUIRE(bridge.attach(std::move(producer)).has_value());
        return inlet;
    }
};

std::vector<stream::Sample> batchOf(std::size_t n)
{
    return std::vector<stream::Sample>(n, stream::Sample{1.0, 2.0, 3.0});
}

} // namespace

TEST_CASE("CaptureBridge forwards each batch as one message", "[bridge][capture]")
{
    Fixture f;
    f.cm.connect(net::Endpoint{});
    f.network->acceptOpen();
    auto inlet = f.attachExternal();

    REQUIRE(inlet.deliver(batchOf(100)));
    REQUIRE(inlet.deliver(batchOf(7)));
    f.io.run();

    REQUIRE(f.network->writes.size() == 2);
    REQUIRE(protocol::parse(f.network->writes[0])->size() == 100);
    REQUIRE(protocol::parse(f.network->writes[1])->size() == 7);
    REQUIRE(f.bridge.batchesForwarded() == 2);
    REQUIRE(f.drops.empty());
}

TEST_CASE("CaptureBridge signals drops while disconnected", "[bridge][capture]")
{
    Fixture f;
    auto inlet = f.attachExternal();

    REQUIRE(inlet.deliver(batchOf(64)));
    f.io.run();

    REQUIRE(f.network->writes.empty());
    REQUIRE(f.network->opened == 0);
    REQUIRE(f.drops == std::vector<core::usize>{64});
    REQUIRE(f.errors.empty());
    REQUIRE(f.bridge.batchesDropped() == 1);
}

TEST_CASE("CaptureBridge reports transmit errors separately", "[bridge][capture]")
{
    Fixture f;
    f.cm.connect(net::Endpoint{});
    f.network->acceptOpen();
    auto inlet = f.attachExternal();

    stream::Sample bad{0.0, 0.0, 0.0};
    bad.z = std::numeric_limits<double>::infinity();
    REQUIRE(inlet.deliver({bad}));
    f.io.run();

    REQUIRE(f.drops.empty());
    REQUIRE(f.errors == std::vector{core::ErrorCode::kSerializationFailed});
}

TEST_CASE("CaptureBridge accepts a single producer", "[bridge][capture]")
{
    Fixture f;
    f.attachExternal();

    auto second = f.bridge.attach(std::make_unique<capture::ExternalProducer>(f.io, "other"));
    REQUIRE_FALSE(second.has_value());
    REQUIRE(second.error().code() == core::ErrorCode::kAlreadyRunning);

    auto none = f.bridge.attach(nullptr);
    REQUIRE_FALSE(none.has_value());
}

TEST_CASE("CaptureBridge::detach stops the producer", "[bridge][capture]")
{
    Fixture f;
    f.cm.connect(net::Endpoint{});
    f.network->acceptOpen();
    auto inlet = f.attachExternal();

    REQUIRE(inlet.deliver(batchOf(3)));
    f.bridge.detach();
    REQUIRE_FALSE(f.bridge.isAttached());
    REQUIRE_FALSE(inlet.deliver(batchOf(3)));
    f.io.run();

    REQUIRE(f.network->writes.empty());
}
