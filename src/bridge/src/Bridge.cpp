// /////////////////////////////////////////////////////////////////////////////
/// @file Bridge.cpp
/// @brief Bridge façade implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/bridge/Bridge.hpp>
#include <synapse/bridge/CaptureBridge.hpp>
#include <synapse/bridge/StreamScheduler.hpp>
#include <synapse/bridge/Transmitter.hpp>
#include <synapse/capture/SyntheticGenerator.hpp>
#include <synapse/net/ConnectionManager.hpp>
#include <synapse/net/transport/WebSocketTransport.hpp>
#include <synapse/core/Log.hpp>

#include <boost/asio/io_context.hpp>

#include <string>
#include <utility>

namespace synapse::bridge {

namespace {

net::transport::TransportFactory webSocketFactory(boost::asio::io_context& io)
{
    return [&io]() -> std::unique_ptr<net::transport::ITransport> {
        return std::make_unique<net::transport::WebSocketTransport>(io);
    };
}

} // namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct Bridge::Impl
{
    boost::asio::io_context&    io;
    Config                      config;
    IOperatorSink&              sink;
    net::ConnectionManager      connection;
    Transmitter                 transmitter;
    capture::SyntheticGenerator generator;
    StreamScheduler             scheduler;
    CaptureBridge               capture;

    Impl(boost::asio::io_context& ctx, Config cfg, IOperatorSink& s,
         net::transport::TransportFactory factory)
        : io{ctx}
        , config{std::move(cfg)}
        , sink{s}
        , connection{factory ? std::move(factory) : webSocketFactory(ctx)}
        , generator{config.seed()}
        , scheduler{ctx, transmitter, connection, generator, config.batchSize()}
        , capture{transmitter, connection}
    {
    }

    void stopStream()
    {
        if (!scheduler.isActive())
            return;
        scheduler.stop();
        sink.onStreamingChanged(false);
    }

    void onStateChanged(net::ConnectionState state, const std::optional<core::Error>& cause)
    {
        core::Log::info("BRIDGE", "connection " + std::string{net::toString(state)});

        if (state == net::ConnectionState::Disconnected)
            stopStream();

        sink.onStateChanged(state);
        if (cause)
        {
            sink.onAlert(Alert{AlertKind::ConnectionError, "Connection error", cause->describe()});
        }
    }
};

// ========================================================================== //
//  Bridge                                                                    //
// ========================================================================== //

Bridge::Bridge(boost::asio::io_context& io, Config config, IOperatorSink& sink,
               net::transport::TransportFactory factory)
    : impl_{std::make_unique<Impl>(io, std::move(config), sink, std::move(factory))}
{
    impl_->connection.setStateListener(
        [impl = impl_.get()](net::ConnectionState state, const std::optional<core::Error>& cause) {
            impl->onStateChanged(state, cause);
        });

    impl_->connection.setMessageListener([impl = impl_.get()](std::string_view frame) {
        impl->sink.onServerMessage(frame);
    });

    impl_->capture.setDropListener([impl = impl_.get()](core::usize samples) {
        impl->sink.onAlert(Alert{AlertKind::CaptureDropped, "Capture dropped",
                                 std::to_string(samples) + " samples dropped: not connected"});
    });

    impl_->capture.setTransmitErrorListener([impl = impl_.get()](const core::Error& error) {
        impl->sink.onAlert(Alert{AlertKind::TransmitFailed, "Transmission failed", error.describe()});
    });
}

Bridge::~Bridge()
{
    shutdown();
}

void Bridge::connect()
{
    connect(impl_->config.endpoint());
}

void Bridge::connect(const net::Endpoint& endpoint)
{
    core::Log::info("BRIDGE", "connecting to " + endpoint.toString());
    impl_->connection.connect(endpoint);
}

void Bridge::disconnect()
{
    stopSimulatedStream();
    impl_->connection.disconnect();
}

core::Expected<void> Bridge::startSimulatedStream()
{
    return startSimulatedStream(impl_->config.cadence());
}

core::Expected<void> Bridge::startSimulatedStream(std::chrono::milliseconds cadence)
{
    if (!impl_->connection.isConnected())
    {
        impl_->sink.onAlert(Alert{AlertKind::NotConnected, "Not connected",
                                  "Connect to the WebSocket server first"});
        return core::makeError(core::ErrorCode::kNotConnected,
                               "simulated stream requires an open connection");
    }

    if (impl_->scheduler.isActive())
        return {};

    SYNAPSE_TRY_VOID(impl_->scheduler.start(cadence));
    impl_->sink.onStreamingChanged(true);
    return {};
}

void Bridge::stopSimulatedStream()
{
    impl_->stopStream();
}

core::Expected<void> Bridge::attachCaptureProducer(std::unique_ptr<capture::ICaptureProducer> producer)
{
    return impl_->capture.attach(std::move(producer));
}

void Bridge::detachCaptureProducer()
{
    impl_->capture.detach();
}

net::ConnectionState Bridge::state() const noexcept
{
    return impl_->connection.state();
}

bool Bridge::isStreaming() const noexcept
{
    return impl_->scheduler.isActive();
}

bool Bridge::hasCaptureProducer() const noexcept
{
    return impl_->capture.isAttached();
}

BridgeStats Bridge::stats() const noexcept
{
    const auto& tx = impl_->transmitter.stats();
    const auto connects = impl_->connection.connectCount();

    BridgeStats out;
    out.messagesSent   = tx.messagesSent;
    out.samplesSent    = tx.samplesSent;
    out.sendRejections = tx.rejected;
    out.captureDrops   = impl_->capture.batchesDropped();
    out.reconnects     = connects > 0 ? connects - 1 : 0;
    return out;
}

core::u32 Bridge::openConnections() const noexcept
{
    return impl_->connection.openConnections();
}

void Bridge::shutdown()
{
    stopSimulatedStream();
    detachCaptureProducer();
    impl_->connection.disconnect();
}

const Config& Bridge::config() const noexcept
{
    return impl_->config;
}

} // namespace synapse::bridge
