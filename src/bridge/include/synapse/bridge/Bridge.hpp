// /////////////////////////////////////////////////////////////////////////////
/// @file Bridge.hpp
/// @brief Top-level bridge façade (Façade pattern).
///
/// Single entry-point that wires the connection, the simulated stream and
/// the capture path together and routes operator commands to them.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <synapse/bridge/Config.hpp>
#include <synapse/bridge/Operator.hpp>
#include <synapse/capture/ICaptureProducer.hpp>
#include <synapse/net/ConnectionState.hpp>
#include <synapse/net/transport/ITransport.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/Types.hpp>

#include <chrono>
#include <memory>

namespace boost::asio {
class io_context;
} // namespace boost::asio

namespace synapse::bridge {

struct BridgeStats
{
    core::u64 messagesSent{0};
    core::u64 samplesSent{0};
    core::u64 sendRejections{0};
    core::u64 captureDrops{0};
    core::u64 reconnects{0};
};

/// @brief Top-level bridge façade.
///
/// Owns one ConnectionManager, one Transmitter, one StreamScheduler and one
/// CaptureBridge.  All methods must be called on the io_context thread.
/// Teardown order is scheduler, capture, connection; the destructor runs
/// it implicitly.
class Bridge
{
public:
    /// @param factory Transport factory; empty selects the WebSocket client.
    Bridge(boost::asio::io_context& io, Config config, IOperatorSink& sink,
           net::transport::TransportFactory factory = {});
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /// @brief Starts connecting to the configured endpoint.
    void connect();

    /// @brief Starts connecting to @p endpoint instead of the configured one.
    void connect(const net::Endpoint& endpoint);

    /// @brief Stops the simulated stream and closes the connection.
    void disconnect();

    /// @brief Starts the simulated stream at the configured cadence.
    /// @return kNotConnected (and a NotConnected alert) unless Connected.
    core::Expected<void> startSimulatedStream();
    core::Expected<void> startSimulatedStream(std::chrono::milliseconds cadence);

    void stopSimulatedStream();

    /// @brief Attaches and starts a capture producer.
    [[nodiscard]] core::Expected<void> attachCaptureProducer(std::unique_ptr<capture::ICaptureProducer> producer);
    void detachCaptureProducer();

    [[nodiscard]] net::ConnectionState state() const noexcept;
    [[nodiscard]] bool isStreaming() const noexcept;
    [[nodiscard]] bool hasCaptureProducer() const noexcept;
    [[nodiscard]] BridgeStats stats() const noexcept;
    [[nodiscard]] core::u32 openConnections() const noexcept;

    /// @brief Scheduler, capture, connection.  Idempotent.
    void shutdown();

    [[nodiscard]] const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace synapse::bridge
