/**
 * @file ICaptureProducer.hpp
 * @brief Abstract interface for point-cloud capture producers.
 *
 * Every capture backend (synthetic simulator, recorded-capture replay,
 * native SDK feed) implements this interface.  Producers only deliver raw
 * sample batches; framing and transmission belong to the bridge.
 *
 * @see ProducerFactory, bridge::CaptureBridge
 *
 * @copyright MIT License
 */

#pragma once

#include <synapse/stream/Sample.hpp>
#include <synapse/core/Expected.hpp>

#include <functional>
#include <string>
#include <vector>

namespace synapse::capture {

/**
 * @brief On-device artifact locations managed by the producer.
 *
 * Opaque to the bridge: they are reported, never interpreted.
 */
struct CaptureDirectories {
    std::string checkpointDirectory;
    std::string imagesDirectory;
};

/**
 * @brief Metadata describing a producer.
 */
struct ProducerInfo {
    std::string name;
    CaptureDirectories directories;
};

/**
 * @brief Capability "notify me with a batch of samples when one is ready".
 *
 * Contract:
 * 1. setBatchHandler() registers the single consumer callback; passing an
 *    empty handler detaches it.
 * 2. start() begins production.  Batches are delivered on the bridge's
 *    event loop, one handler call per batch.
 * 3. stop() ends production; no handler call happens after it returns.
 */
class ICaptureProducer {
public:
    using BatchHandler = std::function<void(std::vector<stream::Sample>)>;

    virtual ~ICaptureProducer() = default;

    ICaptureProducer(const ICaptureProducer &) = delete;
    ICaptureProducer &operator=(const ICaptureProducer &) = delete;

    /**
     * @brief Begins producing batches.
     *
     * @return void on success, or an Error describing the failure
     */
    [[nodiscard]] virtual core::Expected<void> start() = 0;

    /**
     * @brief Stops production and releases timers/resources.
     */
    virtual void stop() noexcept = 0;

    /**
     * @brief Registers the batch consumer (replaces any previous one).
     */
    virtual void setBatchHandler(BatchHandler handler) = 0;

    [[nodiscard]] virtual bool running() const noexcept = 0;

    /**
     * @brief Returns metadata about this producer.
     */
    [[nodiscard]] virtual ProducerInfo info() const = 0;

protected:
    ICaptureProducer() = default;
};

} // namespace synapse::capture
