/**
 * @file ExternalProducer.hpp
 * @brief Capture producer fed by a native capture pipeline on its own thread.
 *
 * The native side keeps a CaptureInlet and calls deliver() whenever a
 * frame has been turned into points.  Batches are marshalled onto the
 * bridge's io_context, so the batch handler only ever runs there.
 *
 * @code
 *   auto producer = std::make_unique<ExternalProducer>(io, "depth-cam", dirs);
 *   auto inlet = producer->inlet();
 *   sdkThread = std::thread([inlet] { ... inlet.deliver(points); ... });
 * @endcode
 *
 * @copyright MIT License
 */

#pragma once

#include <synapse/capture/ICaptureProducer.hpp>

#include <memory>
#include <string>
#include <vector>

namespace boost::asio {
class io_context;
} // namespace boost::asio

namespace synapse::capture {

/**
 * @brief Thread-safe handle for pushing batches into an ExternalProducer.
 *
 * Copyable. Outlives the producer safely: once the producer is stopped or
 * destroyed, deliver() becomes a no-op.
 */
class CaptureInlet {
public:
    struct Channel;

    CaptureInlet(boost::asio::io_context &io, std::weak_ptr<Channel> channel);

    /**
     * @brief Queues @p batch for delivery on the io_context thread.
     *
     * @return false if the producer is gone
     */
    bool deliver(std::vector<stream::Sample> batch) const;

private:
    boost::asio::io_context *_io;
    std::weak_ptr<Channel> _channel;
};

class ExternalProducer final : public ICaptureProducer {
public:
    ExternalProducer(boost::asio::io_context &io, std::string name,
                     CaptureDirectories directories = {});
    ~ExternalProducer() override;

    [[nodiscard]] core::Expected<void> start() override;
    void stop() noexcept override;
    void setBatchHandler(BatchHandler handler) override;
    [[nodiscard]] bool running() const noexcept override;
    [[nodiscard]] ProducerInfo info() const override;

    [[nodiscard]] CaptureInlet inlet() const;

private:
    boost::asio::io_context &_io;
    std::string _name;
    CaptureDirectories _directories;
    std::shared_ptr<CaptureInlet::Channel> _channel;
};

} // namespace synapse::capture
