/**
 * @file SyntheticProducer.hpp
 * @brief Capture producer emitting uniform random batches on a fixed cadence.
 *
 * Stands in for the depth camera when running without hardware.
 *
 * @copyright MIT License
 */

#pragma once

#include <synapse/capture/ICaptureProducer.hpp>
#include <synapse/capture/SyntheticGenerator.hpp>
#include <synapse/concurrency/PeriodicTask.hpp>

#include <chrono>
#include <memory>

namespace synapse::capture {

struct SyntheticProducerConfig {
    core::u64 seed = 0;
    core::usize batchSize = 256;
    std::chrono::milliseconds cadence{500};
    CaptureDirectories directories;
};

class SyntheticProducer final : public ICaptureProducer {
public:
    SyntheticProducer(boost::asio::io_context &io, SyntheticProducerConfig config);
    ~SyntheticProducer() override;

    [[nodiscard]] core::Expected<void> start() override;
    void stop() noexcept override;
    void setBatchHandler(BatchHandler handler) override;
    [[nodiscard]] bool running() const noexcept override;
    [[nodiscard]] ProducerInfo info() const override;

    /// @brief Batches delivered since construction.
    [[nodiscard]] core::u64 batchesProduced() const noexcept { return _produced; }

private:
    void produce();

    boost::asio::io_context &_io;
    SyntheticProducerConfig _config;
    SyntheticGenerator _generator;
    BatchHandler _handler;
    std::unique_ptr<concurrency::PeriodicTask> _task;
    core::u64 _produced = 0;
};

} // namespace synapse::capture
