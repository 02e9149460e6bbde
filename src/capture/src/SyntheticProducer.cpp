/**
 * @file SyntheticProducer.cpp
 * @brief Implementation of the synthetic capture producer.
 */

#include "synapse/capture/SyntheticProducer.hpp"

#include <synapse/core/Log.hpp>

#include <string>
#include <utility>

namespace synapse::capture {

SyntheticProducer::SyntheticProducer(boost::asio::io_context &io, SyntheticProducerConfig config)
    : _io(io)
    , _config(std::move(config))
    , _generator(_config.seed)
{
}

SyntheticProducer::~SyntheticProducer()
{
    stop();
}

core::Expected<void> SyntheticProducer::start()
{
    if (_task) {
        return core::makeError(core::ErrorCode::kAlreadyRunning,
            "SyntheticProducer already running");
    }
    if (_config.batchSize == 0 || _config.cadence.count() <= 0) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "SyntheticProducer needs a positive batch size and cadence");
    }

    _task = std::make_unique<concurrency::PeriodicTask>(
        _io, _config.cadence, [this] { produce(); });

    core::Log::info("CAPTURE", "synthetic producer started (batch="
        + std::to_string(_config.batchSize) + ", cadence="
        + std::to_string(_config.cadence.count()) + "ms)");
    return {};
}

void SyntheticProducer::stop() noexcept
{
    if (!_task)
        return;
    _task->cancel();
    _task.reset();
}

void SyntheticProducer::setBatchHandler(BatchHandler handler)
{
    _handler = std::move(handler);
}

bool SyntheticProducer::running() const noexcept
{
    return _task != nullptr;
}

ProducerInfo SyntheticProducer::info() const
{
    return ProducerInfo{
        .name = "Synthetic (seed " + std::to_string(_generator.seed()) + ")",
        .directories = _config.directories
    };
}

void SyntheticProducer::produce()
{
    auto batch = _generator.generate(_config.batchSize);
    ++_produced;
    if (!_handler)
        return;
    const BatchHandler handler = _handler;
    handler(std::move(batch));
}

} // namespace synapse::capture
