// /////////////////////////////////////////////////////////////////////////////
/// @file CaptureBridge.cpp
/// @brief CaptureBridge implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/bridge/CaptureBridge.hpp>
#include <synapse/bridge/Transmitter.hpp>
#include <synapse/net/ConnectionManager.hpp>
#include <synapse/stream/Message.hpp>
#include <synapse/core/Log.hpp>

#include <string>
#include <utility>

namespace synapse::bridge {

CaptureBridge::CaptureBridge(Transmitter& transmitter, net::ConnectionManager& connection)
    : transmitter_{transmitter}
    , connection_{connection}
{
}

CaptureBridge::~CaptureBridge()
{
    detach();
}

core::Expected<void> CaptureBridge::attach(std::unique_ptr<capture::ICaptureProducer> producer)
{
    if (!producer)
        return core::makeError(core::ErrorCode::kInvalidArgument, "null capture producer");
    if (producer_)
        return core::makeError(core::ErrorCode::kAlreadyRunning,
                               "a capture producer is already attached");

    producer->setBatchHandler([this](std::vector<stream::Sample> batch) { onBatch(std::move(batch)); });
    if (auto started = producer->start(); !started)
    {
        producer->setBatchHandler({});
        return started;
    }

    producer_ = std::move(producer);
    core::Log::info("CAPTURE", "attached producer: " + producer_->info().name);
    return {};
}

void CaptureBridge::detach() noexcept
{
    if (!producer_)
        return;

    producer_->stop();
    producer_->setBatchHandler({});
    producer_.reset();
    core::Log::info("CAPTURE", "producer detached");
}

void CaptureBridge::setDropListener(DropListener listener)
{
    dropListener_ = std::move(listener);
}

void CaptureBridge::setTransmitErrorListener(TransmitErrorListener listener)
{
    errorListener_ = std::move(listener);
}

void CaptureBridge::onBatch(std::vector<stream::Sample> batch)
{
    const auto count = batch.size();
    auto sent = transmitter_.send(connection_, stream::Message::pointCloud(std::move(batch)));
    if (sent)
    {
        ++forwarded_;
        return;
    }

    if (sent.error().code() == core::ErrorCode::kNotConnected)
    {
        ++dropped_;
        core::Log::warn("CAPTURE", "dropped batch of " + std::to_string(count)
                        + " samples: not connected");
        if (dropListener_)
            dropListener_(count);
        return;
    }

    if (errorListener_)
        errorListener_(sent.error());
}

} // namespace synapse::bridge
