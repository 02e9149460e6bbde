/**
 * @file ExternalProducer.cpp
 * @brief Implementation of the externally fed capture producer.
 */

#include "synapse/capture/ExternalProducer.hpp"

#include <synapse/core/Log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <utility>

namespace synapse::capture {

/// Touched only on the io_context thread.
struct CaptureInlet::Channel {
    ICaptureProducer::BatchHandler handler;
    bool running = false;
};

CaptureInlet::CaptureInlet(boost::asio::io_context &io, std::weak_ptr<Channel> channel)
    : _io(&io)
    , _channel(std::move(channel))
{
}

bool CaptureInlet::deliver(std::vector<stream::Sample> batch) const
{
    if (_channel.expired())
        return false;

    boost::asio::post(*_io, [weak = _channel, batch = std::move(batch)]() mutable {
        const auto channel = weak.lock();
        if (!channel || !channel->running || !channel->handler)
            return;
        const auto handler = channel->handler;
        handler(std::move(batch));
    });
    return true;
}

ExternalProducer::ExternalProducer(boost::asio::io_context &io, std::string name,
                                   CaptureDirectories directories)
    : _io(io)
    , _name(std::move(name))
    , _directories(std::move(directories))
    , _channel(std::make_shared<CaptureInlet::Channel>())
{
}

ExternalProducer::~ExternalProducer()
{
    stop();
}

core::Expected<void> ExternalProducer::start()
{
    if (_channel->running) {
        return core::makeError(core::ErrorCode::kAlreadyRunning,
            "ExternalProducer already running");
    }
    _channel->running = true;
    core::Log::info("CAPTURE", "external producer '" + _name + "' accepting batches");
    return {};
}

void ExternalProducer::stop() noexcept
{
    _channel->running = false;
}

void ExternalProducer::setBatchHandler(BatchHandler handler)
{
    _channel->handler = std::move(handler);
}

bool ExternalProducer::running() const noexcept
{
    return _channel->running;
}

ProducerInfo ExternalProducer::info() const
{
    return ProducerInfo{.name = _name, .directories = _directories};
}

CaptureInlet ExternalProducer::inlet() const
{
    return CaptureInlet{_io, _channel};
}

} // namespace synapse::capture
