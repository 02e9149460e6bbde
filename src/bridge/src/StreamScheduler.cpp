// /////////////////////////////////////////////////////////////////////////////
/// @file StreamScheduler.cpp
/// @brief StreamScheduler and StreamSession implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/bridge/StreamScheduler.hpp>
#include <synapse/bridge/Transmitter.hpp>
#include <synapse/capture/SyntheticGenerator.hpp>
#include <synapse/net/ConnectionManager.hpp>
#include <synapse/stream/Message.hpp>
#include <synapse/core/Assert.hpp>
#include <synapse/core/Log.hpp>

#include <string>
#include <utility>

namespace synapse::bridge {

// ========================================================================== //
//  StreamSession                                                             //
// ========================================================================== //

void StreamSession::activate(std::unique_ptr<concurrency::PeriodicTask> task)
{
    task_   = std::move(task);
    active_ = task_ != nullptr;
    SYNAPSE_ASSERT((task_ != nullptr) == active_);
}

void StreamSession::deactivate() noexcept
{
    active_ = false;
    if (task_)
        task_->cancel();
    task_.reset();
    SYNAPSE_ASSERT(task_ == nullptr);
}

// ========================================================================== //
//  StreamScheduler                                                           //
// ========================================================================== //

StreamScheduler::StreamScheduler(boost::asio::io_context& io,
                                 Transmitter& transmitter,
                                 net::ConnectionManager& connection,
                                 capture::SyntheticGenerator& generator,
                                 core::usize batchSize)
    : io_{io}
    , transmitter_{transmitter}
    , connection_{connection}
    , generator_{generator}
    , batchSize_{batchSize}
{
}

StreamScheduler::~StreamScheduler()
{
    stop();
}

core::Expected<void> StreamScheduler::start(std::chrono::milliseconds cadence)
{
    if (isActive())
        return {};

    if (cadence.count() <= 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "cadence must be positive");

    auto session = std::make_shared<StreamSession>();
    std::weak_ptr<StreamSession> weak{session};
    session->activate(std::make_unique<concurrency::PeriodicTask>(
        io_, cadence, [this, weak] { tick(weak); }));
    session_ = std::move(session);

    core::Log::info("SCHED", "simulated stream started ("
                    + std::to_string(batchSize_) + " samples every "
                    + std::to_string(cadence.count()) + " ms)");
    return {};
}

void StreamScheduler::stop() noexcept
{
    if (!session_)
        return;

    session_->deactivate();
    session_.reset();
    core::Log::info("SCHED", "simulated stream stopped");
}

bool StreamScheduler::isActive() const noexcept
{
    return session_ && session_->active();
}

void StreamScheduler::tick(const std::weak_ptr<StreamSession>& session)
{
    auto message = stream::Message::pointCloud(generator_.generate(batchSize_));

    const auto live = session.lock();
    if (!live || !live->active())
        return;

    ++ticks_;
    if (auto sent = transmitter_.send(connection_, message); !sent)
        core::Log::debug("SCHED", "tick not sent: " + sent.error().describe());
}

} // namespace synapse::bridge
