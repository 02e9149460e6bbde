// /////////////////////////////////////////////////////////////////////////////
/// @file PeriodicTask.cpp
/// @brief steady_timer based PeriodicTask implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/concurrency/PeriodicTask.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <utility>

namespace synapse::concurrency {

struct PeriodicTask::State
{
    boost::asio::steady_timer timer;
    std::chrono::milliseconds period;
    Tick                      tick;
    bool                      live{true};
    core::u64                 ticks{0};

    State(boost::asio::io_context& io, std::chrono::milliseconds p, Tick t)
        : timer{io}
        , period{p}
        , tick{std::move(t)}
    {
    }
};

void PeriodicTask::arm(const std::shared_ptr<State>& state)
{
    state->timer.expires_at(state->timer.expiry() + state->period);
    state->timer.async_wait(
        [weak = std::weak_ptr<State>{state}](const boost::system::error_code& ec)
        {
            if (!ec)
                fire(weak);
        });
}

void PeriodicTask::fire(const std::weak_ptr<State>& weak)
{
    const auto state = weak.lock();
    if (!state || !state->live)
        return;

    ++state->ticks;
    // Keep the callable alive across the call even if the tick cancels us.
    const Tick tick = state->tick;
    tick();

    if (state->live)
        arm(state);
}

PeriodicTask::PeriodicTask(boost::asio::io_context& io, std::chrono::milliseconds period, Tick tick)
    : state_{std::make_shared<State>(io, period, std::move(tick))}
{
    state_->timer.expires_at(boost::asio::steady_timer::clock_type::now());
    arm(state_);
}

PeriodicTask::~PeriodicTask()
{
    cancel();
}

void PeriodicTask::cancel() noexcept
{
    if (!state_ || !state_->live)
        return;

    state_->live = false;
    state_->timer.cancel();
}

bool PeriodicTask::pending() const noexcept
{
    return state_ && state_->live;
}

std::chrono::milliseconds PeriodicTask::period() const noexcept
{
    return state_->period;
}

core::u64 PeriodicTask::ticks() const noexcept
{
    return state_->ticks;
}

} // namespace synapse::concurrency
