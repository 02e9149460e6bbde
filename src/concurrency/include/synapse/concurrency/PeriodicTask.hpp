// /////////////////////////////////////////////////////////////////////////////
/// @file PeriodicTask.hpp
/// @brief Cancellable recurring task on a single-threaded io_context.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/core/Types.hpp>
#include <synapse/core/NonCopyable.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace boost::asio {
class io_context;
} // namespace boost::asio

namespace synapse::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class PeriodicTask
/// @brief Invokes a callable every @c period on the io_context thread.
///
/// The first invocation happens one period after construction.  Each
/// deadline is derived from the previous one, so a slow tick does not
/// accumulate drift.
///
/// @ref cancel is effective before it returns: a completion that was
/// already queued when cancel() ran finds the task dead and does nothing.
/// The destructor cancels implicitly.
// /////////////////////////////////////////////////////////////////////////////
class PeriodicTask final : public core::NonCopyable<PeriodicTask>
{
public:
    using Tick = std::function<void()>;

    PeriodicTask(boost::asio::io_context& io, std::chrono::milliseconds period, Tick tick);
    ~PeriodicTask();

    /// @brief Stops the task; further ticks are never invoked.
    void cancel() noexcept;

    /// @brief True until cancel() (or destruction).
    [[nodiscard]] bool pending() const noexcept;

    [[nodiscard]] std::chrono::milliseconds period() const noexcept;

    /// @brief Number of ticks invoked so far.
    [[nodiscard]] core::u64 ticks() const noexcept;

private:
    struct State;

    static void arm(const std::shared_ptr<State>& state);
    static void fire(const std::weak_ptr<State>& weak);

    std::shared_ptr<State> state_;
};

} // namespace synapse::concurrency
