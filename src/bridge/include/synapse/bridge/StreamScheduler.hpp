// /////////////////////////////////////////////////////////////////////////////
/// @file StreamScheduler.hpp
/// @brief Drives the simulated point-cloud stream at a fixed cadence.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/concurrency/PeriodicTask.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/NonCopyable.hpp>
#include <synapse/core/Types.hpp>

#include <chrono>
#include <memory>

namespace synapse::net {
class ConnectionManager;
} // namespace synapse::net

namespace synapse::capture {
class SyntheticGenerator;
} // namespace synapse::capture

namespace synapse::bridge {

class Transmitter;

// /////////////////////////////////////////////////////////////////////////////
/// @class StreamSession
/// @brief One run of the simulated stream.
///
/// Holds the periodic task handle iff active.
// /////////////////////////////////////////////////////////////////////////////
class StreamSession final : public core::NonCopyable<StreamSession>
{
public:
    StreamSession() = default;

    void activate(std::unique_ptr<concurrency::PeriodicTask> task);

    /// @brief Cancels the task and marks the session inactive.
    void deactivate() noexcept;

    [[nodiscard]] bool active() const noexcept { return active_; }
    [[nodiscard]] const concurrency::PeriodicTask* task() const noexcept { return task_.get(); }

private:
    std::unique_ptr<concurrency::PeriodicTask> task_;
    bool                                       active_{false};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class StreamScheduler
/// @brief Every cadence, synthesizes a batch and hands it to the Transmitter.
///
/// Send rejections (not connected) are logged at debug level and the stream
/// keeps running.  A tick that was already queued when stop() ran sees the
/// session gone and sends nothing.
// /////////////////////////////////////////////////////////////////////////////
class StreamScheduler final : public core::NonCopyable<StreamScheduler>
{
public:
    StreamScheduler(boost::asio::io_context& io,
                    Transmitter& transmitter,
                    net::ConnectionManager& connection,
                    capture::SyntheticGenerator& generator,
                    core::usize batchSize);
    ~StreamScheduler();

    /// @brief Starts the stream; no-op when already active.
    /// @return kInvalidArgument for a non-positive cadence.
    [[nodiscard]] core::Expected<void> start(std::chrono::milliseconds cadence);

    /// @brief Stops the stream; no-op when inactive.
    void stop() noexcept;

    [[nodiscard]] bool isActive() const noexcept;

    /// @brief Ticks that reached the Transmitter, since construction.
    [[nodiscard]] core::u64 ticks() const noexcept { return ticks_; }

    [[nodiscard]] core::usize batchSize() const noexcept { return batchSize_; }

private:
    void tick(const std::weak_ptr<StreamSession>& session);

    boost::asio::io_context&       io_;
    Transmitter&                   transmitter_;
    net::ConnectionManager&        connection_;
    capture::SyntheticGenerator&   generator_;
    core::usize                    batchSize_;
    std::shared_ptr<StreamSession> session_;
    core::u64                      ticks_{0};
};

} // namespace synapse::bridge
