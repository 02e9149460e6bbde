/**
 * @file TestPeriodicTask.cpp
 * @brief Unit tests for synapse::concurrency::PeriodicTask.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/concurrency/PeriodicTask.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <chrono>
#include <memory>
#include <thread>

using namespace synapse::concurrency;
using namespace std::chrono_literals;

TEST_CASE("PeriodicTask ticks at its period", "[concurrency][timer]")
{
    boost::asio::io_context io;
    int ticks = 0;
    PeriodicTask task{io, 50ms, [&] { ++ticks; }};

    io.run_for(275ms);

    REQUIRE(ticks >= 4);
    REQUIRE(ticks <= 5);
    REQUIRE(task.ticks() == static_cast<std::uint64_t>(ticks));
    REQUIRE(task.pending());
}

TEST_CASE("PeriodicTask does not tick before one period", "[concurrency][timer]")
{
    boost::asio::io_context io;
    int ticks = 0;
    PeriodicTask task{io, 200ms, [&] { ++ticks; }};

    io.run_for(100ms);
    REQUIRE(ticks == 0);
}

TEST_CASE("PeriodicTask::cancel leaves no pending work", "[concurrency][timer]")
{
    boost::asio::io_context io;
    int ticks = 0;
    PeriodicTask task{io, 20ms, [&] { ++ticks; }};

    io.run_for(50ms);
    const int seen = ticks;
    task.cancel();
    REQUIRE_FALSE(task.pending());

    io.restart();
    io.run();
    REQUIRE(io.stopped());
    REQUIRE(ticks == seen);
}

TEST_CASE("PeriodicTask can cancel itself from its tick", "[concurrency][timer]")
{
    boost::asio::io_context io;
    int ticks = 0;
    std::unique_ptr<PeriodicTask> task;
    task = std::make_unique<PeriodicTask>(io, 10ms, [&] {
        if (++ticks == 3)
            task.reset();
    });

    io.run();
    REQUIRE(ticks == 3);
    REQUIRE(task == nullptr);
}

TEST_CASE("PeriodicTask ignores a completion queued before cancel", "[concurrency][timer]")
{
    boost::asio::io_context io;
    int ticks = 0;
    PeriodicTask task{io, 10ms, [&] { ++ticks; }};

    // Let the deadline pass without running handlers, then cancel from a
    // handler that runs ahead of the already-expired wait.
    std::this_thread::sleep_for(30ms);
    boost::asio::post(io, [&] { task.cancel(); });
    io.run();

    REQUIRE(ticks <= 1);
    REQUIRE_FALSE(task.pending());
}
