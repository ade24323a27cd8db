/// @file PeriodicScheduling.cpp
/// @brief Tests for fixed-rate and fixed-delay units of Warden::Execution::SelfReleasingScheduler.

#include "SchedulerTestSupport.hpp"

#include <Warden/Execution/SelfReleasingScheduler.hpp>

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace Warden::Execution
{
    using Testing::CountingThreadFactory;
    using Testing::StallingExecutor;
    using Testing::WaitUntil;

    TEST_CASE("Fixed-rate unit keeps its cadence until cancelled", "[Execution][Periodic]")
    {
        auto                   threads = std::make_shared<CountingThreadFactory>();
        SelfReleasingScheduler scheduler(2, threads);
        std::atomic<int>       runs {0};

        auto handle = scheduler.ScheduleAtFixedRate([&] { runs.fetch_add(1); }, 0, 100, Time::TimeUnit::Milliseconds);
        CHECK(scheduler.PendingCount() == 1);

        std::this_thread::sleep_for(1'000ms);
        CHECK(handle.Cancel());
        const int observed = runs.load();

        CHECK(observed >= 8);
        CHECK(observed <= 12);
        CHECK(handle.IsCancelled());
        CHECK(handle.IsDone());
        CHECK_FALSE(handle.Cancel());
        CHECK(scheduler.PendingCount() == 0);
        CHECK_FALSE(scheduler.HasPool());
        CHECK(WaitUntil([&] { return threads->Live() == 0; }));

        std::this_thread::sleep_for(150ms);
        CHECK(runs.load() <= observed + 1);
    }

    TEST_CASE("Periodic unit honours its initial delay", "[Execution][Periodic]")
    {
        SelfReleasingScheduler scheduler(1);
        std::atomic<int>       runs {0};

        auto handle = scheduler.ScheduleWithFixedDelay([&] { runs.fetch_add(1); }, 200, 20, Time::TimeUnit::Milliseconds);
        std::this_thread::sleep_for(100ms);
        CHECK(runs.load() == 0);
        CHECK(WaitUntil([&] { return runs.load() >= 3; }));
        handle.Cancel();
        CHECK_FALSE(scheduler.HasPool());
    }

    TEST_CASE("Fixed-delay runs never overlap and leave a gap", "[Execution][Periodic]")
    {
        SelfReleasingScheduler    scheduler(4);
        std::mutex                mutex;
        std::vector<Time::TimePoint> starts;
        std::vector<Time::TimePoint> ends;
        std::atomic<int>          inside {0};
        std::atomic<bool>         overlapped {false};

        auto handle = scheduler.ScheduleWithFixedDelay(
                [&] {
                    if (inside.fetch_add(1) != 0)
                        overlapped.store(true);
                    const auto begin = Time::MonotonicClock::Now();
                    std::this_thread::sleep_for(20ms);
                    {
                        std::lock_guard guard(mutex);
                        starts.push_back(begin);
                        ends.push_back(Time::MonotonicClock::Now());
                    }
                    inside.fetch_sub(1);
                },
                0, 30, Time::TimeUnit::Milliseconds);

        REQUIRE(WaitUntil([&] {
            std::lock_guard guard(mutex);
            return starts.size() >= 4;
        }));
        handle.Cancel();

        std::lock_guard guard(mutex);
        CHECK_FALSE(overlapped.load());
        for (std::size_t i = 1; i < starts.size(); ++i)
            CHECK(starts[i] - ends[i - 1] >= Time::Duration::Milliseconds(30));
    }

    TEST_CASE("Silent error policy keeps a failing unit running", "[Execution][Periodic]")
    {
        SelfReleasingScheduler scheduler(1);
        std::atomic<int>       runs {0};

        auto handle = scheduler.ScheduleAtFixedRate(
                [&] {
                    if (runs.fetch_add(1) + 1 == 3)
                        throw std::runtime_error("third tick fails");
                },
                0, 10, Time::TimeUnit::Milliseconds);

        CHECK(WaitUntil([&] { return runs.load() >= 6; }));
        CHECK_FALSE(handle.IsDone());
        handle.Cancel();
        CHECK(scheduler.PendingCount() == 0);
    }

    TEST_CASE("Error handler that rethrows terminates the unit", "[Execution][Periodic]")
    {
        auto                   threads = std::make_shared<CountingThreadFactory>();
        SelfReleasingScheduler scheduler(1, threads);
        std::atomic<int>       runs {0};
        std::atomic<int>       reported {0};

        auto handle = scheduler.ScheduleAtFixedRate(
                [&] {
                    if (runs.fetch_add(1) + 1 == 3)
                        throw std::runtime_error("third tick fails");
                },
                0, 10, Time::TimeUnit::Milliseconds,
                ErrorHandler([&](std::exception_ptr error) {
                    reported.fetch_add(1);
                    std::rethrow_exception(error);
                }));

        REQUIRE(WaitUntil([&] { return handle.IsDone(); }));
        std::this_thread::sleep_for(100ms);

        CHECK(runs.load() == 3);
        CHECK(reported.load() == 1);
        CHECK_FALSE(handle.IsCancelled());
        CHECK_FALSE(handle.Cancel());
        CHECK(scheduler.PendingCount() == 0);
        CHECK_FALSE(scheduler.HasPool());
        CHECK(WaitUntil([&] { return threads->Live() == 0; }));
    }

    TEST_CASE("Unit that terminates on its first tick before submission returns releases the pool",
              "[Execution][Periodic]")
    {
        auto             threads = std::make_shared<CountingThreadFactory>();
        std::atomic<int> runs {0};
        std::atomic<int> reported {0};

        SelfReleasingScheduler scheduler([threads, &runs]() -> std::shared_ptr<IScheduledExecutor> {
            return std::make_shared<StallingExecutor>([&runs] { return runs.load() > 0; }, threads);
        });

        auto failing = [&] {
            runs.fetch_add(1);
            throw std::runtime_error("first tick fails");
        };
        ErrorHandler rethrow([&](std::exception_ptr error) {
            reported.fetch_add(1);
            std::rethrow_exception(error);
        });

        Cancellable handle;
        SECTION("Fixed rate")
        {
            handle = scheduler.ScheduleAtFixedRate(failing, 0, 50, Time::TimeUnit::Milliseconds, rethrow);
        }
        SECTION("Fixed delay")
        {
            handle = scheduler.ScheduleWithFixedDelay(failing, 0, 50, Time::TimeUnit::Milliseconds, rethrow);
        }

        CHECK(runs.load() == 1);
        CHECK(reported.load() == 1);
        CHECK(handle.IsDone());
        CHECK_FALSE(handle.Cancel());
        CHECK(scheduler.PendingCount() == 0);
        CHECK_FALSE(scheduler.HasPool());
        CHECK(WaitUntil([&] { return threads->Live() == 0; }));

        // The next submission starts a fresh pool.
        auto next = scheduler.Submit([] { return 1; });
        CHECK(next.Get() == 1);
        CHECK(scheduler.PoolGeneration() == 2);
        CHECK_FALSE(scheduler.HasPool());
    }

    TEST_CASE("Error handler that returns keeps the unit running", "[Execution][Periodic]")
    {
        SelfReleasingScheduler scheduler(1);
        std::atomic<int>       runs {0};
        std::atomic<int>       reported {0};

        auto handle = scheduler.ScheduleAtFixedRate(
                [&] {
                    runs.fetch_add(1);
                    throw std::runtime_error("always fails");
                },
                0, 10, Time::TimeUnit::Milliseconds, ErrorHandler([&](std::exception_ptr) { reported.fetch_add(1); }));

        CHECK(WaitUntil([&] { return reported.load() >= 3; }));
        CHECK_FALSE(handle.IsDone());
        handle.Cancel();
    }

    TEST_CASE("A unit may cancel itself from inside its task", "[Execution][Periodic]")
    {
        SelfReleasingScheduler         scheduler(1);
        std::atomic<int>               runs {0};
        std::shared_ptr<Cancellable>   self = std::make_shared<Cancellable>();
        std::atomic<bool>              ready {false};

        *self = scheduler.ScheduleAtFixedRate(
                [&runs, &ready, self] {
                    while (!ready.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    if (runs.fetch_add(1) + 1 == 2)
                        self->Cancel();
                },
                0, 10, Time::TimeUnit::Milliseconds);
        ready.store(true, std::memory_order_release);

        REQUIRE(WaitUntil([&] { return self->IsDone(); }));
        std::this_thread::sleep_for(50ms);
        CHECK(runs.load() == 2);
        CHECK(WaitUntil([&] { return !scheduler.HasPool(); }));
        *self = Cancellable::Empty();
    }

    TEST_CASE("Periodic and one-shot units share the pool", "[Execution][Periodic]")
    {
        SelfReleasingScheduler scheduler(2);
        auto periodic = scheduler.ScheduleAtFixedRate([] {}, 0, 10, Time::TimeUnit::Milliseconds);

        CHECK(scheduler.Submit([] { return 3; }).Get() == 3);
        CHECK(scheduler.HasPool());
        CHECK(scheduler.PendingCount() == 1);
        CHECK(scheduler.PoolGeneration() == 1);

        periodic.Cancel();
        CHECK_FALSE(scheduler.HasPool());
    }
}// namespace Warden::Execution
