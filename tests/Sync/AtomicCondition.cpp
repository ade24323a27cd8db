/// @file AtomicCondition.cpp
/// @brief Tests for Warden::Sync::AtomicCondition.

#include <Warden/Sync/AtomicCondition.hpp>
#include <Warden/Time/MonotonicClock.hpp>

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace Warden;
using namespace Warden::Sync;
using namespace std::chrono_literals;

TEST_CASE("AtomicCondition wakes one waiting thread", "[Sync][AtomicCondition]")
{
    AtomicCondition  condition;
    std::atomic<int> counter {0};

    std::thread worker([&] {
        condition.Wait();
        counter.fetch_add(1, std::memory_order_relaxed);
    });

    std::this_thread::sleep_for(50ms);
    condition.NotifyOne();
    worker.join();

    CHECK(counter.load() == 1);
}

TEST_CASE("AtomicCondition NotifyAll wakes arbitrary thread counts", "[Sync][AtomicCondition]")
{
    for (int threadCount: {1, 2, 4, 8})
    {
        DYNAMIC_SECTION("threads=" << threadCount)
        {
            AtomicCondition          condition;
            std::atomic<int>         counter {0};
            std::vector<std::thread> workers;
            workers.reserve(threadCount);

            for (int i = 0; i < threadCount; ++i)
            {
                workers.emplace_back([&] {
                    condition.Wait();
                    counter.fetch_add(1, std::memory_order_relaxed);
                });
            }

            std::this_thread::sleep_for(50ms);
            condition.NotifyAll();
            for (auto& worker: workers)
            {
                worker.join();
            }

            CHECK(counter.load() == threadCount);
        }
    }
}

TEST_CASE("AtomicCondition Wait(observed) returns once the generation moved", "[Sync][AtomicCondition]")
{
    AtomicCondition condition;
    const auto      observed = condition.Load();
    condition.NotifyAll();

    condition.Wait(observed);
    CHECK(condition.Load() != observed);
    CHECK(condition.WaitFor(observed, Time::Duration::Milliseconds(1)));
}

TEST_CASE("AtomicCondition WaitFor times out without a notification", "[Sync][AtomicCondition]")
{
    AtomicCondition condition;

    const auto start = Time::MonotonicClock::Now();
    CHECK_FALSE(condition.WaitFor(Time::Duration::Milliseconds(30)));
    const auto elapsed = Time::MonotonicClock::Now() - start;

    CHECK(elapsed >= Time::Duration::Milliseconds(25));
    CHECK_FALSE(condition.WaitFor(Time::Duration::Zero()));
}

TEST_CASE("AtomicCondition WaitFor observes a notification", "[Sync][AtomicCondition]")
{
    AtomicCondition condition;
    const auto      observed = condition.Load();

    std::thread notifier([&] {
        std::this_thread::sleep_for(20ms);
        condition.NotifyAll();
    });

    bool woke = false;
    const auto deadline = Time::MonotonicClock::After(Time::Duration::Seconds(5));
    while (!woke && Time::MonotonicClock::Now() < deadline)
    {
        woke = condition.WaitFor(observed, Time::Duration::Milliseconds(100));
    }
    notifier.join();

    CHECK(woke);
}
