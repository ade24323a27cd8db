/// @file Thread.cpp
/// @brief Tests for Warden::Execution::Thread and ThisThread.

#include <Warden/Exceptions/ArgumentException.hpp>
#include <Warden/Execution/ThisThread.hpp>
#include <Warden/Execution/Thread.hpp>
#include <Warden/Time/MonotonicClock.hpp>

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <string>

namespace Warden::Execution
{
    TEST_CASE("ThisThread basic utilities", "[Execution][Thread]")
    {
        CHECK(ThisThread::GetId() != 0);
        CHECK(ThisThread::HardwareConcurrency() >= 1);
        ThisThread::YieldNow();
        ThisThread::RelaxCpu();
        ThisThread::SleepFor(Time::Duration::Milliseconds(1));

        const auto wakeAt = Time::MonotonicClock::After(Time::Duration::Milliseconds(5));
        ThisThread::SleepUntil(wakeAt);
        CHECK(Time::MonotonicClock::Now() >= wakeAt);
    }

    TEST_CASE("Thread starts, names itself and joins", "[Execution][Thread]")
    {
        std::atomic<bool> ran {false};
        std::string       observedName;

        Thread          t;
        Thread::Options options {};
        options.name       = ThreadName("warden-thread");
        options.onDestruct = Thread::OnDestruct::Terminate;

        t.Start(
                [&] {
                    observedName = ThisThread::GetName();
                    ran.store(true, std::memory_order_release);
                },
                options);
        CHECK(t.IsJoinable());
        t.Join();

        CHECK_FALSE(t.IsJoinable());
        CHECK(ran.load(std::memory_order_acquire));
        CHECK(observedName == "warden-thread");
        CHECK(t.GetName().View() == "warden-thread");
    }

    TEST_CASE("ThreadName keeps the index suffix when shortened for the OS", "[Execution][Thread]")
    {
        constexpr auto limit = ThisThread::kMaxNameBytes;

        const ThreadName shortName("unit-1");
        CHECK(shortName.View() == "unit-1");
        CHECK(shortName.OsName() == "unit-1");

        const std::string stem(limit + 4, 'w');
        const ThreadName  indexed(stem + "-12");
        CHECK(indexed.Size() == limit + 7);
        CHECK(indexed.View() == stem + "-12");
        CHECK(indexed.OsName().size() == limit);
        CHECK(indexed.OsName().ends_with("-12"));
        CHECK(indexed.OsName().starts_with("www"));

        const ThreadName plain(std::string(limit + 5, 'p'));
        CHECK(plain.OsName() == std::string(limit, 'p'));

        CHECK(ThreadName().Empty());
    }

    TEST_CASE("Thread applies the shortened name to the OS thread", "[Execution][Thread]")
    {
        std::string     observedName;
        Thread::Options options {};
        options.name       = ThreadName(std::string(ThisThread::kMaxNameBytes, 's') + "-7");
        options.onDestruct = Thread::OnDestruct::Join;
        const auto expected = std::string(options.name.OsName());

        {
            Thread t([&] { observedName = ThisThread::GetName(); }, options);
        }
        CHECK(observedName == expected);
        CHECK(observedName.ends_with("-7"));
    }

    TEST_CASE("Thread joins on destruction when asked to", "[Execution][Thread]")
    {
        std::atomic<bool> ran {false};
        {
            Thread::Options options {};
            options.onDestruct = Thread::OnDestruct::Join;
            Thread t([&] { ran.store(true, std::memory_order_release); }, options);
        }
        CHECK(ran.load(std::memory_order_acquire));
    }

    TEST_CASE("Thread rejects an empty entry", "[Execution][Thread]")
    {
        Thread t;
        CHECK_THROWS_AS(t.Start(Thread::Entry {}), Exceptions::NullArgumentException);
        CHECK_FALSE(t.IsJoinable());
    }
}// namespace Warden::Execution
