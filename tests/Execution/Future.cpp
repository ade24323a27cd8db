/// @file Future.cpp
/// @brief Tests for Warden::Execution::Future.

#include <Warden/Exceptions/TaskCanceledException.hpp>
#include <Warden/Execution/Future.hpp>

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace Warden::Execution
{
    TEST_CASE("Future returns the completed value", "[Execution][Future]")
    {
        auto         state = std::make_shared<detail::FutureState<std::string>>();
        Future<std::string> future(state);

        CHECK(future.IsValid());
        CHECK_FALSE(future.IsDone());
        REQUIRE(state->TryStart());
        state->Complete(std::string("done"));

        CHECK(future.IsCompleted());
        CHECK(future.Get() == "done");
        CHECK(future.Get(10, Time::TimeUnit::Milliseconds) == "done");
    }

    TEST_CASE("Default-constructed future is not valid until assigned", "[Execution][Future]")
    {
        Future<int> future;
        CHECK_FALSE(future.IsValid());

        auto state = std::make_shared<detail::FutureState<int>>();
        future     = Future<int>(state);
        CHECK(future.IsValid());
        CHECK(future.Cancel());
        CHECK(future.IsCancelled());
    }

    TEST_CASE("Future rethrows the task's exception", "[Execution][Future]")
    {
        auto        state = std::make_shared<detail::FutureState<void>>();
        Future<void> future(state);

        REQUIRE(state->TryStart());
        state->Fault(std::make_exception_ptr(std::logic_error("boom")));

        CHECK(future.IsFaulted());
        CHECK_THROWS_AS(future.Get(), std::logic_error);
    }

    TEST_CASE("Future cancels only before the task starts", "[Execution][Future]")
    {
        auto       state = std::make_shared<detail::FutureState<int>>();
        int        hookCalls = 0;
        state->SetCancelHook([&hookCalls] { ++hookCalls; });
        Future<int> future(state);

        CHECK(future.Cancel());
        CHECK_FALSE(future.Cancel());
        CHECK(hookCalls == 1);
        CHECK(future.IsCancelled());
        CHECK(future.IsDone());
        CHECK_FALSE(state->TryStart());
        CHECK_THROWS_AS(future.Get(), Exceptions::TaskCanceledException);

        auto        running = std::make_shared<detail::FutureState<int>>();
        Future<int> started(running);
        REQUIRE(running->TryStart());
        CHECK_FALSE(started.Cancel());
        running->Complete(3);
        CHECK(started.Get() == 3);
    }

    TEST_CASE("Future Get with a timeout throws when the result is late", "[Execution][Future]")
    {
        auto        state = std::make_shared<detail::FutureState<int>>();
        Future<int> future(state);

        CHECK_THROWS_AS(future.Get(20, Time::TimeUnit::Milliseconds), Exceptions::TimeoutException);
        CHECK_FALSE(future.WaitFor(Time::Duration::Milliseconds(5)));
    }

    TEST_CASE("Future Wait blocks until another thread completes it", "[Execution][Future]")
    {
        auto        state = std::make_shared<detail::FutureState<int>>();
        Future<int> future(state);

        std::thread producer([state] {
            std::this_thread::sleep_for(20ms);
            if (state->TryStart())
                state->Complete(99);
        });

        CHECK(future.Get() == 99);
        producer.join();
    }
}// namespace Warden::Execution
