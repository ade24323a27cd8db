/// @file Duration.cpp
/// @brief Tests for Warden::Time::Duration, TimePoint and TimeUnit.

#include <Warden/Time/Duration.hpp>
#include <Warden/Time/MonotonicClock.hpp>
#include <Warden/Time/TimePoint.hpp>

#include <catch2/catch_test_macros.hpp>
#include <limits>

namespace Warden::Time
{
    TEST_CASE("Duration converts between units", "[Time][Duration]")
    {
        CHECK(Duration::Of(3, TimeUnit::Seconds) == Duration::Milliseconds(3'000));
        CHECK(Duration::Of(2, TimeUnit::Minutes).ToMilliseconds() == 120'000);
        CHECK(Duration::Of(1, TimeUnit::Days) == Duration::Of(24, TimeUnit::Hours));
        CHECK(Duration::Microseconds(5).ToNanoseconds() == 5'000);
        CHECK_FALSE(Duration::Zero().IsPositive());
        CHECK(Duration::Nanoseconds(1).IsPositive());
    }

    TEST_CASE("Duration saturates instead of overflowing", "[Time][Duration]")
    {
        constexpr Int64 big = std::numeric_limits<Int64>::max();
        CHECK(Duration::Of(big, TimeUnit::Days) == Duration::Max());
        CHECK(Duration::Max() + Duration::Seconds(1) == Duration::Max());
        CHECK(Duration::Of(-big, TimeUnit::Hours) < Duration::Zero());
    }

    TEST_CASE("TimePoint arithmetic clamps at the clock range", "[Time][TimePoint]")
    {
        const auto origin = TimePoint::FromNanoseconds(1'000);
        CHECK((origin + Duration::Nanoseconds(500)) - origin == Duration::Nanoseconds(500));
        CHECK(origin + Duration::Nanoseconds(-5'000) == TimePoint::FromNanoseconds(0));
        CHECK(origin - (origin + Duration::Nanoseconds(10)) == Duration::Nanoseconds(-10));
    }

    TEST_CASE("MonotonicClock does not go backwards", "[Time][MonotonicClock]")
    {
        const auto first  = MonotonicClock::Now();
        const auto second = MonotonicClock::Now();
        CHECK(second >= first);
        CHECK(MonotonicClock::After(Duration::Seconds(1)) > second);
    }

    TEST_CASE("TimeUnit names are short suffixes", "[Time][TimeUnit]")
    {
        CHECK(ToString(TimeUnit::Milliseconds) == "ms");
        CHECK(ToString(TimeUnit::Minutes) == "min");
        CHECK(NanosecondsPer(TimeUnit::Seconds) == 1'000'000'000);
    }
}// namespace Warden::Time
