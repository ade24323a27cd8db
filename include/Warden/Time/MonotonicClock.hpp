/// @file MonotonicClock.hpp
/// @brief Platform monotonic clock.
#pragma once

#include <Warden/Time/TimePoint.hpp>

#include <time.h>

namespace Warden::Time
{
    /// @brief Monotonic clock based on `CLOCK_MONOTONIC`.
    struct MonotonicClock final
    {
        [[nodiscard]] static inline TimePoint Now() noexcept
        {
            timespec ts {};
            ::clock_gettime(CLOCK_MONOTONIC, &ts);
            const auto nanos = static_cast<UInt64>(ts.tv_sec) * 1'000'000'000ull + static_cast<UInt64>(ts.tv_nsec);
            return TimePoint::FromNanoseconds(nanos);
        }

        /// @brief Time point @p delay from now.
        [[nodiscard]] static inline TimePoint After(Duration delay) noexcept
        {
            return Now() + delay;
        }
    };
}// namespace Warden::Time
