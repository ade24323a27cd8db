/// @file TimePoint.hpp
/// @brief Monotonic time point for scheduling and timers (nanosecond ticks).
#pragma once

#include <Warden/Primitives.hpp>
#include <Warden/Time/Duration.hpp>

#include <limits>

namespace Warden::Time
{
    /// @brief Opaque monotonic time point expressed as nanoseconds since an unspecified epoch.
    struct TimePoint final
    {
        constexpr TimePoint() noexcept = default;

        static constexpr TimePoint FromNanoseconds(UInt64 nanoseconds) noexcept
        {
            return TimePoint(nanoseconds);
        }

        [[nodiscard]] constexpr UInt64 ToNanoseconds() const noexcept
        {
            return m_nanoseconds;
        }

        friend constexpr auto operator<=>(TimePoint, TimePoint) noexcept = default;

        /// @brief Shift by @p d, clamping at the epoch and at the far future.
        friend constexpr TimePoint operator+(TimePoint t, Duration d) noexcept
        {
            const Int64 delta = d.ToNanoseconds();
            if (delta >= 0)
            {
                const auto udelta = static_cast<UInt64>(delta);
                if (udelta > std::numeric_limits<UInt64>::max() - t.m_nanoseconds)
                    return TimePoint(std::numeric_limits<UInt64>::max());
                return TimePoint(t.m_nanoseconds + udelta);
            }
            const auto udelta = static_cast<UInt64>(-(delta + 1)) + 1u;
            return TimePoint(udelta > t.m_nanoseconds ? 0u : t.m_nanoseconds - udelta);
        }

        /// @brief Signed distance from @p b to @p a.
        friend constexpr Duration operator-(TimePoint a, TimePoint b) noexcept
        {
            if (a.m_nanoseconds >= b.m_nanoseconds)
            {
                const UInt64 diff = a.m_nanoseconds - b.m_nanoseconds;
                return diff > static_cast<UInt64>(std::numeric_limits<Int64>::max())
                               ? Duration::Max()
                               : Duration::Nanoseconds(static_cast<Int64>(diff));
            }
            const UInt64 diff = b.m_nanoseconds - a.m_nanoseconds;
            return diff > static_cast<UInt64>(std::numeric_limits<Int64>::max())
                           ? Duration::Nanoseconds(std::numeric_limits<Int64>::min())
                           : Duration::Nanoseconds(-static_cast<Int64>(diff));
        }

    private:
        constexpr explicit TimePoint(UInt64 nanoseconds) noexcept
            : m_nanoseconds(nanoseconds)
        {
        }

        UInt64 m_nanoseconds {0};
    };
}// namespace Warden::Time
