/// @file Duration.hpp
/// @brief Signed span of time with nanosecond resolution.
#pragma once

#include <Warden/Primitives.hpp>
#include <Warden/Time/TimeUnit.hpp>

#include <limits>

namespace Warden::Time
{
    /// @brief Signed nanosecond count.
    ///
    /// Conversions from coarser units saturate at the representable range instead of overflowing,
    /// so a delay of `Int64` max days is simply "forever".
    struct Duration final
    {
        constexpr Duration() noexcept = default;

        [[nodiscard]] static constexpr Duration Of(Int64 amount, TimeUnit unit) noexcept
        {
            const Int64 scale = NanosecondsPer(unit);
            constexpr Int64 max = std::numeric_limits<Int64>::max();
            constexpr Int64 min = std::numeric_limits<Int64>::min();
            if (amount > 0 && amount > max / scale)
                return Duration(max);
            if (amount < 0 && amount < min / scale)
                return Duration(min);
            return Duration(amount * scale);
        }

        [[nodiscard]] static constexpr Duration Nanoseconds(Int64 n) noexcept { return Duration(n); }
        [[nodiscard]] static constexpr Duration Microseconds(Int64 n) noexcept { return Of(n, TimeUnit::Microseconds); }
        [[nodiscard]] static constexpr Duration Milliseconds(Int64 n) noexcept { return Of(n, TimeUnit::Milliseconds); }
        [[nodiscard]] static constexpr Duration Seconds(Int64 n) noexcept { return Of(n, TimeUnit::Seconds); }
        [[nodiscard]] static constexpr Duration Zero() noexcept { return Duration(0); }
        [[nodiscard]] static constexpr Duration Max() noexcept { return Duration(std::numeric_limits<Int64>::max()); }

        [[nodiscard]] constexpr Int64 ToNanoseconds() const noexcept { return m_nanoseconds; }
        [[nodiscard]] constexpr Int64 ToMilliseconds() const noexcept { return m_nanoseconds / 1'000'000; }

        [[nodiscard]] constexpr bool IsPositive() const noexcept { return m_nanoseconds > 0; }

        friend constexpr auto operator<=>(Duration, Duration) noexcept = default;

        friend constexpr Duration operator+(Duration a, Duration b) noexcept
        {
            Int64 out = 0;
            if (__builtin_add_overflow(a.m_nanoseconds, b.m_nanoseconds, &out))
                return b.m_nanoseconds > 0 ? Max() : Duration(std::numeric_limits<Int64>::min());
            return Duration(out);
        }

        friend constexpr Duration operator-(Duration a, Duration b) noexcept
        {
            Int64 out = 0;
            if (__builtin_sub_overflow(a.m_nanoseconds, b.m_nanoseconds, &out))
                return b.m_nanoseconds < 0 ? Max() : Duration(std::numeric_limits<Int64>::min());
            return Duration(out);
        }

    private:
        constexpr explicit Duration(Int64 nanoseconds) noexcept
            : m_nanoseconds(nanoseconds)
        {
        }

        Int64 m_nanoseconds {0};
    };
}// namespace Warden::Time
