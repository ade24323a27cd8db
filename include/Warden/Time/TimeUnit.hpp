/// @file TimeUnit.hpp
/// @brief Granularity tag used by scheduling calls to interpret integral delays and periods.
#pragma once

#include <Warden/Primitives.hpp>

#include <string_view>

namespace Warden::Time
{
    enum class TimeUnit : UInt8
    {
        Nanoseconds,
        Microseconds,
        Milliseconds,
        Seconds,
        Minutes,
        Hours,
        Days,
    };

    /// @brief Number of nanoseconds in one @p unit.
    [[nodiscard]] constexpr Int64 NanosecondsPer(TimeUnit unit) noexcept
    {
        switch (unit)
        {
            case TimeUnit::Nanoseconds:
                return 1;
            case TimeUnit::Microseconds:
                return 1'000;
            case TimeUnit::Milliseconds:
                return 1'000'000;
            case TimeUnit::Seconds:
                return 1'000'000'000;
            case TimeUnit::Minutes:
                return 60ll * 1'000'000'000;
            case TimeUnit::Hours:
                return 3'600ll * 1'000'000'000;
            case TimeUnit::Days:
                return 86'400ll * 1'000'000'000;
        }
        return 1;
    }

    [[nodiscard]] constexpr std::string_view ToString(TimeUnit unit) noexcept
    {
        switch (unit)
        {
            case TimeUnit::Nanoseconds:
                return "ns";
            case TimeUnit::Microseconds:
                return "us";
            case TimeUnit::Milliseconds:
                return "ms";
            case TimeUnit::Seconds:
                return "s";
            case TimeUnit::Minutes:
                return "min";
            case TimeUnit::Hours:
                return "h";
            case TimeUnit::Days:
                return "d";
        }
        return "?";
    }
}// namespace Warden::Time
