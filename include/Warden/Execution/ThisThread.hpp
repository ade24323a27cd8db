/// @file ThisThread.hpp
/// @brief Calling-thread utilities.
///
/// Warden runs on POSIX threads; Linux and macOS are supported.
#pragma once

#include <Warden/Defines.hpp>
#include <Warden/Primitives.hpp>
#include <Warden/Time/Duration.hpp>
#include <Warden/Time/MonotonicClock.hpp>
#include <Warden/Time/TimePoint.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <errno.h>
#include <pthread.h>
#include <sched.h>
#include <time.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/syscall.h>
#elif !defined(__APPLE__)
#error "Warden requires Linux or macOS"
#endif

namespace Warden::Execution::ThisThread
{
    using ThreadId = Warden::UInt64;

    /// @brief Longest thread name the OS keeps, excluding the terminator.
#if defined(__linux__)
    inline constexpr std::size_t kMaxNameBytes = 15;
#else
    inline constexpr std::size_t kMaxNameBytes = 63;
#endif

    [[nodiscard]] inline std::uint32_t HardwareConcurrency() noexcept
    {
        const auto v = ::sysconf(_SC_NPROCESSORS_ONLN);
        if (v <= 0)
        {
            return 1u;
        }
        return static_cast<std::uint32_t>(v);
    }

    /// @brief OS thread id of the caller. Never 0.
    [[nodiscard]] inline ThreadId GetId() noexcept
    {
#if defined(__linux__)
        thread_local const ThreadId id = static_cast<ThreadId>(::syscall(SYS_gettid));
#else
        thread_local const ThreadId id = [] {
            UInt64 tid = 0;
            (void) ::pthread_threadid_np(nullptr, &tid);
            return static_cast<ThreadId>(tid);
        }();
#endif
        return id;
    }

    inline void YieldNow() noexcept
    {
        (void) ::sched_yield();
    }

    inline void RelaxCpu() noexcept
    {
        WARDEN_CPU_RELAX();
    }

    inline void SleepFor(Time::Duration duration) noexcept
    {
        if (!duration.IsPositive())
        {
            return;
        }
        const auto ns = static_cast<UInt64>(duration.ToNanoseconds());
        timespec   request {};
        request.tv_sec  = static_cast<time_t>(ns / 1'000'000'000ull);
        request.tv_nsec = static_cast<long>(ns % 1'000'000'000ull);
        timespec remaining {};
        while (::nanosleep(&request, &remaining) != 0 && errno == EINTR)
        {
            request = remaining;
        }
    }

    inline void SleepUntil(Time::TimePoint timePoint) noexcept
    {
        const auto now = Time::MonotonicClock::Now();
        if (timePoint <= now)
        {
            return;
        }
        SleepFor(timePoint - now);
    }

    /// @brief Name the calling thread, truncated to kMaxNameBytes.
    [[nodiscard]] inline bool SetName(std::string_view name) noexcept
    {
        if (name.empty())
        {
            return false;
        }

        std::array<char, kMaxNameBytes + 1> truncated {};
        const auto                          len = std::min(name.size(), kMaxNameBytes);
        std::copy_n(name.data(), len, truncated.data());
        truncated[len] = '\0';
#if defined(__linux__)
        return ::pthread_setname_np(::pthread_self(), truncated.data()) == 0;
#else
        return ::pthread_setname_np(truncated.data()) == 0;
#endif
    }

    [[nodiscard]] inline std::string GetName()
    {
        std::array<char, kMaxNameBytes + 1> buffer {};
        if (::pthread_getname_np(::pthread_self(), buffer.data(), buffer.size()) != 0)
        {
            return {};
        }
        return std::string(buffer.data());
    }
}// namespace Warden::Execution::ThisThread
