#pragma once

#include <Warden/Primitives.hpp>
#include <Warden/Time/Duration.hpp>

#include <atomic>
#include <climits>
#include <cstdint>

#if defined(__linux__)
#include <errno.h>
#include <linux/futex.h>
#include <sys/syscall.h>
#include <time.h>
#include <unistd.h>
#else
#include <thread>
#endif

namespace Warden::Sync
{
    /// @brief A minimal condition-like object built on a generation counter.
    ///
    /// Waiters capture the generation and sleep until it changes. There are no predicates or
    /// locks involved; callers build predicate loops with Load() and Wait(observed).
    class AtomicCondition
    {
    public:
        AtomicCondition() noexcept = default;

        AtomicCondition(const AtomicCondition&)            = delete;
        AtomicCondition& operator=(const AtomicCondition&) = delete;

        /// @brief Blocks the calling thread until a notification is received.
        void Wait() noexcept
        {
            Wait(Load());
        }

        /// @brief Wait until the generation differs from @p observedGeneration.
        void Wait(UInt32 observedGeneration) noexcept
        {
#if defined(__linux__)
            while (Load() == observedGeneration)
            {
                const long rc = ::syscall(SYS_futex, &m_generation, FUTEX_WAIT_PRIVATE, observedGeneration, nullptr,
                                          nullptr, 0);
                if (rc == 0 || errno == EAGAIN)
                    break;
            }
#else
            Generation().wait(observedGeneration, std::memory_order_acquire);
#endif
        }

        [[nodiscard]] UInt32 Load() const noexcept
        {
            return Generation().load(std::memory_order_acquire);
        }

        /// @brief Wait for a notification or until @p timeout elapses.
        /// @return true if the generation changed, false on timeout.
        [[nodiscard]] bool WaitFor(Time::Duration timeout) noexcept
        {
            return WaitFor(Load(), timeout);
        }

        /// @brief Wait until the generation differs from @p observedGeneration or @p timeout elapses.
        [[nodiscard]] bool WaitFor(UInt32 observedGeneration, Time::Duration timeout) noexcept
        {
            if (Load() != observedGeneration)
                return true;
            if (!timeout.IsPositive())
                return false;

#if defined(__linux__)
            const auto ns = static_cast<UInt64>(timeout.ToNanoseconds());
            timespec   ts {};
            ts.tv_sec  = static_cast<time_t>(ns / 1'000'000'000ull);
            ts.tv_nsec = static_cast<long>(ns % 1'000'000'000ull);

            long rc = -1;
            for (;;)
            {
                rc = ::syscall(SYS_futex, &m_generation, FUTEX_WAIT_PRIVATE, observedGeneration, &ts, nullptr, 0);
                if (rc == 0 || errno != EINTR)
                    break;
            }
            if (rc == 0)
                return true;
            return Load() != observedGeneration;
#else
            (void) timeout;
            Wait(observedGeneration);
            return true;
#endif
        }

        /// @brief Increments the generation counter, then wakes one waiting thread.
        void NotifyOne() noexcept
        {
            Generation().fetch_add(1u, std::memory_order_release);
#if defined(__linux__)
            (void) ::syscall(SYS_futex, &m_generation, FUTEX_WAKE_PRIVATE, 1, nullptr, nullptr, 0);
#else
            Generation().notify_one();
#endif
        }

        /// @brief Increments the generation counter, then wakes all waiting threads.
        void NotifyAll() noexcept
        {
            Generation().fetch_add(1u, std::memory_order_release);
#if defined(__linux__)
            (void) ::syscall(SYS_futex, &m_generation, FUTEX_WAKE_PRIVATE, INT_MAX, nullptr, nullptr, 0);
#else
            Generation().notify_all();
#endif
        }

    private:
        [[nodiscard]] std::atomic_ref<UInt32> Generation() const noexcept
        {
            return std::atomic_ref<UInt32>(const_cast<UInt32&>(m_generation));
        }

        // Threads wait for this counter to change.
        alignas(std::atomic_ref<UInt32>::required_alignment) UInt32 m_generation {0};
    };
}// namespace Warden::Sync
