#pragma once

#include <Warden/Defines.hpp>

#include <atomic>
#include <thread>

namespace Warden::Sync
{
    /// @brief Test-and-test-and-set spin lock with bounded exponential backoff.
    ///
    /// Meant for critical sections of a few instructions, such as one shard of a striped map.
    class SpinLock
    {
    public:
        SpinLock()                           = default;
        SpinLock(const SpinLock&)            = delete;
        SpinLock& operator=(const SpinLock&) = delete;

        void Lock() noexcept
        {
            int backoff = 1;
            while (true)
            {
                if (!m_locked.exchange(true, std::memory_order_acquire))
                    return;

                while (m_locked.load(std::memory_order_relaxed))
                {
                    if (backoff <= 64)
                    {
                        for (int i = 0; i < backoff; ++i)
                            WARDEN_CPU_RELAX();
                        backoff *= 2;
                    }
                    else
                    {
                        std::this_thread::yield();
                    }
                }
            }
        }

        void Unlock() noexcept
        {
            m_locked.store(false, std::memory_order_release);
        }

        [[nodiscard]] bool TryLock() noexcept
        {
            return !m_locked.load(std::memory_order_relaxed) && !m_locked.exchange(true, std::memory_order_acquire);
        }

        void lock() noexcept
        {
            Lock();
        }

        void unlock() noexcept
        {
            Unlock();
        }

        [[nodiscard]] bool try_lock() noexcept
        {
            return TryLock();
        }

    private:
        std::atomic<bool> m_locked {false};
    };
}// namespace Warden::Sync
