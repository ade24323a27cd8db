/// @file KeyedLockRegistry.hpp
/// @brief Reentrant mutual exclusion keyed by value-equal keys.
#pragma once

#include <Warden/Config.hpp>
#include <Warden/Containers/StripedHashMap.hpp>
#include <Warden/Defines.hpp>
#include <Warden/Execution/ThisThread.hpp>
#include <Warden/Primitives.hpp>
#include <Warden/Sync/LockHandle.hpp>
#include <Warden/Sync/LockKey.hpp>

#include <atomic>
#include <concepts>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <utility>

namespace Warden::Sync
{
    namespace detail
    {
        /// Lock state of one live key.
        ///
        /// `threads` counts the threads holding or waiting on `mutex`. The value kEvicted is
        /// terminal: it is installed by compare-and-swap from 0 by the last releaser, and once
        /// installed no thread can attach, so the entry only waits to be unlinked.
        struct LockEntry final
        {
            static constexpr Int32 kEvicted = -1;

            explicit LockEntry(LockKey lockKey)
                : key(std::move(lockKey))
            {
            }

            /// Register intent to wait on the mutex. Fails if the entry is evicted.
            [[nodiscard]] bool TryAttach() noexcept
            {
                Int32 current = threads.load(std::memory_order_acquire);
                while (current != kEvicted)
                {
                    if (threads.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                                      std::memory_order_acquire))
                    {
                        return true;
                    }
                }
                return false;
            }

            const LockKey                                key;
            std::mutex                                   mutex;
            std::atomic<Execution::ThisThread::ThreadId> owner {0};
            UInt32                                       holdCount {0};// touched by the owner only
            std::atomic<Int32>                           threads {0};
        };
    }// namespace detail

    /// @brief Broker of reentrant mutexes named by LockKey values.
    ///
    /// A key's mutex is created by the first thread that asks for it and dropped when the last
    /// holder or waiter lets go, so memory is bounded by the keys currently in use.
    /// Waiters are not served in FIFO order.
    ///
    /// There is no process-wide instance: construct one and pass it to the code that shares it.
    class WARDEN_API KeyedLockRegistry final
    {
    public:
        KeyedLockRegistry() = default;

        KeyedLockRegistry(const KeyedLockRegistry&)            = delete;
        KeyedLockRegistry& operator=(const KeyedLockRegistry&) = delete;

        /// @brief Block until the calling thread holds @p key. Reentrant.
        [[nodiscard]] LockHandle Lock(const LockKey& key);

        /// @brief Lock the single key @p value.
        [[nodiscard]] LockHandle Lock(KeyValue value)
        {
            return Lock(LockKey::Single(std::move(value)));
        }

        /// @brief Lock the composite key of @p keys in order.
        ///
        /// No arguments lock LockKey::Empty(); one argument is the same as Lock(key).
        template<typename... Ts>
            requires(std::constructible_from<KeyValue, Ts &&> && ...)
        [[nodiscard]] LockHandle LockAll(Ts&&... keys)
        {
            return Lock(LockKey::Of(std::forward<Ts>(keys)...));
        }

        [[nodiscard]] LockHandle LockAll(std::span<const KeyValue> keys)
        {
            return Lock(LockKey::Composite(keys));
        }

        /// @brief Number of keys with a live lock entry.
        [[nodiscard]] UIntSize Size() const;

        [[nodiscard]] bool IsHeldByCurrentThread(const LockKey& key) const;

    private:
        friend class LockHandle;

        using EntryPtr = std::shared_ptr<detail::LockEntry>;
        using EntryMap = Containers::StripedHashMap<LockKey, EntryPtr, LockKeyHash, std::equal_to<LockKey>,
                                                    WARDEN_LOCK_REGISTRY_SHARDS>;

        void Release(const EntryPtr& entry);
        /// Drop one attachment; the last one out evicts and unlinks the entry.
        void Detach(const EntryPtr& entry) noexcept;
        void Unlink(const EntryPtr& entry) noexcept;

        EntryMap m_entries;
    };
}// namespace Warden::Sync
