#include <Warden/Sync/KeyedLockRegistry.hpp>

#include <Warden/Diagnostics/Logger.hpp>
#include <Warden/Exceptions/LockOwnershipException.hpp>

#include <fmt/format.h>

#include <system_error>

namespace Warden::Sync
{
    LockHandle KeyedLockRegistry::Lock(const LockKey& key)
    {
        const auto self = Execution::ThisThread::GetId();
        for (;;)
        {
            EntryPtr entry = m_entries.GetOrInsert(key, [&key]() { return std::make_shared<detail::LockEntry>(key); });

            // Only the owner ever stores its own id, so this cannot be a stale match.
            if (entry->owner.load(std::memory_order_relaxed) == self)
            {
                ++entry->holdCount;
                return LockHandle(*this, std::move(entry));
            }

            if (!entry->TryAttach())
            {
                // Evicted but still linked: help unlink it, then retry against a fresh entry.
                Unlink(entry);
                continue;
            }

            try
            {
                entry->mutex.lock();
            } catch (const std::system_error& ex)
            {
                WARDEN_LOG_ERROR("KeyedLockRegistry: failed to lock '{}': {}", entry->key.ToString(), ex.what());
                Detach(entry);
                throw;
            }
            entry->owner.store(self, std::memory_order_relaxed);
            entry->holdCount = 1;
            return LockHandle(*this, std::move(entry));
        }
    }

    void KeyedLockRegistry::Release(const EntryPtr& entry)
    {
        const auto self = Execution::ThisThread::GetId();
        if (entry->owner.load(std::memory_order_relaxed) != self)
        {
            WARDEN_LOG_ERROR("KeyedLockRegistry: thread {} released lock '{}' it does not hold", self,
                             entry->key.ToString());
            throw Exceptions::LockOwnershipException(
                    fmt::format("Lock '{}' released by thread {} which does not hold it", entry->key.ToString(), self));
        }

        if (--entry->holdCount > 0)
        {
            return;
        }

        entry->owner.store(0, std::memory_order_relaxed);
        entry->mutex.unlock();
        Detach(entry);
    }

    void KeyedLockRegistry::Detach(const EntryPtr& entry) noexcept
    {
        if (entry->threads.fetch_sub(1, std::memory_order_acq_rel) != 1)
        {
            return;
        }
        // Last one out. Marking fails if a new arriver attached after our decrement; the entry
        // then stays for that arriver.
        Int32 expected = 0;
        if (entry->threads.compare_exchange_strong(expected, detail::LockEntry::kEvicted, std::memory_order_acq_rel))
        {
            Unlink(entry);
        }
    }

    void KeyedLockRegistry::Unlink(const EntryPtr& entry) noexcept
    {
        (void) m_entries.RemoveIf(entry->key, [&entry](const EntryPtr& current) { return current == entry; });
    }

    UIntSize KeyedLockRegistry::Size() const
    {
        return m_entries.Size();
    }

    bool KeyedLockRegistry::IsHeldByCurrentThread(const LockKey& key) const
    {
        EntryPtr entry;
        if (!m_entries.TryGet(key, entry))
        {
            return false;
        }
        return entry->owner.load(std::memory_order_relaxed) == Execution::ThisThread::GetId();
    }
}// namespace Warden::Sync
