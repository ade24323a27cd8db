#include <Warden/Sync/LockHandle.hpp>

#include <Warden/Diagnostics/Logger.hpp>
#include <Warden/Exceptions/LockOwnershipException.hpp>
#include <Warden/Sync/KeyedLockRegistry.hpp>

#include <utility>

namespace Warden::Sync
{
    namespace
    {
        const LockKey& NullKey()
        {
            static const LockKey key = LockKey::Null();
            return key;
        }
    }// namespace

    LockHandle::LockHandle(KeyedLockRegistry& registry, std::shared_ptr<detail::LockEntry> entry) noexcept
        : m_registry(&registry)
        , m_entry(std::move(entry))
    {
    }

    LockHandle::LockHandle(LockHandle&& other) noexcept
        : m_registry(std::exchange(other.m_registry, nullptr))
        , m_entry(std::move(other.m_entry))
    {
    }

    LockHandle& LockHandle::operator=(LockHandle&& other) noexcept
    {
        if (this != &other)
        {
            ReleaseOnDestruction();
            m_registry = std::exchange(other.m_registry, nullptr);
            m_entry    = std::move(other.m_entry);
        }
        return *this;
    }

    LockHandle::~LockHandle()
    {
        ReleaseOnDestruction();
    }

    void LockHandle::Release()
    {
        if (!m_entry)
        {
            throw Exceptions::LockOwnershipException("LockHandle: lock already released");
        }
        m_registry->Release(m_entry);
        m_entry.reset();
        m_registry = nullptr;
    }

    const LockKey& LockHandle::GetKey() const noexcept
    {
        return m_entry ? m_entry->key : NullKey();
    }

    void LockHandle::ReleaseOnDestruction() noexcept
    {
        if (!m_entry)
        {
            return;
        }
        try
        {
            Release();
        } catch (const Exceptions::LockOwnershipException& ex)
        {
            WARDEN_LOG_ERROR("LockHandle: dropped without releasing: {}", ex.GetMessage());
            m_entry.reset();
            m_registry = nullptr;
        }
    }
}// namespace Warden::Sync
