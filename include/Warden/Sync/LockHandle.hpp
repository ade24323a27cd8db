/// @file LockHandle.hpp
/// @brief Ownership token returned by KeyedLockRegistry.
#pragma once

#include <Warden/Defines.hpp>
#include <Warden/Sync/LockKey.hpp>

#include <memory>

namespace Warden::Sync
{
    class KeyedLockRegistry;

    namespace detail
    {
        struct LockEntry;
    }

    /// @brief One level of ownership of a keyed lock.
    ///
    /// Move-only. Release() gives up exactly the level this handle was created for; it must be
    /// called by the thread that acquired it. A handle still holding its level when destroyed
    /// releases it. The registry must outlive every handle it issued.
    class WARDEN_API LockHandle final
    {
    public:
        LockHandle() noexcept = default;

        LockHandle(LockHandle&& other) noexcept;
        LockHandle& operator=(LockHandle&& other) noexcept;

        LockHandle(const LockHandle&)            = delete;
        LockHandle& operator=(const LockHandle&) = delete;

        ~LockHandle();

        /// @brief Release one level of reentrancy.
        /// @throws LockOwnershipException if the calling thread does not hold the lock, or if this
        /// handle was already released. The lock state is unchanged in both cases.
        void Release();

        /// @brief Whether this handle still holds its level.
        [[nodiscard]] bool IsHeld() const noexcept { return static_cast<bool>(m_entry); }

        /// @brief Key of the lock, or the null key for an empty handle.
        [[nodiscard]] const LockKey& GetKey() const noexcept;

    private:
        friend class KeyedLockRegistry;

        LockHandle(KeyedLockRegistry& registry, std::shared_ptr<detail::LockEntry> entry) noexcept;

        void ReleaseOnDestruction() noexcept;

        KeyedLockRegistry*                 m_registry {nullptr};
        std::shared_ptr<detail::LockEntry> m_entry {};
    };
}// namespace Warden::Sync
