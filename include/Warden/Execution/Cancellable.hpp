/// @file Cancellable.hpp
/// @brief Handle for stopping a periodic unit.
#pragma once

#include <memory>
#include <utility>

namespace Warden::Execution
{
    /// @brief Something that can be cancelled once.
    class ICancellationTarget
    {
    public:
        virtual ~ICancellationTarget() = default;

        /// @brief Request cancellation. Returns true only for the call that cancelled.
        virtual bool Cancel() noexcept = 0;

        [[nodiscard]] virtual bool IsCancelled() const noexcept = 0;

        /// @brief True once the target will never run again (cancelled or terminated).
        [[nodiscard]] virtual bool IsDone() const noexcept = 0;
    };

    /// @brief Copyable handle to a cancellation target.
    ///
    /// Cancellation is cooperative: an iteration already running is not interrupted, but no
    /// further iteration starts. Cancel() is idempotent and safe to call from any thread,
    /// including from inside the task itself.
    class Cancellable final
    {
    public:
        Cancellable() noexcept = default;

        explicit Cancellable(std::shared_ptr<ICancellationTarget> target) noexcept
            : m_target(std::move(target))
        {
        }

        /// @brief A handle with nothing behind it.
        [[nodiscard]] static Cancellable Empty() noexcept { return Cancellable(); }

        bool Cancel() noexcept
        {
            return m_target ? m_target->Cancel() : false;
        }

        [[nodiscard]] bool IsCancelled() const noexcept
        {
            return m_target && m_target->IsCancelled();
        }

        [[nodiscard]] bool IsDone() const noexcept
        {
            return !m_target || m_target->IsDone();
        }

        [[nodiscard]] bool IsEmpty() const noexcept { return !m_target; }

    private:
        std::shared_ptr<ICancellationTarget> m_target {};
    };
}// namespace Warden::Execution
