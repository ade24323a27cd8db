/// @file Future.hpp
/// @brief Result handle of a one-shot scheduled task.
#pragma once

#include <Warden/Exceptions/TaskCanceledException.hpp>
#include <Warden/Primitives.hpp>
#include <Warden/Sync/AtomicCondition.hpp>
#include <Warden/Time/Duration.hpp>
#include <Warden/Time/MonotonicClock.hpp>
#include <Warden/Time/TimeUnit.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace Warden::Execution
{
    namespace detail
    {
        enum class FutureStatus : UInt8
        {
            Pending,
            Running,
            Completed,
            Faulted,
            Canceled,
        };

        /// Shared state between a one-shot work item and its futures.
        ///
        /// Exactly one transition leaves Pending: TryStart (the worker) or Cancel (a future or
        /// the destructor of a work item that never ran). Whoever wins owns the follow-up.
        class FutureStateBase
        {
        public:
            using CancelHook = std::move_only_function<void()>;

            FutureStateBase()                                  = default;
            FutureStateBase(const FutureStateBase&)            = delete;
            FutureStateBase& operator=(const FutureStateBase&) = delete;

            /// Must be installed before the state is shared with another thread.
            void SetCancelHook(CancelHook hook) noexcept { m_onCancel = std::move(hook); }

            [[nodiscard]] bool TryStart() noexcept
            {
                auto expected = FutureStatus::Pending;
                return m_status.compare_exchange_strong(expected, FutureStatus::Running, std::memory_order_acq_rel);
            }

            bool Cancel() noexcept
            {
                auto expected = FutureStatus::Pending;
                if (!m_status.compare_exchange_strong(expected, FutureStatus::Canceled, std::memory_order_acq_rel))
                {
                    return false;
                }
                m_done.NotifyAll();
                if (m_onCancel)
                {
                    m_onCancel();
                }
                return true;
            }

            void Fault(std::exception_ptr error) noexcept
            {
                m_error = std::move(error);
                Finish(FutureStatus::Faulted);
            }

            [[nodiscard]] FutureStatus GetStatus() const noexcept
            {
                return m_status.load(std::memory_order_acquire);
            }

            [[nodiscard]] bool IsDone() const noexcept
            {
                const auto status = GetStatus();
                return status != FutureStatus::Pending && status != FutureStatus::Running;
            }

            void Wait() const noexcept
            {
                while (!IsDone())
                {
                    const auto observed = m_done.Load();
                    if (IsDone())
                    {
                        break;
                    }
                    m_done.Wait(observed);
                }
            }

            [[nodiscard]] bool WaitFor(Time::Duration timeout) const noexcept
            {
                const auto deadline = Time::MonotonicClock::After(timeout);
                while (!IsDone())
                {
                    const auto observed = m_done.Load();
                    if (IsDone())
                    {
                        break;
                    }
                    const auto now = Time::MonotonicClock::Now();
                    if (deadline <= now)
                    {
                        return false;
                    }
                    (void) m_done.WaitFor(observed, deadline - now);
                }
                return true;
            }

            /// Throws the failure or cancellation recorded in the state; returns if completed.
            void ThrowIfNotCompleted() const
            {
                switch (GetStatus())
                {
                    case FutureStatus::Faulted:
                        std::rethrow_exception(m_error);
                    case FutureStatus::Canceled:
                        throw Exceptions::TaskCanceledException();
                    default:
                        return;
                }
            }

        protected:
            void Finish(FutureStatus status) noexcept
            {
                m_status.store(status, std::memory_order_release);
                m_done.NotifyAll();
            }

        private:
            std::atomic<FutureStatus>     m_status {FutureStatus::Pending};
            mutable Sync::AtomicCondition m_done;
            std::exception_ptr            m_error {};
            CancelHook                    m_onCancel {};
        };

        template<typename T>
        class FutureState final : public FutureStateBase
        {
        public:
            void Complete(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            {
                m_value.emplace(std::move(value));
                Finish(FutureStatus::Completed);
            }

            [[nodiscard]] const T& Value() const noexcept { return *m_value; }

        private:
            std::optional<T> m_value {};
        };

        template<>
        class FutureState<void> final : public FutureStateBase
        {
        public:
            void Complete() noexcept { Finish(FutureStatus::Completed); }
        };
    }// namespace detail

    /// @brief Handle to the eventual result of a one-shot task.
    ///
    /// Futures are cheap to copy; all copies observe the same result. `Get()` returns the task's
    /// value, rethrows the task's exception, or throws `TaskCanceledException` if the task was
    /// cancelled before it started.
    ///
    /// A default-constructed future has no task behind it. Every member other than `IsValid()`
    /// requires `IsValid()` to be true.
    template<typename T>
    class Future final
    {
    public:
        Future() noexcept = default;

        explicit Future(std::shared_ptr<detail::FutureState<T>> state) noexcept
            : m_state(std::move(state))
        {
        }

        /// @brief True if this future refers to a submitted task. Precondition of all other members.
        [[nodiscard]] bool IsValid() const noexcept { return static_cast<bool>(m_state); }

        /// @brief Cancel the task if it has not started yet.
        /// @return true if this call cancelled it.
        bool Cancel() noexcept { return m_state->Cancel(); }

        [[nodiscard]] bool IsCancelled() const noexcept
        {
            return m_state->GetStatus() == detail::FutureStatus::Canceled;
        }

        [[nodiscard]] bool IsDone() const noexcept { return m_state->IsDone(); }

        [[nodiscard]] bool IsCompleted() const noexcept
        {
            return m_state->GetStatus() == detail::FutureStatus::Completed;
        }

        [[nodiscard]] bool IsFaulted() const noexcept
        {
            return m_state->GetStatus() == detail::FutureStatus::Faulted;
        }

        void Wait() const noexcept { m_state->Wait(); }

        /// @return true if the future is done.
        [[nodiscard]] bool WaitFor(Time::Duration timeout) const noexcept { return m_state->WaitFor(timeout); }

        decltype(auto) Get() const
        {
            m_state->Wait();
            return Result();
        }

        /// @throws TimeoutException if the result is not ready within @p timeout units.
        decltype(auto) Get(Int64 timeout, Time::TimeUnit unit) const
        {
            if (!m_state->WaitFor(Time::Duration::Of(timeout, unit)))
            {
                throw Exceptions::TimeoutException();
            }
            return Result();
        }

    private:
        decltype(auto) Result() const
        {
            m_state->ThrowIfNotCompleted();
            if constexpr (std::is_void_v<T>)
            {
                return;
            }
            else
            {
                return static_cast<const T&>(m_state->Value());
            }
        }

        std::shared_ptr<detail::FutureState<T>> m_state {};
    };
}// namespace Warden::Execution
