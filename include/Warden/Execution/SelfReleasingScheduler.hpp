/// @file SelfReleasingScheduler.hpp
/// @brief Task scheduler whose worker pool exists only while work depends on it.
#pragma once

#include <Warden/Defines.hpp>
#include <Warden/Exceptions/ArgumentException.hpp>
#include <Warden/Execution/Cancellable.hpp>
#include <Warden/Execution/ErrorHandler.hpp>
#include <Warden/Execution/Future.hpp>
#include <Warden/Execution/IScheduledExecutor.hpp>
#include <Warden/Execution/ThreadFactory.hpp>
#include <Warden/Primitives.hpp>
#include <Warden/Time/Duration.hpp>
#include <Warden/Time/MonotonicClock.hpp>
#include <Warden/Time/TimeUnit.hpp>

#include <atomic>
#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace Warden::Execution
{
    namespace detail
    {
        class SchedulerCore;

        /// Pending-count slot of one scheduled unit.
        ///
        /// A ticket is issued for every submission and armed once the pending count includes it.
        /// Cancellation and abandonment may race the submitting call: a release that arrives
        /// before arming is recorded, and arming then reports that the unit already ended.
        class UnitTicket final
        {
        public:
            UnitTicket(std::weak_ptr<SchedulerCore> core, UInt64 generation) noexcept
                : m_core(std::move(core))
                , m_generation(generation)
            {
            }

            /// Returns false if the unit ended before it could be counted.
            [[nodiscard]] bool TryArm() noexcept
            {
                auto expected = State::Unarmed;
                return m_state.compare_exchange_strong(expected, State::Armed, std::memory_order_acq_rel);
            }

            /// Release after the unit ran. Blocks on the scheduler lock until the submitting call
            /// has counted the unit.
            WARDEN_API void Release() noexcept;

            /// Release from cancellation or abandonment. An unarmed ticket is marked so that it
            /// is never counted.
            void ReleaseIfArmed() noexcept
            {
                auto current = m_state.load(std::memory_order_acquire);
                while (true)
                {
                    if (current == State::Armed)
                    {
                        Release();
                        return;
                    }
                    if (current == State::EndedEarly)
                    {
                        return;
                    }
                    if (m_state.compare_exchange_weak(current, State::EndedEarly, std::memory_order_acq_rel))
                    {
                        return;
                    }
                }
            }

        private:
            enum class State : UInt8
            {
                Unarmed,
                Armed,
                EndedEarly,
            };

            std::weak_ptr<SchedulerCore> m_core;
            UInt64                       m_generation;
            std::atomic<State>           m_state {State::Unarmed};
        };

        /// Bookkeeping shared by a scheduler and its units: the pool cell and the pending count.
        class WARDEN_API SchedulerCore final : public std::enable_shared_from_this<SchedulerCore>
        {
        public:
            using PoolFactory = std::function<std::shared_ptr<IScheduledExecutor>()>;
            using Submitter   = std::function<void(IScheduledExecutor&, const std::shared_ptr<UnitTicket>&,
                                                   const std::weak_ptr<IScheduledExecutor>&)>;

            explicit SchedulerCore(PoolFactory factory) noexcept
                : m_factory(std::move(factory))
            {
            }

            /// Create the pool if absent, hand it to @p submitter, then count the unit.
            /// On failure the pool is torn down again if nothing else depends on it.
            void Submit(const Submitter& submitter);

            /// Decrement the pending count for a unit of @p generation; tear down at zero.
            void Release(UInt64 generation) noexcept;

            /// Drop the pool immediately and ignore later releases.
            void Close() noexcept;

            [[nodiscard]] bool   HasPool() const;
            [[nodiscard]] Int64  PendingCount() const;
            [[nodiscard]] UInt64 PoolGeneration() const;

        private:
            mutable std::mutex                  m_mutex;
            PoolFactory                         m_factory;
            std::shared_ptr<IScheduledExecutor> m_pool {};
            Int64                               m_pending {0};
            UInt64                              m_generation {0};
            bool                                m_closed {false};
        };

        /// Work item of a one-shot task. Destroying it unrun cancels its future.
        template<typename F, typename R>
        class OneShotItem final
        {
        public:
            OneShotItem(F task, std::shared_ptr<FutureState<R>> state, std::shared_ptr<UnitTicket> ticket)
                : m_task(std::move(task))
                , m_state(std::move(state))
                , m_ticket(std::move(ticket))
            {
            }

            OneShotItem(OneShotItem&&) noexcept            = default;
            OneShotItem& operator=(OneShotItem&&) noexcept = default;

            ~OneShotItem()
            {
                if (m_state)
                {
                    (void) m_state->Cancel();
                }
            }

            void operator()() noexcept
            {
                auto state  = std::move(m_state);
                auto ticket = std::move(m_ticket);
                if (!state->TryStart())
                {
                    return;
                }

                std::exception_ptr error;
                if constexpr (std::is_void_v<R>)
                {
                    try
                    {
                        std::invoke(m_task);
                    } catch (...)
                    {
                        error = std::current_exception();
                    }
                    ticket->Release();
                    if (error)
                        state->Fault(std::move(error));
                    else
                        state->Complete();
                }
                else
                {
                    std::optional<R> value;
                    try
                    {
                        value.emplace(std::invoke(m_task));
                    } catch (...)
                    {
                        error = std::current_exception();
                    }
                    ticket->Release();
                    if (error)
                        state->Fault(std::move(error));
                    else
                        state->Complete(std::move(*value));
                }
            }

        private:
            F                               m_task;
            std::shared_ptr<FutureState<R>> m_state;
            std::shared_ptr<UnitTicket>     m_ticket;
        };

        enum class PeriodicMode : UInt8
        {
            FixedRate,
            FixedDelay,
        };

        struct PeriodicOptions final
        {
            std::function<void()> task;
            Time::Duration        initialDelay;
            Time::Duration        period;
            PeriodicMode          mode;
            ErrorHandler          onError;
        };

        /// Submit a periodic unit through @p core; returns its cancellation handle.
        [[nodiscard]] WARDEN_API Cancellable SubmitPeriodic(SchedulerCore& core, PeriodicOptions options);
    }// namespace detail

    /// @brief Schedules one-shot, delayed and periodic tasks on a pool it creates on demand.
    ///
    /// The pool is built by the first submission and torn down as soon as no submitted unit is
    /// pending, running or periodically active; the next submission builds a fresh one.
    /// One-shot units stop counting when they finish or are cancelled before starting. Periodic
    /// units count until cancelled, or until their error handler throws.
    ///
    /// Submissions never block beyond a short bookkeeping section. Units must not rely on
    /// thread-local state surviving between runs: consecutive runs may land on different pools.
    ///
    /// Destroying the scheduler shuts the current pool down immediately. Queued one-shot tasks
    /// are dropped and their futures report cancellation.
    class WARDEN_API SelfReleasingScheduler
    {
    public:
        using PoolFactory  = detail::SchedulerCore::PoolFactory;
        using PeriodicTask = std::function<void()>;

        /// @throws InvalidArgumentException if @p corePoolSize is negative.
        explicit SelfReleasingScheduler(Int32 corePoolSize);

        /// @throws InvalidArgumentException if @p corePoolSize is negative.
        /// @throws NullArgumentException if @p threadFactory is null.
        SelfReleasingScheduler(Int32 corePoolSize, std::shared_ptr<IThreadFactory> threadFactory);

        /// @brief Use @p poolFactory to build each pool. Executors it returns must not run work
        /// inline on the submitting thread.
        /// @throws NullArgumentException if @p poolFactory is empty.
        explicit SelfReleasingScheduler(PoolFactory poolFactory);

        ~SelfReleasingScheduler();

        SelfReleasingScheduler(const SelfReleasingScheduler&)            = delete;
        SelfReleasingScheduler& operator=(const SelfReleasingScheduler&) = delete;

        /// @brief Run @p task as soon as possible.
        template<typename F>
            requires std::invocable<std::decay_t<F>&>
        [[nodiscard]] auto Submit(F&& task) -> Future<std::invoke_result_t<std::decay_t<F>&>>
        {
            return Schedule(std::forward<F>(task), 0, Time::TimeUnit::Nanoseconds);
        }

        /// @brief Run @p task once after @p delay units. A non-positive delay runs it immediately.
        template<typename F>
            requires std::invocable<std::decay_t<F>&>
        [[nodiscard]] auto Schedule(F&& task, Int64 delay, Time::TimeUnit unit)
                -> Future<std::invoke_result_t<std::decay_t<F>&>>
        {
            using Task   = std::decay_t<F>;
            using Result = std::invoke_result_t<Task&>;

            Task callable(std::forward<F>(task));
            if constexpr (std::is_constructible_v<bool, Task&>)
            {
                if (!static_cast<bool>(callable))
                {
                    throw Exceptions::NullArgumentException("task");
                }
            }

            auto       state    = std::make_shared<detail::FutureState<Result>>();
            const auto deadline = Time::MonotonicClock::After(Time::Duration::Of(delay, unit));

            m_core->Submit([&](IScheduledExecutor&                         pool,
                               const std::shared_ptr<detail::UnitTicket>&  ticket,
                               const std::weak_ptr<IScheduledExecutor>&) {
                state->SetCancelHook([ticket]() { ticket->ReleaseIfArmed(); });
                WorkItem item(detail::OneShotItem<Task, Result>(std::move(callable), state, ticket));
                if (delay <= 0)
                {
                    pool.Execute(std::move(item));
                }
                else
                {
                    pool.ExecuteAt(std::move(item), deadline);
                }
            });
            return Future<Result>(std::move(state));
        }

        /// @brief Run @p task every @p period units, measured between scheduled start times.
        ///
        /// A run that overruns its slot delays the next one; runs never overlap.
        /// @throws InvalidArgumentException if @p period is not positive.
        /// @throws NullArgumentException if @p task is empty.
        Cancellable ScheduleAtFixedRate(PeriodicTask   task,
                                        Int64          initialDelay,
                                        Int64          period,
                                        Time::TimeUnit unit,
                                        ErrorHandler   onError = ErrorHandler::Silent());

        /// @brief Run @p task repeatedly, waiting @p delay units after each run completes.
        /// @throws InvalidArgumentException if @p delay is not positive.
        /// @throws NullArgumentException if @p task is empty.
        Cancellable ScheduleWithFixedDelay(PeriodicTask   task,
                                           Int64          initialDelay,
                                           Int64          delay,
                                           Time::TimeUnit unit,
                                           ErrorHandler   onError = ErrorHandler::Silent());

        /// @brief Whether a pool currently exists.
        [[nodiscard]] bool HasPool() const;

        /// @brief Units currently counted against the pool.
        [[nodiscard]] Int64 PendingCount() const;

        /// @brief Number of pools created so far.
        [[nodiscard]] UInt64 PoolGeneration() const;

    private:
        Cancellable SchedulePeriodic(PeriodicTask         task,
                                     Int64                initialDelay,
                                     Int64                period,
                                     Time::TimeUnit       unit,
                                     ErrorHandler         onError,
                                     detail::PeriodicMode mode);

        std::shared_ptr<detail::SchedulerCore> m_core;
    };
}// namespace Warden::Execution
