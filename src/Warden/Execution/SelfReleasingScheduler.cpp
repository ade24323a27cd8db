#include <Warden/Execution/SelfReleasingScheduler.hpp>

#include <Warden/Config.hpp>
#include <Warden/Diagnostics/Logger.hpp>
#include <Warden/Exceptions/Exception.hpp>
#include <Warden/Exceptions/RejectedExecutionException.hpp>
#include <Warden/Execution/ScheduledThreadPool.hpp>

#include <exception>
#include <string>

namespace Warden::Execution
{
    namespace detail
    {
        void UnitTicket::Release() noexcept
        {
            if (auto core = m_core.lock())
            {
                core->Release(m_generation);
            }
        }

        void SchedulerCore::Submit(const Submitter& submitter)
        {
            std::shared_ptr<IScheduledExecutor> orphan;
            std::exception_ptr                  failure;
            {
                std::lock_guard guard(m_mutex);
                if (m_closed)
                {
                    throw Exceptions::RejectedExecutionException("SelfReleasingScheduler: scheduler is closed");
                }
                try
                {
                    if (!m_pool)
                    {
                        auto pool = m_factory();
                        if (!pool)
                        {
                            throw Exceptions::Exception("SelfReleasingScheduler: pool factory returned null");
                        }
                        m_pool    = std::move(pool);
                        m_pending = 0;
                        ++m_generation;
                        WARDEN_LOG_DEBUG("SelfReleasingScheduler: created pool #{}", m_generation);
                    }

                    auto ticket = std::make_shared<UnitTicket>(weak_from_this(), m_generation);
                    submitter(*m_pool, ticket, std::weak_ptr<IScheduledExecutor>(m_pool));
                    if (ticket->TryArm())
                    {
                        ++m_pending;
                        return;
                    }
                    // The unit ended on a worker before it was counted.
                    WARDEN_LOG_DEBUG("SelfReleasingScheduler: unit ended during submission");
                    if (m_pending == 0)
                    {
                        orphan = std::move(m_pool);
                        m_pool.reset();
                    }
                } catch (const std::exception& ex)
                {
                    WARDEN_LOG_WARN("SelfReleasingScheduler: submission rejected, rolling back: {}", ex.what());
                    failure = std::current_exception();
                } catch (...)
                {
                    WARDEN_LOG_WARN("SelfReleasingScheduler: submission rejected, rolling back");
                    failure = std::current_exception();
                }
                if (failure && m_pending == 0 && m_pool)
                {
                    orphan = std::move(m_pool);
                    m_pool.reset();
                }
            }
            // Shut down outside the lock: dropped work items may release through this core.
            if (orphan)
            {
                orphan->Shutdown();
                orphan.reset();
                WARDEN_LOG_DEBUG("SelfReleasingScheduler: discarded a pool with no pending units");
            }
            if (failure)
            {
                std::rethrow_exception(failure);
            }
        }

        void SchedulerCore::Release(UInt64 generation) noexcept
        {
            std::shared_ptr<IScheduledExecutor> retired;
            {
                std::lock_guard guard(m_mutex);
                if (m_closed || generation != m_generation || !m_pool)
                {
                    return;
                }
                if (--m_pending > 0)
                {
                    return;
                }
                retired = std::move(m_pool);
                m_pool.reset();
            }
            retired->Shutdown();
            WARDEN_LOG_DEBUG("SelfReleasingScheduler: pool #{} torn down", generation);
        }

        void SchedulerCore::Close() noexcept
        {
            std::shared_ptr<IScheduledExecutor> retired;
            {
                std::lock_guard guard(m_mutex);
                m_closed  = true;
                m_pending = 0;
                retired   = std::move(m_pool);
                m_pool.reset();
            }
            if (retired)
            {
                retired->ShutdownNow();
            }
        }

        bool SchedulerCore::HasPool() const
        {
            std::lock_guard guard(m_mutex);
            return static_cast<bool>(m_pool);
        }

        Int64 SchedulerCore::PendingCount() const
        {
            std::lock_guard guard(m_mutex);
            return m_pending;
        }

        UInt64 SchedulerCore::PoolGeneration() const
        {
            std::lock_guard guard(m_mutex);
            return m_generation;
        }

        namespace
        {
            enum class PeriodicState : UInt8
            {
                Active,
                Cancelled,
                Terminated,
            };

            class PeriodicUnit final : public ICancellationTarget, public std::enable_shared_from_this<PeriodicUnit>
            {
            public:
                PeriodicUnit(PeriodicOptions                   options,
                             std::shared_ptr<UnitTicket>       ticket,
                             std::weak_ptr<IScheduledExecutor> pool,
                             Time::TimePoint                   firstRun)
                    : m_options(std::move(options))
                    , m_ticket(std::move(ticket))
                    , m_pool(std::move(pool))
                    , m_nextRun(firstRun)
                {
                }

                bool Cancel() noexcept override
                {
                    auto expected = PeriodicState::Active;
                    if (!m_state.compare_exchange_strong(expected, PeriodicState::Cancelled, std::memory_order_acq_rel))
                    {
                        return false;
                    }
                    m_ticket->ReleaseIfArmed();
                    return true;
                }

                [[nodiscard]] bool IsCancelled() const noexcept override
                {
                    return m_state.load(std::memory_order_acquire) == PeriodicState::Cancelled;
                }

                [[nodiscard]] bool IsDone() const noexcept override
                {
                    return !IsActive();
                }

                [[nodiscard]] Time::TimePoint NextRun() const noexcept { return m_nextRun; }

                void RunTick() noexcept;

                /// The pending tick was dropped by its executor.
                void Abandon() noexcept
                {
                    if (Terminate())
                    {
                        WARDEN_LOG_DEBUG("SelfReleasingScheduler: periodic unit dropped by its executor");
                    }
                }

            private:
                [[nodiscard]] bool IsActive() const noexcept
                {
                    return m_state.load(std::memory_order_acquire) == PeriodicState::Active;
                }

                bool Terminate() noexcept
                {
                    auto expected = PeriodicState::Active;
                    if (!m_state.compare_exchange_strong(expected, PeriodicState::Terminated, std::memory_order_acq_rel))
                    {
                        return false;
                    }
                    m_ticket->ReleaseIfArmed();
                    return true;
                }

                /// Returns false if the unit must stop.
                bool HandleFailure(std::exception_ptr error) noexcept;

                void Reschedule() noexcept;

                PeriodicOptions                      m_options;
                std::shared_ptr<UnitTicket>       m_ticket;
                std::weak_ptr<IScheduledExecutor> m_pool;
                Time::TimePoint                   m_nextRun;
                std::atomic<PeriodicState>        m_state {PeriodicState::Active};
            };

            /// Work item of one periodic tick. Destroying it unrun ends the unit.
            class TickItem final
            {
            public:
                explicit TickItem(std::shared_ptr<PeriodicUnit> unit) noexcept
                    : m_unit(std::move(unit))
                {
                }

                TickItem(TickItem&&) noexcept            = default;
                TickItem& operator=(TickItem&&) noexcept = default;

                ~TickItem()
                {
                    if (m_unit)
                    {
                        m_unit->Abandon();
                    }
                }

                void operator()() noexcept
                {
                    auto unit = std::move(m_unit);
                    unit->RunTick();
                }

            private:
                std::shared_ptr<PeriodicUnit> m_unit;
            };

            void PeriodicUnit::RunTick() noexcept
            {
                if (!IsActive())
                {
                    return;
                }

                try
                {
                    m_options.task();
                } catch (...)
                {
                    if (!HandleFailure(std::current_exception()))
                    {
                        return;
                    }
                }

                if (!IsActive())
                {
                    return;
                }
                Reschedule();
            }

            bool PeriodicUnit::HandleFailure(std::exception_ptr error) noexcept
            {
                if (m_options.onError.IsSilent())
                {
                    WARDEN_LOG_TRACE("SelfReleasingScheduler: periodic iteration failed, continuing");
                    return true;
                }
                try
                {
                    m_options.onError(std::move(error));
                    return true;
                } catch (const std::exception& ex)
                {
                    if (Terminate())
                    {
                        WARDEN_LOG_ERROR("SelfReleasingScheduler: periodic unit terminated by its error handler: {}",
                                         ex.what());
                    }
                } catch (...)
                {
                    if (Terminate())
                    {
                        WARDEN_LOG_ERROR("SelfReleasingScheduler: periodic unit terminated by its error handler");
                    }
                }
                return false;
            }

            void PeriodicUnit::Reschedule() noexcept
            {
                if (m_options.mode == PeriodicMode::FixedRate)
                {
                    m_nextRun = m_nextRun + m_options.period;
                }
                else
                {
                    m_nextRun = Time::MonotonicClock::After(m_options.period);
                }

                auto pool = m_pool.lock();
                if (!pool)
                {
                    Abandon();
                    return;
                }
                try
                {
                    pool->ExecuteAt(WorkItem(TickItem(shared_from_this())), m_nextRun);
                } catch (const std::exception& ex)
                {
                    // The refused tick item has already ended the unit if it was still active.
                    if (IsCancelled())
                    {
                        return;
                    }
                    WARDEN_LOG_WARN("SelfReleasingScheduler: periodic unit stopped, reschedule refused: {}", ex.what());
                }
            }
        }// namespace

        Cancellable SubmitPeriodic(SchedulerCore& core, PeriodicOptions options)
        {
            const auto firstRun = Time::MonotonicClock::After(options.initialDelay);

            std::shared_ptr<PeriodicUnit> unit;
            core.Submit([&](IScheduledExecutor&                        pool,
                            const std::shared_ptr<UnitTicket>&         ticket,
                            const std::weak_ptr<IScheduledExecutor>&   poolRef) {
                unit = std::make_shared<PeriodicUnit>(std::move(options), ticket, poolRef, firstRun);
                pool.ExecuteAt(WorkItem(TickItem(unit)), unit->NextRun());
            });
            return Cancellable(std::move(unit));
        }
    }// namespace detail

    namespace
    {
        SelfReleasingScheduler::PoolFactory MakeThreadPoolFactory(Int32 corePoolSize, std::shared_ptr<IThreadFactory> threadFactory)
        {
            if (corePoolSize < 0)
            {
                throw Exceptions::InvalidArgumentException("SelfReleasingScheduler: corePoolSize must not be negative, got " +
                                                           std::to_string(corePoolSize));
            }
            if (!threadFactory)
            {
                throw Exceptions::NullArgumentException("threadFactory");
            }
            return [corePoolSize, threadFactory = std::move(threadFactory)]() -> std::shared_ptr<IScheduledExecutor> {
                return std::make_shared<ScheduledThreadPool>(corePoolSize, threadFactory);
            };
        }

        SelfReleasingScheduler::PoolFactory RequirePoolFactory(SelfReleasingScheduler::PoolFactory factory)
        {
            if (!factory)
            {
                throw Exceptions::NullArgumentException("poolFactory");
            }
            return factory;
        }
    }// namespace

    SelfReleasingScheduler::SelfReleasingScheduler(Int32 corePoolSize)
        : SelfReleasingScheduler(corePoolSize, std::make_shared<NamedThreadFactory>(WARDEN_DEFAULT_THREAD_PREFIX))
    {
    }

    SelfReleasingScheduler::SelfReleasingScheduler(Int32 corePoolSize, std::shared_ptr<IThreadFactory> threadFactory)
        : m_core(std::make_shared<detail::SchedulerCore>(MakeThreadPoolFactory(corePoolSize, std::move(threadFactory))))
    {
    }

    SelfReleasingScheduler::SelfReleasingScheduler(PoolFactory poolFactory)
        : m_core(std::make_shared<detail::SchedulerCore>(RequirePoolFactory(std::move(poolFactory))))
    {
    }

    SelfReleasingScheduler::~SelfReleasingScheduler()
    {
        m_core->Close();
    }

    Cancellable SelfReleasingScheduler::ScheduleAtFixedRate(PeriodicTask   task,
                                                            Int64          initialDelay,
                                                            Int64          period,
                                                            Time::TimeUnit unit,
                                                            ErrorHandler   onError)
    {
        return SchedulePeriodic(std::move(task), initialDelay, period, unit, std::move(onError),
                                detail::PeriodicMode::FixedRate);
    }

    Cancellable SelfReleasingScheduler::ScheduleWithFixedDelay(PeriodicTask   task,
                                                               Int64          initialDelay,
                                                               Int64          delay,
                                                               Time::TimeUnit unit,
                                                               ErrorHandler   onError)
    {
        return SchedulePeriodic(std::move(task), initialDelay, delay, unit, std::move(onError),
                                detail::PeriodicMode::FixedDelay);
    }

    Cancellable SelfReleasingScheduler::SchedulePeriodic(PeriodicTask         task,
                                                         Int64                initialDelay,
                                                         Int64                period,
                                                         Time::TimeUnit       unit,
                                                         ErrorHandler         onError,
                                                         detail::PeriodicMode mode)
    {
        if (!task)
        {
            throw Exceptions::NullArgumentException("task");
        }
        if (period <= 0)
        {
            throw Exceptions::InvalidArgumentException("SelfReleasingScheduler: period must be positive, got " +
                                                       std::to_string(period));
        }

        detail::PeriodicOptions options {
                std::move(task),
                Time::Duration::Of(initialDelay, unit),
                Time::Duration::Of(period, unit),
                mode,
                std::move(onError),
        };
        return detail::SubmitPeriodic(*m_core, std::move(options));
    }

    bool SelfReleasingScheduler::HasPool() const
    {
        return m_core->HasPool();
    }

    Int64 SelfReleasingScheduler::PendingCount() const
    {
        return m_core->PendingCount();
    }

    UInt64 SelfReleasingScheduler::PoolGeneration() const
    {
        return m_core->PoolGeneration();
    }
}// namespace Warden::Execution
