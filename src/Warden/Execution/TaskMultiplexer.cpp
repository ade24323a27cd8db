#include <Warden/Execution/TaskMultiplexer.hpp>

#include <Warden/Containers/StripedHashMap.hpp>
#include <Warden/Diagnostics/Logger.hpp>
#include <Warden/Exceptions/ArgumentException.hpp>
#include <Warden/Exceptions/RejectedExecutionException.hpp>
#include <Warden/Execution/ThisThread.hpp>
#include <Warden/Sync/LockKey.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace Warden::Execution
{
    namespace detail
    {
        struct MultiplexedTask final
        {
            explicit MultiplexedTask(TaskMultiplexer::Task fn)
                : task(std::move(fn))
            {
            }

            TaskMultiplexer::Task task;
        };

        struct TaskGroup final
        {
            std::mutex                                    tasksMutex;
            std::vector<std::shared_ptr<MultiplexedTask>> tasks;
            Cancellable                                   unit;// guarded by the group's registry lock

            void RunTick() noexcept
            {
                std::vector<std::shared_ptr<MultiplexedTask>> snapshot;
                try
                {
                    std::lock_guard guard(tasksMutex);
                    snapshot = tasks;
                } catch (const std::bad_alloc&)
                {
                    WARDEN_LOG_ERROR("TaskMultiplexer: out of memory, skipping a tick");
                    return;
                }

                for (const auto& entry: snapshot)
                {
                    try
                    {
                        entry->task();
                    } catch (const std::exception& ex)
                    {
                        WARDEN_LOG_WARN("TaskMultiplexer: task failed: {}", ex.what());
                    } catch (...)
                    {
                        WARDEN_LOG_WARN("TaskMultiplexer: task failed with a non-standard exception");
                    }
                }
            }
        };

        struct MultiplexerState final
        {
            MultiplexerState(SelfReleasingScheduler& scheduler, Sync::KeyedLockRegistry& registry) noexcept
                : scheduler(scheduler)
                , registry(registry)
            {
            }

            [[nodiscard]] Sync::LockKey GroupKey(Int64 period, Time::TimeUnit unit) const
            {
                return Sync::LockKey::Of(Sync::KeyValue::Identity(this), period, Time::ToString(unit));
            }

            /// Remove @p task from the group at @p key; drops the group once empty.
            /// Caller holds the registry lock for @p key.
            void Detach(const Sync::LockKey& key, const std::shared_ptr<MultiplexedTask>& task)
            {
                std::shared_ptr<TaskGroup> group;
                if (!groups.TryGet(key, group))
                {
                    return;
                }

                bool empty = false;
                {
                    std::lock_guard guard(group->tasksMutex);
                    auto&           tasks = group->tasks;
                    tasks.erase(std::remove(tasks.begin(), tasks.end(), task), tasks.end());
                    empty = tasks.empty();
                }
                if (empty)
                {
                    DropGroup(key, *group);
                }
            }

            /// Caller holds the registry lock for @p key.
            void DropGroup(const Sync::LockKey& key, TaskGroup& group)
            {
                (void) group.unit.Cancel();
                (void) groups.Remove(key);
                WARDEN_LOG_DEBUG("TaskMultiplexer: group {} dropped", key.ToString());
            }

            SelfReleasingScheduler&  scheduler;
            Sync::KeyedLockRegistry& registry;

            Containers::StripedHashMap<Sync::LockKey, std::shared_ptr<TaskGroup>, Sync::LockKeyHash> groups;

            std::atomic<bool>  shutdown {false};
            std::atomic<Int32> activeCalls {0};
        };

        namespace
        {
            class TaskRegistration final : public ICancellationTarget
            {
            public:
                TaskRegistration(std::weak_ptr<MultiplexerState> state, Sync::LockKey key,
                                 std::shared_ptr<MultiplexedTask> task) noexcept
                    : m_state(std::move(state))
                    , m_key(std::move(key))
                    , m_task(std::move(task))
                {
                }

                bool Cancel() noexcept override
                {
                    bool expected = false;
                    if (!m_cancelled.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
                    {
                        return false;
                    }
                    auto state = m_state.lock();
                    if (!state)
                    {
                        return true;
                    }
                    try
                    {
                        auto handle = state->registry.Lock(m_key);
                        state->Detach(m_key, m_task);
                    } catch (const std::exception& ex)
                    {
                        WARDEN_LOG_ERROR("TaskMultiplexer: failed to remove a cancelled task: {}", ex.what());
                    }
                    return true;
                }

                [[nodiscard]] bool IsCancelled() const noexcept override
                {
                    return m_cancelled.load(std::memory_order_acquire);
                }

                [[nodiscard]] bool IsDone() const noexcept override
                {
                    if (IsCancelled())
                    {
                        return true;
                    }
                    auto state = m_state.lock();
                    return !state || state->shutdown.load(std::memory_order_acquire);
                }

            private:
                std::weak_ptr<MultiplexerState>  m_state;
                Sync::LockKey                    m_key;
                std::shared_ptr<MultiplexedTask> m_task;
                std::atomic<bool>                m_cancelled {false};
            };

            struct CallScope final
            {
                explicit CallScope(std::atomic<Int32>& counter) noexcept
                    : counter(counter)
                {
                    counter.fetch_add(1, std::memory_order_acq_rel);
                }

                ~CallScope()
                {
                    counter.fetch_sub(1, std::memory_order_acq_rel);
                }

                CallScope(const CallScope&)            = delete;
                CallScope& operator=(const CallScope&) = delete;

                std::atomic<Int32>& counter;
            };
        }// namespace
    }// namespace detail

    TaskMultiplexer::TaskMultiplexer(SelfReleasingScheduler& scheduler, Sync::KeyedLockRegistry& registry)
        : m_state(std::make_shared<detail::MultiplexerState>(scheduler, registry))
    {
    }

    TaskMultiplexer::~TaskMultiplexer()
    {
        Shutdown();
    }

    Cancellable TaskMultiplexer::Execute(Int64 period, Time::TimeUnit unit, Task task)
    {
        if (period <= 0)
        {
            throw Exceptions::InvalidArgumentException("TaskMultiplexer: period must be positive, got " +
                                                       std::to_string(period));
        }
        if (!task)
        {
            throw Exceptions::NullArgumentException("task");
        }

        auto&             state = *m_state;
        detail::CallScope scope(state.activeCalls);
        if (state.shutdown.load(std::memory_order_acquire))
        {
            throw Exceptions::RejectedExecutionException("TaskMultiplexer: multiplexer is shut down");
        }

        const auto key    = state.GroupKey(period, unit);
        auto       handle = state.registry.Lock(key);

        auto entry = std::make_shared<detail::MultiplexedTask>(std::move(task));

        std::shared_ptr<detail::TaskGroup> group;
        if (!state.groups.TryGet(key, group))
        {
            group = std::make_shared<detail::TaskGroup>();
            group->tasks.push_back(entry);

            std::weak_ptr<detail::TaskGroup> weakGroup = group;
            group->unit = state.scheduler.ScheduleAtFixedRate(
                    [weakGroup]() {
                        if (auto live = weakGroup.lock())
                        {
                            live->RunTick();
                        }
                    },
                    period, period, unit);
            (void) state.groups.Insert(key, group);
            WARDEN_LOG_DEBUG("TaskMultiplexer: group {} created", key.ToString());
        }
        else
        {
            std::lock_guard guard(group->tasksMutex);
            group->tasks.push_back(entry);
        }

        return Cancellable(std::make_shared<detail::TaskRegistration>(m_state, key, std::move(entry)));
    }

    void TaskMultiplexer::Shutdown() noexcept
    {
        auto& state = *m_state;
        if (state.shutdown.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }
        // Let calls that passed the shutdown check finish publishing their groups.
        while (state.activeCalls.load(std::memory_order_acquire) != 0)
        {
            ThisThread::YieldNow();
        }

        try
        {
            std::vector<Sync::LockKey> keys;
            state.groups.ForEach([&keys](const Sync::LockKey& key, const std::shared_ptr<detail::TaskGroup>&) {
                keys.push_back(key);
            });
            for (const auto& key: keys)
            {
                auto                               handle = state.registry.Lock(key);
                std::shared_ptr<detail::TaskGroup> group;
                if (state.groups.TryGet(key, group))
                {
                    {
                        std::lock_guard guard(group->tasksMutex);
                        group->tasks.clear();
                    }
                    state.DropGroup(key, *group);
                }
            }
        } catch (const std::exception& ex)
        {
            WARDEN_LOG_ERROR("TaskMultiplexer: shutdown incomplete: {}", ex.what());
        }
    }

    bool TaskMultiplexer::IsShutdown() const noexcept
    {
        return m_state->shutdown.load(std::memory_order_acquire);
    }

    UIntSize TaskMultiplexer::GroupCount() const
    {
        return m_state->groups.Size();
    }
}// namespace Warden::Execution
