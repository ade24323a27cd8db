#include <Warden/Execution/ScheduledThreadPool.hpp>

#include <Warden/Config.hpp>
#include <Warden/Diagnostics/Logger.hpp>
#include <Warden/Exceptions/RejectedExecutionException.hpp>
#include <Warden/Sync/AtomicCondition.hpp>
#include <Warden/Sync/SpinLock.hpp>
#include <Warden/Time/MonotonicClock.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <new>
#include <utility>
#include <vector>

namespace Warden::Execution
{
    namespace detail
    {
        using TimerEntry = std::pair<Time::TimePoint, WorkItem>;

        struct TimerEntryCompare
        {
            bool operator()(const TimerEntry& a, const TimerEntry& b) const noexcept
            {
                return a.first > b.first;
            }
        };

        struct PoolState
        {
            // Injection queue for external producers and the timer thread.
            Sync::SpinLock       injectionLock {};
            std::deque<WorkItem> injection {};
            Sync::AtomicCondition workWake;

            std::mutex              timersMutex;
            std::vector<TimerEntry> timerHeap {};
            Sync::AtomicCondition   timerWake;

            std::atomic<bool> shutdown {false};
            std::atomic<bool> stopNow {false};

            std::atomic<Int32>    liveThreads {0};
            Sync::AtomicCondition terminated;

            void Enqueue(WorkItem item)
            {
                {
                    std::lock_guard guard(injectionLock);
                    injection.push_back(std::move(item));
                }
                workWake.NotifyOne();
            }

            [[nodiscard]] WorkItem TryDequeue() noexcept
            {
                std::lock_guard guard(injectionLock);
                if (injection.empty())
                {
                    return {};
                }
                WorkItem out = std::move(injection.front());
                injection.pop_front();
                return out;
            }

            // Items are destroyed after the locks are dropped: their destructors may call back
            // into whoever owns this pool.
            [[nodiscard]] std::deque<WorkItem> TakeReady() noexcept
            {
                std::deque<WorkItem> out;
                std::lock_guard      guard(injectionLock);
                out.swap(injection);
                return out;
            }

            [[nodiscard]] std::vector<TimerEntry> TakeTimers() noexcept
            {
                std::vector<TimerEntry> out;
                std::lock_guard         guard(timersMutex);
                out.swap(timerHeap);
                return out;
            }

            void OnThreadExit() noexcept
            {
                if (liveThreads.fetch_sub(1, std::memory_order_acq_rel) == 1)
                {
                    terminated.NotifyAll();
                }
            }

            void WorkerLoop() noexcept
            {
                for (;;)
                {
                    if (stopNow.load(std::memory_order_acquire))
                    {
                        break;
                    }

                    WorkItem work = TryDequeue();
                    if (!work.IsEmpty())
                    {
                        work.Invoke();
                        continue;
                    }

                    const auto observedWakeGeneration = workWake.Load();
                    work                              = TryDequeue();
                    if (!work.IsEmpty())
                    {
                        work.Invoke();
                        continue;
                    }
                    // Graceful shutdown: leave once the ready queue is drained.
                    if (shutdown.load(std::memory_order_acquire))
                    {
                        break;
                    }
                    workWake.Wait(observedWakeGeneration);
                }
                OnThreadExit();
            }

            void TimerLoop() noexcept
            {
                while (!shutdown.load(std::memory_order_acquire))
                {
                    const auto            observedWakeGeneration = timerWake.Load();
                    std::vector<WorkItem> ready;
                    Time::TimePoint       nextWakeAt {};
                    bool                  hasNextWake = false;

                    {
                        std::lock_guard<std::mutex> lock(timersMutex);
                        const auto                  now = Time::MonotonicClock::Now();
                        while (!timerHeap.empty() && timerHeap.front().first <= now)
                        {
                            std::pop_heap(timerHeap.begin(), timerHeap.end(), TimerEntryCompare {});
                            ready.push_back(std::move(timerHeap.back().second));
                            timerHeap.pop_back();
                        }

                        if (!timerHeap.empty())
                        {
                            hasNextWake = true;
                            nextWakeAt  = timerHeap.front().first;
                        }
                    }

                    for (auto& item: ready)
                    {
                        if (stopNow.load(std::memory_order_acquire))
                        {
                            break;
                        }
                        try
                        {
                            Enqueue(std::move(item));
                        } catch (const std::bad_alloc&)
                        {
                            WARDEN_LOG_ERROR("ScheduledThreadPool: out of memory moving a due timer to the ready queue");
                        }
                    }
                    ready.clear();

                    if (shutdown.load(std::memory_order_acquire))
                    {
                        break;
                    }

                    if (!hasNextWake)
                    {
                        timerWake.Wait(observedWakeGeneration);
                        continue;
                    }

                    const auto now = Time::MonotonicClock::Now();
                    if (nextWakeAt <= now)
                    {
                        continue;
                    }
                    (void) timerWake.WaitFor(observedWakeGeneration, nextWakeAt - now);
                }
                OnThreadExit();
            }
        };
    }// namespace detail

    namespace
    {
        void StartThread(IThreadFactory& factory, const std::shared_ptr<detail::PoolState>& state, bool timer)
        {
            state->liveThreads.fetch_add(1, std::memory_order_acq_rel);
            try
            {
                Thread thread = factory.NewThread([state, timer]() {
                    if (timer)
                    {
                        state->TimerLoop();
                    }
                    else
                    {
                        state->WorkerLoop();
                    }
                });
                thread.Detach();
            } catch (...)
            {
                state->OnThreadExit();
                throw;
            }
        }
    }// namespace

    ScheduledThreadPool::ScheduledThreadPool(Int32 workerCount, std::shared_ptr<IThreadFactory> threadFactory)
        : m_state(std::make_shared<detail::PoolState>())
        , m_workerCount(std::max<Int32>(1, workerCount))
    {
        if (!threadFactory)
        {
            threadFactory = std::make_shared<NamedThreadFactory>(WARDEN_DEFAULT_THREAD_PREFIX);
        }

        try
        {
            for (Int32 i = 0; i < m_workerCount; ++i)
            {
                StartThread(*threadFactory, m_state, false);
            }
            StartThread(*threadFactory, m_state, true);
        } catch (...)
        {
            ShutdownNow();
            throw;
        }
    }

    ScheduledThreadPool::~ScheduledThreadPool()
    {
        Shutdown();
    }

    void ScheduledThreadPool::Execute(WorkItem item)
    {
        if (m_state->shutdown.load(std::memory_order_acquire))
        {
            throw Exceptions::RejectedExecutionException("ScheduledThreadPool: executor is shut down");
        }
        m_state->Enqueue(std::move(item));
    }

    void ScheduledThreadPool::ExecuteAt(WorkItem item, Time::TimePoint resumeAt)
    {
        if (resumeAt <= Time::MonotonicClock::Now())
        {
            Execute(std::move(item));
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_state->timersMutex);
            // Checked under the timer lock so Shutdown() cannot miss an entry pushed after its sweep.
            if (m_state->shutdown.load(std::memory_order_acquire))
            {
                throw Exceptions::RejectedExecutionException("ScheduledThreadPool: executor is shut down");
            }
            m_state->timerHeap.emplace_back(resumeAt, std::move(item));
            std::push_heap(m_state->timerHeap.begin(), m_state->timerHeap.end(), detail::TimerEntryCompare {});
        }
        m_state->timerWake.NotifyOne();
    }

    void ScheduledThreadPool::Shutdown() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(m_state->timersMutex);
            m_state->shutdown.store(true, std::memory_order_release);
        }
        auto dropped = m_state->TakeTimers();
        m_state->workWake.NotifyAll();
        m_state->timerWake.NotifyAll();
        dropped.clear();
    }

    void ScheduledThreadPool::ShutdownNow() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(m_state->timersMutex);
            m_state->shutdown.store(true, std::memory_order_release);
        }
        m_state->stopNow.store(true, std::memory_order_release);
        auto droppedTimers = m_state->TakeTimers();
        auto droppedReady  = m_state->TakeReady();
        m_state->workWake.NotifyAll();
        m_state->timerWake.NotifyAll();
        droppedTimers.clear();
        droppedReady.clear();
    }

    bool ScheduledThreadPool::IsShutdown() const noexcept
    {
        return m_state->shutdown.load(std::memory_order_acquire);
    }

    bool ScheduledThreadPool::AwaitTermination(Time::Duration timeout) noexcept
    {
        const auto deadline = Time::MonotonicClock::After(timeout);
        for (;;)
        {
            const auto observed = m_state->terminated.Load();
            if (m_state->liveThreads.load(std::memory_order_acquire) == 0)
            {
                return true;
            }
            const auto now = Time::MonotonicClock::Now();
            if (deadline <= now)
            {
                return false;
            }
            (void) m_state->terminated.WaitFor(observed, deadline - now);
        }
    }

    Int32 ScheduledThreadPool::LiveThreadCount() const noexcept
    {
        return m_state->liveThreads.load(std::memory_order_acquire);
    }
}// namespace Warden::Execution
