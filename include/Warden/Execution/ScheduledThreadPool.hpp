/// @file ScheduledThreadPool.hpp
/// @brief Fixed-size worker pool with a timer thread for delayed work.
#pragma once

#include <Warden/Defines.hpp>
#include <Warden/Execution/IScheduledExecutor.hpp>
#include <Warden/Execution/ThreadFactory.hpp>
#include <Warden/Primitives.hpp>

#include <memory>

namespace Warden::Execution
{
    namespace detail
    {
        struct PoolState;
    }

    /// @brief Executor that dispatches work items onto a fixed set of worker threads.
    ///
    /// Ready work goes through one shared injection queue; delayed work waits in a timer heap
    /// serviced by a dedicated timer thread, which moves it to the injection queue once due.
    ///
    /// All threads are detached and share ownership of the pool's internal state, so the pool
    /// object may be destroyed (or shut down) from one of its own workers. Shutting down never
    /// blocks; use AwaitTermination() to wait for the threads to exit.
    class WARDEN_API ScheduledThreadPool final : public IScheduledExecutor
    {
    public:
        /// @brief Start `max(1, workerCount)` workers plus the timer thread.
        /// @param threadFactory Factory for all pool threads. Null selects a NamedThreadFactory.
        /// @throws Whatever the thread factory throws, after stopping the threads already started.
        explicit ScheduledThreadPool(Int32 workerCount, std::shared_ptr<IThreadFactory> threadFactory = nullptr);

        /// @brief Graceful Shutdown(); does not wait for the threads.
        ~ScheduledThreadPool() override;

        ScheduledThreadPool(const ScheduledThreadPool&)            = delete;
        ScheduledThreadPool& operator=(const ScheduledThreadPool&) = delete;

        void Execute(WorkItem item) override;
        void ExecuteAt(WorkItem item, Time::TimePoint resumeAt) override;

        void Shutdown() noexcept override;
        void ShutdownNow() noexcept override;

        [[nodiscard]] bool IsShutdown() const noexcept override;

        bool AwaitTermination(Time::Duration timeout) noexcept override;

        /// @brief Pool threads (workers and timer) that have not exited yet.
        [[nodiscard]] Int32 LiveThreadCount() const noexcept;

        [[nodiscard]] Int32 WorkerCount() const noexcept { return m_workerCount; }

    private:
        std::shared_ptr<detail::PoolState> m_state;
        Int32                              m_workerCount {1};
    };
}// namespace Warden::Execution
