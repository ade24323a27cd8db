/// @file IScheduledExecutor.hpp
/// @brief Abstract interface of the worker pools behind a SelfReleasingScheduler.
#pragma once

#include <Warden/Execution/WorkItem.hpp>
#include <Warden/Time/Duration.hpp>
#include <Warden/Time/TimePoint.hpp>

namespace Warden::Execution
{
    /// @brief Pure virtual interface for executors that run work now or at a monotonic deadline.
    ///
    /// Implementations are thread-safe. `Execute` and `ExecuteAt` throw
    /// `RejectedExecutionException` once the executor is shut down. Work items are destroyed
    /// without running when they are dropped by `ShutdownNow` or by `Shutdown` (delayed work).
    class IScheduledExecutor
    {
    public:
        virtual ~IScheduledExecutor() = default;

        /// @brief Run @p item as soon as a worker is free.
        virtual void Execute(WorkItem item) = 0;

        /// @brief Run @p item no earlier than @p resumeAt.
        virtual void ExecuteAt(WorkItem item, Time::TimePoint resumeAt) = 0;

        /// @brief Stop accepting work, run what is already due, drop delayed work. Does not block.
        virtual void Shutdown() noexcept = 0;

        /// @brief Stop accepting work and drop everything still queued. Does not block.
        virtual void ShutdownNow() noexcept = 0;

        [[nodiscard]] virtual bool IsShutdown() const noexcept = 0;

        /// @brief Block until every worker has exited or @p timeout elapses.
        /// @return true if the executor terminated.
        virtual bool AwaitTermination(Time::Duration timeout) noexcept = 0;
    };
}// namespace Warden::Execution
