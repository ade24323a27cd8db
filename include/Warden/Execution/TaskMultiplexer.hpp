/// @file TaskMultiplexer.hpp
/// @brief Runs many tasks that share a cadence through one periodic unit per cadence.
#pragma once

#include <Warden/Defines.hpp>
#include <Warden/Execution/Cancellable.hpp>
#include <Warden/Execution/SelfReleasingScheduler.hpp>
#include <Warden/Primitives.hpp>
#include <Warden/Sync/KeyedLockRegistry.hpp>
#include <Warden/Time/TimeUnit.hpp>

#include <functional>
#include <memory>

namespace Warden::Execution
{
    namespace detail
    {
        struct MultiplexerState;
    }

    /// @brief Groups tasks by period and runs each group on a single fixed-rate unit.
    ///
    /// The first task for a cadence creates its group and schedules the group's unit, with the
    /// first run one period after creation. Every tick runs the group's tasks in the order they
    /// were added; a task that throws is logged and does not stop the others. Cancelling the
    /// last task of a group cancels the group's unit, which lets the scheduler release its pool.
    ///
    /// Group membership is mutated under the registry lock of the group's key, so Execute and
    /// Cancel for one cadence are serialized while different cadences proceed independently.
    /// The scheduler and the registry must outlive the multiplexer.
    class WARDEN_API TaskMultiplexer final
    {
    public:
        using Task = std::function<void()>;

        TaskMultiplexer(SelfReleasingScheduler& scheduler, Sync::KeyedLockRegistry& registry);

        /// @brief Shutdown().
        ~TaskMultiplexer();

        TaskMultiplexer(const TaskMultiplexer&)            = delete;
        TaskMultiplexer& operator=(const TaskMultiplexer&) = delete;

        /// @brief Add @p task to the group running every @p period units.
        /// @return Handle that removes this task from its group.
        /// @throws InvalidArgumentException if @p period is not positive.
        /// @throws NullArgumentException if @p task is empty.
        /// @throws RejectedExecutionException after Shutdown().
        Cancellable Execute(Int64 period, Time::TimeUnit unit, Task task);

        /// @brief Cancel every group. Further Execute calls are rejected.
        void Shutdown() noexcept;

        [[nodiscard]] bool IsShutdown() const noexcept;

        /// @brief Number of cadences with at least one live task.
        [[nodiscard]] UIntSize GroupCount() const;

    private:
        std::shared_ptr<detail::MultiplexerState> m_state;
    };
}// namespace Warden::Execution
