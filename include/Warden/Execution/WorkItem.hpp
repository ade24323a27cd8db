/// @file WorkItem.hpp
/// @brief A move-only job handed to an executor.
#pragma once

#include <Warden/Exceptions/ArgumentException.hpp>

#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace Warden::Execution
{
    /// @brief A move-only unit of work that can be executed by an executor.
    ///
    /// @note `Invoke()` is `noexcept`; any exception escaping the job calls `std::terminate()`.
    /// Jobs that may fail catch and route their own errors.
    class WorkItem final
    {
    public:
        using Job = std::move_only_function<void()>;

        WorkItem() noexcept = default;

        explicit WorkItem(Job job)
            : m_job(std::move(job))
        {
            if (!m_job)
            {
                throw Exceptions::NullArgumentException("job");
            }
        }

        template<typename F>
            requires(!std::is_same_v<std::remove_cvref_t<F>, WorkItem>) &&
                    (!std::is_same_v<std::remove_cvref_t<F>, Job>) &&
                    std::invocable<std::remove_reference_t<F>&>
        explicit WorkItem(F&& job)
            : m_job(std::forward<F>(job))
        {
        }

        WorkItem(WorkItem&&) noexcept            = default;
        WorkItem& operator=(WorkItem&&) noexcept = default;

        WorkItem(const WorkItem&)            = delete;
        WorkItem& operator=(const WorkItem&) = delete;

        [[nodiscard]] bool IsEmpty() const noexcept
        {
            return !m_job;
        }

        void Invoke() noexcept
        {
            if (m_job)
            {
                m_job();
            }
        }

        void Reset() noexcept
        {
            m_job = nullptr;
        }

    private:
        Job m_job {};
    };
}// namespace Warden::Execution
