#pragma once

#include <Warden/Exceptions/Exception.hpp>

namespace Warden::Exceptions
{
    /// @brief Reported by Future::Get when the task was cancelled before it started.
    class TaskCanceledException : public Exception
    {
    public:
        TaskCanceledException()
            : Exception("Task was canceled")
        {
        }
    };

    /// @brief Reported by a timed Future::Get when the result is not ready in time.
    class TimeoutException : public Exception
    {
    public:
        TimeoutException()
            : Exception("Timed out waiting for task result")
        {
        }
    };
}// namespace Warden::Exceptions
