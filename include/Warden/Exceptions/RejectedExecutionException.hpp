#pragma once

#include <Warden/Exceptions/Exception.hpp>

#include <string>

namespace Warden::Exceptions
{
    /// @brief Thrown when an executor refuses a work item, typically because it is shut down.
    class RejectedExecutionException : public Exception
    {
    public:
        explicit RejectedExecutionException(const char* message)
            : Exception(message)
        {
        }

        explicit RejectedExecutionException(const std::string& message)
            : Exception(message)
        {
        }
    };
}// namespace Warden::Exceptions
