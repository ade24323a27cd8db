#pragma once

/// @file LockOwnershipException.hpp
/// @brief Declares the LockOwnershipException class.

#include <Warden/Exceptions/Exception.hpp>

#include <string>

namespace Warden::Exceptions
{
    /// @class LockOwnershipException
    /// @brief Thrown when a lock is released by a thread that does not hold it.
    ///
    /// @details
    /// This is a programmer error: the release was issued from the wrong thread, or the same
    /// handle was released twice. The lock state is left untouched.
    class LockOwnershipException : public Exception
    {
    public:
        explicit LockOwnershipException(const std::string& message)
            : Exception(message)
        {
        }
    };
}// namespace Warden::Exceptions
