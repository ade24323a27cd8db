#pragma once

#include <stdexcept>
#include <string>

namespace Warden::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions in Warden.
    ///
    /// @details
    /// `Exception` is the base class for all exceptions in Warden. It provides a common interface
    /// for exception handling and allows for retrieval of the exception message. Catching
    /// `Exception` catches every error the library reports; catching `std::runtime_error` does too.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with an owned message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        /// @return A string containing the exception message.
        [[nodiscard]] const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace Warden::Exceptions
