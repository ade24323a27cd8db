#pragma once

/// @file ArgumentException.hpp
/// @brief Declares the configuration error types raised by constructors and entry points.

#include <Warden/Exceptions/Exception.hpp>

#include <string>
#include <string_view>

namespace Warden::Exceptions
{
    /// @class InvalidArgumentException
    /// @brief Thrown when an argument is outside the range an operation accepts.
    ///
    /// @details
    /// Raised eagerly, before any state is touched: a scheduler constructed with a negative
    /// pool size, a non-positive period, an empty thread name prefix.
    class InvalidArgumentException : public Exception
    {
    public:
        /// @brief Constructor with a C-style string message.
        /// @param message The exception message.
        explicit InvalidArgumentException(const char* message)
            : Exception(message)
        {
        }

        /// @brief Constructor with a string message.
        /// @param message The exception message.
        explicit InvalidArgumentException(const std::string& message)
            : Exception(message)
        {
        }
    };

    /// @class NullArgumentException
    /// @brief Thrown when a required callable, factory or handler is empty.
    class NullArgumentException : public InvalidArgumentException
    {
    public:
        /// @brief Constructor naming the offending parameter.
        /// @param parameter Name of the parameter that was empty.
        explicit NullArgumentException(std::string_view parameter)
            : InvalidArgumentException(std::string(parameter) + " must not be null")
            , m_parameter(parameter)
        {
        }

        /// @brief Name of the parameter that was empty.
        [[nodiscard]] const std::string& GetParameter() const noexcept { return m_parameter; }

    private:
        std::string m_parameter;
    };
}// namespace Warden::Exceptions
