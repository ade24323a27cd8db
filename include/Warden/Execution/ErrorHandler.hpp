/// @file ErrorHandler.hpp
/// @brief Failure policy for periodic units.
#pragma once

#include <Warden/Exceptions/ArgumentException.hpp>

#include <exception>
#include <functional>
#include <utility>

namespace Warden::Execution
{
    /// @brief Receives the failure of one periodic iteration.
    ///
    /// `Silent()` swallows the failure and the unit keeps ticking. A custom handler sees the
    /// `std::exception_ptr`; if the handler itself throws, the unit stops for good.
    class ErrorHandler final
    {
    public:
        using Callback = std::function<void(std::exception_ptr)>;

        [[nodiscard]] static ErrorHandler Silent() noexcept { return ErrorHandler(); }

        /// @throws NullArgumentException if @p callback is empty.
        explicit ErrorHandler(Callback callback)
            : m_callback(std::move(callback))
        {
            if (!m_callback)
            {
                throw Exceptions::NullArgumentException("onError");
            }
        }

        [[nodiscard]] bool IsSilent() const noexcept { return !m_callback; }

        void operator()(std::exception_ptr error) const
        {
            if (m_callback)
            {
                m_callback(std::move(error));
            }
        }

    private:
        ErrorHandler() noexcept = default;

        Callback m_callback {};
    };
}// namespace Warden::Execution
