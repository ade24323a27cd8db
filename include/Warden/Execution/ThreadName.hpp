/// @file ThreadName.hpp
/// @brief Thread name plus the shortened form the OS keeps.
#pragma once

#include <Warden/Execution/ThisThread.hpp>
#include <Warden/Primitives.hpp>

#include <algorithm>
#include <string>
#include <string_view>

namespace Warden::Execution
{
    /// @brief Name of a thread, kept in full for diagnostics.
    ///
    /// The OS stores at most ThisThread::kMaxNameBytes bytes. OsName() shortens a longer name
    /// by trimming its stem so that a numeric "-<index>" suffix survives: with a 15-byte limit,
    /// "warden-scheduler-12" becomes "warden-schedu-12".
    class ThreadName final
    {
    public:
        ThreadName() = default;

        explicit ThreadName(std::string_view name)
            : m_name(name)
            , m_osName(Shorten(name))
        {
        }

        [[nodiscard]] bool Empty() const noexcept { return m_name.empty(); }

        [[nodiscard]] UIntSize Size() const noexcept { return m_name.size(); }

        [[nodiscard]] std::string_view View() const noexcept { return m_name; }

        /// @brief Name as handed to the OS.
        [[nodiscard]] std::string_view OsName() const noexcept { return m_osName; }

    private:
        static std::string Shorten(std::string_view name)
        {
            constexpr auto limit = ThisThread::kMaxNameBytes;
            if (name.size() <= limit)
            {
                return std::string(name);
            }

            const auto dash = name.rfind('-');
            if (dash != std::string_view::npos && dash > 0 && dash + 1 < name.size())
            {
                const auto suffix = name.substr(dash);
                const bool numeric =
                        std::all_of(suffix.begin() + 1, suffix.end(), [](char c) { return c >= '0' && c <= '9'; });
                if (numeric && suffix.size() < limit)
                {
                    std::string shortened(name.substr(0, limit - suffix.size()));
                    shortened.append(suffix);
                    return shortened;
                }
            }
            return std::string(name.substr(0, limit));
        }

        std::string m_name {};
        std::string m_osName {};
    };
}// namespace Warden::Execution
