/// @file Logger.hpp
/// @brief Process-wide leveled logger formatted with {fmt}.
///
/// Messages are formatted on the calling thread and handed synchronously to a single sink. The
/// default sink writes `[Warden][LEVEL] message` lines to stderr; tests and host applications may
/// install their own. Logging never throws: formatting errors produce a placeholder message and a
/// failing sink is ignored.
#pragma once

#include <Warden/Config.hpp>
#include <Warden/Defines.hpp>
#include <Warden/Primitives.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace Warden::Diagnostics
{
    enum class LogLevel : UInt8
    {
        Trace   = 0,
        Debug   = 1,
        Info    = 2,
        Warning = 3,
        Error   = 4,
        Off     = 5,
    };

    [[nodiscard]] WARDEN_API std::string_view ToString(LogLevel level) noexcept;

    /// @brief Parse `trace|debug|info|warning|error|off` (case-insensitive, `warn` accepted).
    [[nodiscard]] WARDEN_API std::optional<LogLevel> ParseLogLevel(std::string_view text) noexcept;

    class WARDEN_API Logger
    {
    public:
        using Sink = std::function<void(LogLevel, std::string_view)>;

        /// @brief The process-wide logger. The initial level comes from `WARDEN_LOG_LEVEL`.
        static Logger& Instance() noexcept;

        Logger(const Logger&)            = delete;
        Logger& operator=(const Logger&) = delete;

        void SetLevel(LogLevel level) noexcept { m_level.store(level, std::memory_order_relaxed); }

        [[nodiscard]] LogLevel GetLevel() const noexcept { return m_level.load(std::memory_order_relaxed); }

        [[nodiscard]] bool ShouldLog(LogLevel level) const noexcept
        {
            return level != LogLevel::Off && static_cast<UInt8>(level) >= static_cast<UInt8>(GetLevel());
        }

        /// @brief Replace the sink. An empty function restores the stderr sink.
        void SetSink(Sink sink);
        void ResetSink();

        template<LogLevel Level, typename... Args>
        void Log(fmt::format_string<Args...> format, Args&&... args) noexcept
        {
            if constexpr (static_cast<int>(Level) >= WARDEN_LOG_COMPILE_LEVEL)
            {
                if (!ShouldLog(Level))
                    return;
                try
                {
                    fmt::memory_buffer buffer;
                    fmt::format_to(std::back_inserter(buffer), format, std::forward<Args>(args)...);
                    Write(Level, std::string_view(buffer.data(), buffer.size()));
                }
                catch (const std::exception&)
                {
                    Write(Level, "[FORMAT ERROR]");
                }
            }
        }

    private:
        Logger() noexcept;

        void        Write(LogLevel level, std::string_view message) noexcept;
        static void WriteToStderr(LogLevel level, std::string_view message) noexcept;

        std::atomic<LogLevel> m_level {LogLevel::Warning};
        std::mutex            m_sinkMutex;
        Sink                  m_sink;
    };
}// namespace Warden::Diagnostics

#define WARDEN_LOG_TRACE(...) \
    ::Warden::Diagnostics::Logger::Instance().Log<::Warden::Diagnostics::LogLevel::Trace>(__VA_ARGS__)
#define WARDEN_LOG_DEBUG(...) \
    ::Warden::Diagnostics::Logger::Instance().Log<::Warden::Diagnostics::LogLevel::Debug>(__VA_ARGS__)
#define WARDEN_LOG_INFO(...) \
    ::Warden::Diagnostics::Logger::Instance().Log<::Warden::Diagnostics::LogLevel::Info>(__VA_ARGS__)
#define WARDEN_LOG_WARN(...) \
    ::Warden::Diagnostics::Logger::Instance().Log<::Warden::Diagnostics::LogLevel::Warning>(__VA_ARGS__)
#define WARDEN_LOG_ERROR(...) \
    ::Warden::Diagnostics::Logger::Instance().Log<::Warden::Diagnostics::LogLevel::Error>(__VA_ARGS__)
