#include <Warden/Diagnostics/Logger.hpp>

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace Warden::Diagnostics
{
    std::string_view ToString(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Trace:
                return "TRACE";
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warning:
                return "WARNING";
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Off:
                return "OFF";
        }
        return "UNKNOWN";
    }

    std::optional<LogLevel> ParseLogLevel(std::string_view text) noexcept
    {
        std::string lowered;
        try
        {
            lowered.reserve(text.size());
            for (const char c: text)
                lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } catch (const std::bad_alloc&)
        {
            return std::nullopt;
        }

        if (lowered == "trace")
            return LogLevel::Trace;
        if (lowered == "debug")
            return LogLevel::Debug;
        if (lowered == "info")
            return LogLevel::Info;
        if (lowered == "warning" || lowered == "warn")
            return LogLevel::Warning;
        if (lowered == "error")
            return LogLevel::Error;
        if (lowered == "off")
            return LogLevel::Off;
        return std::nullopt;
    }

    Logger& Logger::Instance() noexcept
    {
        static Logger instance;
        return instance;
    }

    Logger::Logger() noexcept
    {
        if (const char* env = std::getenv(WARDEN_LOG_LEVEL_ENV))
        {
            if (const auto level = ParseLogLevel(env))
                m_level.store(*level, std::memory_order_relaxed);
        }
    }

    void Logger::SetSink(Sink sink)
    {
        std::lock_guard guard(m_sinkMutex);
        m_sink = std::move(sink);
    }

    void Logger::ResetSink()
    {
        SetSink(Sink {});
    }

    void Logger::Write(LogLevel level, std::string_view message) noexcept
    {
        std::lock_guard guard(m_sinkMutex);
        if (!m_sink)
        {
            WriteToStderr(level, message);
            return;
        }
        try
        {
            m_sink(level, message);
        } catch (const std::exception& ex)
        {
            WriteToStderr(LogLevel::Error, ex.what());
        }
    }

    void Logger::WriteToStderr(LogLevel level, std::string_view message) noexcept
    {
        try
        {
            fmt::print(stderr, "[Warden][{}] {}\n", ToString(level), message);
        } catch (const std::exception&)
        {
            std::fputs("[Warden] log write failed\n", stderr);
        }
    }
}// namespace Warden::Diagnostics
