/// @file Logger.cpp
/// @brief Tests for Warden::Diagnostics::Logger.

#include <Warden/Diagnostics/Logger.hpp>

#include <catch2/catch_test_macros.hpp>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Warden::Diagnostics
{
    namespace
    {
        struct CapturedLog
        {
            std::mutex                                     mutex;
            std::vector<std::pair<LogLevel, std::string>> lines;
        };

        class ScopedCapture
        {
        public:
            explicit ScopedCapture(LogLevel level)
                : m_previous(Logger::Instance().GetLevel())
            {
                Logger::Instance().SetLevel(level);
                Logger::Instance().SetSink([this](LogLevel lvl, std::string_view message) {
                    std::lock_guard guard(m_log.mutex);
                    m_log.lines.emplace_back(lvl, std::string(message));
                });
            }

            ~ScopedCapture()
            {
                Logger::Instance().ResetSink();
                Logger::Instance().SetLevel(m_previous);
            }

            std::vector<std::pair<LogLevel, std::string>> Lines()
            {
                std::lock_guard guard(m_log.mutex);
                return m_log.lines;
            }

        private:
            LogLevel    m_previous;
            CapturedLog m_log;
        };
    }// namespace

    TEST_CASE("ParseLogLevel accepts level names case-insensitively", "[Diagnostics][Logger]")
    {
        CHECK(ParseLogLevel("trace") == LogLevel::Trace);
        CHECK(ParseLogLevel("DEBUG") == LogLevel::Debug);
        CHECK(ParseLogLevel("Warn") == LogLevel::Warning);
        CHECK(ParseLogLevel("warning") == LogLevel::Warning);
        CHECK(ParseLogLevel("off") == LogLevel::Off);
        CHECK_FALSE(ParseLogLevel("verbose").has_value());
        CHECK(ToString(LogLevel::Error) == "ERROR");
    }

    TEST_CASE("Logger filters by level and formats arguments", "[Diagnostics][Logger]")
    {
        ScopedCapture capture(LogLevel::Warning);

        WARDEN_LOG_DEBUG("hidden {}", 1);
        WARDEN_LOG_WARN("pool {} rejected {} items", "Warden.SRS", 3);
        WARDEN_LOG_ERROR("failed");

        const auto lines = capture.Lines();
        REQUIRE(lines.size() == 2);
        CHECK(lines[0].first == LogLevel::Warning);
        CHECK(lines[0].second == "pool Warden.SRS rejected 3 items");
        CHECK(lines[1].first == LogLevel::Error);
        CHECK(lines[1].second == "failed");
    }

    TEST_CASE("Logger level Off silences everything", "[Diagnostics][Logger]")
    {
        ScopedCapture capture(LogLevel::Off);
        WARDEN_LOG_ERROR("nobody hears this");
        CHECK(capture.Lines().empty());
        CHECK_FALSE(Logger::Instance().ShouldLog(LogLevel::Error));
    }

    TEST_CASE("Logger survives a throwing sink", "[Diagnostics][Logger]")
    {
        const auto previous = Logger::Instance().GetLevel();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().SetSink([](LogLevel, std::string_view) { throw std::runtime_error("sink down"); });

        CHECK_NOTHROW(WARDEN_LOG_INFO("still fine"));

        Logger::Instance().ResetSink();
        Logger::Instance().SetLevel(previous);
    }
}// namespace Warden::Diagnostics
