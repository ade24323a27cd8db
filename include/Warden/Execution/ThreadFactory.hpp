/// @file ThreadFactory.hpp
/// @brief Injection point for the threads a worker pool runs on.
#pragma once

#include <Warden/Defines.hpp>
#include <Warden/Execution/Thread.hpp>
#include <Warden/Primitives.hpp>

#include <atomic>
#include <string>
#include <string_view>

namespace Warden::Execution
{
    /// @brief Creates started threads for executors.
    ///
    /// Implementations must be thread-safe: a pool may create threads from any thread that
    /// submits work. A failure to create a thread is reported by throwing.
    class IThreadFactory
    {
    public:
        virtual ~IThreadFactory() = default;

        /// @brief Start a new thread running @p entry and return its handle.
        [[nodiscard]] virtual Thread NewThread(Thread::Entry entry) = 0;
    };

    /// @brief Names threads `prefix-1`, `prefix-2`, ... in creation order.
    class WARDEN_API NamedThreadFactory final : public IThreadFactory
    {
    public:
        /// @throws InvalidArgumentException if @p prefix is empty.
        explicit NamedThreadFactory(std::string prefix);

        [[nodiscard]] Thread NewThread(Thread::Entry entry) override;

        [[nodiscard]] const std::string& GetPrefix() const noexcept { return m_prefix; }

        /// @brief Number of threads created so far.
        [[nodiscard]] UInt64 CreatedCount() const noexcept { return m_counter.load(std::memory_order_relaxed); }

    private:
        std::string         m_prefix;
        std::atomic<UInt64> m_counter {0};
    };
}// namespace Warden::Execution
