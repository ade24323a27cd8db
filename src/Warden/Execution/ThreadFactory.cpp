#include <Warden/Execution/ThreadFactory.hpp>

#include <Warden/Exceptions/ArgumentException.hpp>

#include <utility>

#include <fmt/format.h>

namespace Warden::Execution
{
    NamedThreadFactory::NamedThreadFactory(std::string prefix)
        : m_prefix(std::move(prefix))
    {
        if (m_prefix.empty())
        {
            throw Exceptions::InvalidArgumentException("NamedThreadFactory: prefix must not be empty");
        }
    }

    Thread NamedThreadFactory::NewThread(Thread::Entry entry)
    {
        const UInt64 index = m_counter.fetch_add(1, std::memory_order_relaxed) + 1;

        Thread::Options options {};
        options.name       = ThreadName(fmt::format("{}-{}", m_prefix, index));
        options.onDestruct = Thread::OnDestruct::Join;
        return Thread(std::move(entry), options);
    }
}// namespace Warden::Execution
