/// @file Thread.hpp
/// @brief pthread-backed thread handle.
#pragma once

#include <Warden/Exceptions/ArgumentException.hpp>
#include <Warden/Exceptions/Exception.hpp>
#include <Warden/Execution/ThisThread.hpp>
#include <Warden/Execution/ThreadName.hpp>
#include <Warden/Primitives.hpp>

#include <atomic>
#include <cstring>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <pthread.h>

namespace Warden::Execution
{
    class Thread
    {
    public:
        using NativeHandle = pthread_t;
        using ThreadId     = ThisThread::ThreadId;
        using Entry        = std::move_only_function<void()>;

        enum class OnDestruct : UInt8
        {
            Join,
            Detach,
            Terminate,
        };

        struct Options final
        {
            Options() noexcept = default;

            ThreadName name {};
            UIntSize   stackSize {0};
            OnDestruct onDestruct {OnDestruct::Terminate};
        };

        Thread() noexcept = default;

        explicit Thread(Entry entry, Options options = {})
        {
            Start(std::move(entry), std::move(options));
        }

        ~Thread() noexcept
        {
            HandleDestruction();
        }

        Thread(const Thread&)            = delete;
        Thread& operator=(const Thread&) = delete;

        Thread(Thread&& other) noexcept
        {
            MoveFrom(std::move(other));
        }

        Thread& operator=(Thread&& other) noexcept
        {
            if (this != &other)
            {
                HandleDestruction();
                MoveFrom(std::move(other));
            }
            return *this;
        }

        /// @brief Start the thread.
        /// @throws NullArgumentException if @p entry is empty.
        /// @throws Exception if this handle is already running a thread or the OS refuses to create one.
        void Start(Entry entry, Options options = {})
        {
            if (IsJoinable())
            {
                throw Exceptions::Exception("Thread::Start called on a running thread");
            }
            if (!entry)
            {
                throw Exceptions::NullArgumentException("entry");
            }

            m_options = std::move(options);
            StartImpl(std::move(entry));
        }

        void Join() noexcept
        {
            if (!IsJoinable())
            {
                return;
            }
            (void) ::pthread_join(m_thread, nullptr);
            m_threadId.reset();
            m_joinable = false;
        }

        void Detach() noexcept
        {
            if (!IsJoinable())
            {
                return;
            }
            (void) ::pthread_detach(m_thread);
            m_threadId.reset();
            m_joinable = false;
        }

        [[nodiscard]] bool IsJoinable() const noexcept
        {
            return m_joinable;
        }

        /// @brief OS id of the running thread, or 0 before the thread has published it.
        [[nodiscard]] ThreadId GetId() const noexcept
        {
            return m_threadId ? m_threadId->load(std::memory_order_acquire) : 0;
        }

        [[nodiscard]] NativeHandle NativeHandleValue() noexcept
        {
            return m_thread;
        }

        [[nodiscard]] const ThreadName& GetName() const noexcept
        {
            return m_options.name;
        }

    private:
        struct StartContext final
        {
            Entry                  entry {};
            ThreadName             name {};
            std::shared_ptr<std::atomic<ThreadId>> outThreadId {};
        };

        static void* ThreadProc(void* param) noexcept
        {
            std::unique_ptr<StartContext> ctx(static_cast<StartContext*>(param));
            ctx->outThreadId->store(ThisThread::GetId(), std::memory_order_release);
            ctx->outThreadId.reset();
            if (!ctx->name.Empty())
            {
                (void) ThisThread::SetName(ctx->name.OsName());
            }

            // Entry exceptions are fatal, as with std::thread.
            ctx->entry();
            return nullptr;
        }

        void StartImpl(Entry entry)
        {
            auto ctx         = std::make_unique<StartContext>();
            ctx->entry       = std::move(entry);
            ctx->name        = m_options.name;
            ctx->outThreadId = std::make_shared<std::atomic<ThreadId>>(0);
            auto threadId    = ctx->outThreadId;

            pthread_attr_t attr {};
            (void) ::pthread_attr_init(&attr);
            if (m_options.stackSize != 0)
            {
                (void) ::pthread_attr_setstacksize(&attr, m_options.stackSize);
            }

            const int rc = ::pthread_create(&m_thread, &attr, &ThreadProc, ctx.get());
            (void) ::pthread_attr_destroy(&attr);
            if (rc != 0)
            {
                throw Exceptions::Exception(std::string("pthread_create failed: ") + std::strerror(rc));
            }
            (void) ctx.release();
            m_threadId = std::move(threadId);
            m_joinable = true;
        }

        void MoveFrom(Thread&& other) noexcept
        {
            m_options        = std::move(other.m_options);
            m_joinable       = other.m_joinable;
            other.m_joinable = false;
            m_thread         = other.m_thread;
            other.m_thread   = {};
            m_threadId       = std::move(other.m_threadId);
            other.m_options = {};
        }

        void HandleDestruction() noexcept
        {
            if (!IsJoinable())
            {
                return;
            }

            switch (m_options.onDestruct)
            {
                case OnDestruct::Join: Join(); return;
                case OnDestruct::Detach: Detach(); return;
                default: std::terminate();
            }
        }

        Options               m_options {};
        bool                  m_joinable {false};
        pthread_t             m_thread {};
        // Shared with the running thread, which publishes its OS id here.
        std::shared_ptr<std::atomic<ThreadId>> m_threadId {};
    };
}// namespace Warden::Execution
