/// @file Warden.hpp
/// @brief Convenience header pulling in the public Warden concurrency API.
#pragma once

#include <Warden/Config.hpp>
#include <Warden/Defines.hpp>
#include <Warden/Primitives.hpp>

#include <Warden/Diagnostics/Logger.hpp>

#include <Warden/Exceptions/ArgumentException.hpp>
#include <Warden/Exceptions/Exception.hpp>
#include <Warden/Exceptions/LockOwnershipException.hpp>
#include <Warden/Exceptions/RejectedExecutionException.hpp>
#include <Warden/Exceptions/TaskCanceledException.hpp>

#include <Warden/Time/Duration.hpp>
#include <Warden/Time/MonotonicClock.hpp>
#include <Warden/Time/TimePoint.hpp>
#include <Warden/Time/TimeUnit.hpp>

#include <Warden/Sync/KeyedLockRegistry.hpp>
#include <Warden/Sync/LockHandle.hpp>
#include <Warden/Sync/LockKey.hpp>

#include <Warden/Execution/Cancellable.hpp>
#include <Warden/Execution/ErrorHandler.hpp>
#include <Warden/Execution/Future.hpp>
#include <Warden/Execution/ScheduledThreadPool.hpp>
#include <Warden/Execution/SelfReleasingScheduler.hpp>
#include <Warden/Execution/TaskMultiplexer.hpp>
#include <Warden/Execution/ThreadFactory.hpp>
