/// @file Config.hpp
/// @brief Compile-time configuration macros for Warden.
#pragma once

// Lowest log level compiled into the library: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error.
#ifndef WARDEN_LOG_COMPILE_LEVEL
#define WARDEN_LOG_COMPILE_LEVEL 0
#endif

// Number of independently locked shards in the keyed lock registry. Must be a power of two.
#ifndef WARDEN_LOCK_REGISTRY_SHARDS
#define WARDEN_LOCK_REGISTRY_SHARDS 16
#endif

// Name prefix used by the default thread factory of self-releasing schedulers.
// Linux truncates thread names to 15 bytes, keep it short.
#ifndef WARDEN_DEFAULT_THREAD_PREFIX
#define WARDEN_DEFAULT_THREAD_PREFIX "Warden.SRS"
#endif

// Environment variable consulted once for the initial runtime log level.
#ifndef WARDEN_LOG_LEVEL_ENV
#define WARDEN_LOG_LEVEL_ENV "WARDEN_LOG_LEVEL"
#endif
