#pragma once

#ifndef WARDEN_API
#if defined(WARDEN_SHARED_BUILD) || defined(WARDEN_SHARED)
#define WARDEN_API __attribute__((visibility("default")))
#else
#define WARDEN_API
#endif
#endif

#if defined(__x86_64__) || defined(__i386__)
#define WARDEN_CPU_RELAX() __builtin_ia32_pause()
#elif defined(__aarch64__)
#define WARDEN_CPU_RELAX() __asm__ __volatile__("yield")
#else
#define WARDEN_CPU_RELAX() ((void) 0)
#endif
