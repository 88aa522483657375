// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#if defined(__has_builtin)
#  if __has_builtin(__builtin_expect)
#    define likely(x) __builtin_expect(!!(x), 1)
#    define unlikely(x) __builtin_expect(!!(x), 0)
#  endif
#endif
#ifndef likely
#  define likely(x) (x)
#  define unlikely(x) (x)
#endif

#define BEEPROF_BLOCK_TAIL_CALL_OPTIMIZATION() __asm__ __volatile__("")
#define BEEPROF_NOINLINE __attribute__((noinline))
#define BEEPROF_ALWAYS_INLINE __attribute__((always_inline))

#if defined(__clang__)
#  define BEEPROF_NOIPO __attribute__((noinline))
#else
#  define BEEPROF_NOIPO __attribute__((noipa))
#endif

namespace beeprof {
// Keeps the compiler from discarding a computation (busy loops in tests)
template <class Tp>
inline BEEPROF_ALWAYS_INLINE void DoNotOptimize(Tp const &value) {
  asm volatile("" : : "r,m"(value) : "memory");
}

template <class Tp>
inline BEEPROF_ALWAYS_INLINE void DoNotOptimize(Tp &value) {
#if defined(__clang__)
  asm volatile("" : "+r,m"(value) : : "memory");
#else
  asm volatile("" : "+m,r"(value) : : "memory");
#endif
}
} // namespace beeprof
