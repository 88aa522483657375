// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <climits>
#include <cstdint>

enum : uint16_t { BEE_COMMON_START_RANGE = 1000, BEE_NATIVE_START_RANGE = 2000 };

#define EXPAND_ENUM(a, b) BEE_WHAT_##a,
#define EXPAND_ERROR_MESSAGE(a, b) #a ": " b,

#define COMMON_ERROR_TABLE(X)                                                  \
  X(UKNW, "undocumented error")                                                \
  X(BADALLOC, "allocation error")                                              \
  X(STDEXCEPT, "standard exception caught")                                    \
  X(UKNWEXCEPT, "unknown exception caught")

#define NATIVE_ERROR_TABLE(X)                                                  \
  X(ARGUMENT, "invalid configuration value")                                   \
  X(INPUT_PROCESS, "error processing the configuration")                       \
  X(CGROUP, "error while reading cgroup information")                          \
  X(BPF_OPEN, "unable to open the probe object")                               \
  X(BPF_LOAD, "unable to load the probe into the kernel")                      \
  X(BPF_ATTACH, "unable to attach the probe")                                  \
  X(BPF_MAP, "error accessing a kernel table")                                 \
  X(PERFOPEN, "error during perf_event_open")                                  \
  X(STACK_UNAVAILABLE, "stack id no longer present in the stack table")        \
  X(PROCMAPS, "unable to read process mappings")                               \
  X(PROCESS_EXITED, "process exited before its mappings were read")            \
  X(KALLSYMS, "unable to read kernel symbols")                                 \
  X(DWFL_LIB_ERROR, "error withing dwfl library")                              \
  X(MODULE, "error retrieving debug info in modules")                          \
  X(INVALID_ELF, "invalid elf file")                                           \
  X(NO_MATCHING_LOAD_SEGMENT, "unable to find a LOAD segment matching mapping") \
  X(SYMBOLIZER, "symbolizer error")                                            \
  X(CHANNEL_CLOSED, "sample channel closed")                                   \
  X(PIPELINE, "error in the profiling pipeline")                               \
  X(OUTPUT, "error writing the profile")                                       \
  X(BEEPROF_STATS, "error in stats module")                                    \
  X(SIGNAL, "error installing signal handlers")                                \
  X(UNITTEST, "unit test error")

// generic erno errors available from /usr/include/asm-generic/errno.h

enum BeeRes_What : uint16_t {
  // errno starts after ELAST 106 as of now
  BEE_WHAT_MIN_ERRNO = BEE_COMMON_START_RANGE,
  // common errors
  COMMON_ERROR_TABLE(EXPAND_ENUM) COMMON_ERROR_SIZE,
  BEE_WHAT_MIN_NATIVE = BEE_NATIVE_START_RANGE,
  NATIVE_ERROR_TABLE(EXPAND_ENUM) NATIVE_ERROR_SIZE,
  // max
  BEE_WHAT_MAX = SHRT_MAX,
};

/// Retrieve an explicit error message matching the error ID (from table above)
const char *beeres_error_message(int16_t what);
