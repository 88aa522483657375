// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "bpf/profile_shared.h"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace beeprof {

// Maximum depth of a kernel-captured stack (PERF_MAX_STACK_DEPTH)
inline constexpr size_t kMaxStackDepth{BEEPROF_MAX_STACK_DEPTH};

// Size of the task command name (TASK_COMM_LEN)
inline constexpr size_t kCommLen{BEEPROF_COMM_LEN};

inline constexpr int kDefaultSamplingFrequency{99};
inline constexpr int kMaxSamplingFrequency{10000};

inline constexpr std::chrono::milliseconds kDefaultPollPeriod{1000};
inline constexpr std::chrono::seconds kDefaultIdleTimeout{120};
inline constexpr size_t kDefaultChannelCapacity{16};
inline constexpr size_t kDefaultSubscriberCapacity{4};

// Capacity of the kernel tables (number of entries)
inline constexpr uint32_t kDefaultCountsTableSize{10240};
inline constexpr uint32_t kDefaultStackTableSize{16384};

// Linux Inode type
using inode_t = uint64_t;

// Kernel stack table identifier (negative when the capture failed)
using StackId_t = int32_t;
inline constexpr StackId_t k_stack_id_absent = -1;

// Elf address (same as the address used with addr2line)
using ElfAddress_t = uint64_t;
// Offset types : add or subtract to address types
using Offset_t = ElfAddress_t;
// Absolute address (needs to be adjusted with the start address of binary)
using ProcessAddress_t = ElfAddress_t;

} // namespace beeprof
