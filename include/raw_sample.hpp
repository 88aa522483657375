// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "hash_helper.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <vector>

namespace beeprof {

// Key of the kernel aggregation table, mirrored in user space
struct RawStackKey {
  uint32_t pid{0};
  std::array<char, kCommLen> comm{};
  StackId_t kernel_stack_id{k_stack_id_absent};
  StackId_t user_stack_id{k_stack_id_absent};

  static RawStackKey from_kernel(const beeprof_stack_key &key) {
    RawStackKey raw;
    raw.pid = key.pid;
    memcpy(raw.comm.data(), key.comm, kCommLen);
    raw.comm[kCommLen - 1] = '\0';
    raw.kernel_stack_id = key.kernel_stack_id;
    raw.user_stack_id = key.user_stack_id;
    return raw;
  }

  void set_comm(std::string_view name) {
    comm.fill('\0');
    memcpy(comm.data(), name.data(), std::min(name.size(), kCommLen - 1));
  }

  [[nodiscard]] std::string_view comm_view() const {
    return {comm.data(), strnlen(comm.data(), kCommLen)};
  }

  [[nodiscard]] bool has_kernel_stack() const { return kernel_stack_id >= 0; }
  [[nodiscard]] bool has_user_stack() const { return user_stack_id >= 0; }

  friend bool operator==(const RawStackKey &lhs,
                         const RawStackKey &rhs) = default;
};

struct RawStackKeyHash {
  size_t operator()(const RawStackKey &key) const {
    size_t seed = std::hash<uint32_t>{}(key.pid);
    hash_combine(seed, key.comm_view());
    hash_combine(seed, key.kernel_stack_id);
    hash_combine(seed, key.user_stack_id);
    return seed;
  }
};

struct SampleCount {
  RawStackKey key;
  uint64_t count{0};
};

enum class FramesStatus : uint8_t {
  kAvailable = 0,
  // the stack id was not captured by the probe
  kAbsent,
  // the id was recycled or evicted before it could be read
  kUnavailable,
};

// Addresses are innermost first, as stored by the kernel
struct RawFrames {
  FramesStatus status{FramesStatus::kAbsent};
  std::vector<uint64_t> addresses;
};

// A drained sample with its resolved raw stacks
struct RawSample {
  RawStackKey key;
  uint64_t count{0};
  RawFrames kernel;
  RawFrames user;
};

// Output of one drain of the kernel tables
struct SampleBatch {
  std::vector<RawSample> samples;
  // monotonic total of samples dropped by the probe (table full)
  uint64_t kernel_drops{0};
  // processes that exited before this drain completed
  std::vector<uint32_t> exited_pids;
  // set on the last batch of a run
  bool final{false};

  [[nodiscard]] uint64_t total_count() const {
    uint64_t total = 0;
    for (const auto &sample : samples) {
      total += sample.count;
    }
    return total;
  }
};

} // namespace beeprof
