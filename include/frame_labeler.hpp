// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <sys/types.h>
#include <vector>

namespace beeprof {

// Turns raw stacks into labels. Input and output are innermost first.
class FrameLabeler {
public:
  virtual ~FrameLabeler() = default;

  virtual void user_labels(pid_t pid, std::span<const uint64_t> addresses,
                           std::vector<std::string> &labels) = 0;
  virtual void kernel_labels(std::span<const uint64_t> addresses,
                             std::vector<std::string> &labels) = 0;

  // Called once a batch is folded
  virtual void end_batch() {}
};

} // namespace beeprof
