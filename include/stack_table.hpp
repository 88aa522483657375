// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"
#include "raw_sample.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace beeprof {

// Opaque handle on the tables filled by the sampling probe.
// Only the poll thread is expected to call the clearing operations.
class StackTable {
public:
  virtual ~StackTable() = default;

  // Reads every entry of the aggregation table. When `clear` is set, each
  // entry is removed as it is read so that it is reported exactly once.
  virtual BeeRes read_counts(bool clear, std::vector<SampleCount> &counts) = 0;

  // Frames of a stack id, innermost first. Returns a warning with
  // BEE_WHAT_STACK_UNAVAILABLE when the id is no longer in the table.
  virtual BeeRes read_frames(StackId_t id, std::vector<uint64_t> &frames) = 0;

  // Removes stack ids that are no longer referenced
  virtual BeeRes release_stacks(std::span<const StackId_t> ids) = 0;

  // Total samples the probe could not record, since the start of the run
  virtual BeeRes dropped_samples(uint64_t &total) = 0;

  // Appends the pids that exited since the last call (none without a
  // notification source)
  virtual BeeRes poll_exited_pids(std::vector<uint32_t> &pids) = 0;

  // False for read-only tables: deltas are then computed in user space
  [[nodiscard]] virtual bool supports_clear() const = 0;
};

} // namespace beeprof
