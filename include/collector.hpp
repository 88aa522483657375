// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"
#include "process_map_cache.hpp"
#include "raw_sample.hpp"
#include "stack_table.hpp"

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace beeprof {

enum class CollectionMode : uint8_t {
  // final counts are read once, at the end of the run
  kSnapshot,
  // periodic drains, each batch holds the samples since the previous one
  kContinuous,
};

const char *collection_mode_str(CollectionMode mode);

// Drains the probe tables into sample batches.
// Only the poll thread is expected to use a collector.
class Collector {
public:
  // map_cache can be null when user stacks are not captured
  Collector(StackTable &table, CollectionMode mode,
            ProcessMapCache *map_cache);

  // Reads the counts then the frames they reference. In continuous mode the
  // counts are a delta: destructive read when the table supports it,
  // difference with the previous read otherwise.
  // On a table error the batch still holds every sample that was read, and
  // the first fatal error is returned.
  BeeRes drain(bool final, SampleBatch &batch);

  // Snapshot mode tick: prefetches the maps of new pids and collects exit
  // notifications without consuming counts
  BeeRes observe();

  [[nodiscard]] CollectionMode mode() const { return _mode; }
  [[nodiscard]] bool destructive() const { return _destructive; }
  [[nodiscard]] uint64_t nb_drains() const { return _nb_drains; }

private:
  static void keep_first_error(BeeRes &res, BeeRes other);
  BeeRes read_counts(std::vector<SampleCount> &counts);
  void compute_deltas(std::vector<SampleCount> &counts);
  void prefetch_maps(const std::vector<SampleCount> &counts);
  BeeRes poll_exits(std::vector<uint32_t> &pids);
  const RawFrames &frames_of(StackId_t id);
  BeeRes release_unreferenced();

  StackTable &_table;
  CollectionMode _mode;
  ProcessMapCache *_map_cache;
  bool _destructive;
  uint64_t _nb_drains{0};
  // last total read from the drop counter
  uint64_t _kernel_drops{0};

  std::vector<SampleCount> _counts;
  // per drain memoization of frames
  std::unordered_map<StackId_t, RawFrames> _frames;
  // stack ids referenced by the previous and the current drain
  std::unordered_set<StackId_t> _previous_ids;
  std::unordered_set<StackId_t> _current_ids;
  // non destructive reads: last observed value per key
  std::unordered_map<RawStackKey, uint64_t, RawStackKeyHash> _previous_counts;
  std::vector<uint32_t> _pending_exits;
};

} // namespace beeprof
