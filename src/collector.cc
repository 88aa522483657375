// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "collector.hpp"

#include "beeprof_stats.hpp"
#include "beeres.hpp"
#include "logger.hpp"

#include <algorithm>

namespace beeprof {

const char *collection_mode_str(CollectionMode mode) {
  switch (mode) {
  case CollectionMode::kSnapshot:
    return "snapshot";
  case CollectionMode::kContinuous:
    return "continuous";
  }
  return "undef";
}

Collector::Collector(StackTable &table, CollectionMode mode,
                     ProcessMapCache *map_cache)
    : _table(table), _mode(mode), _map_cache(map_cache),
      _destructive(mode == CollectionMode::kContinuous &&
                   table.supports_clear()) {}

void Collector::keep_first_error(BeeRes &res, BeeRes other) {
  if (IsBeeResOK(res) && IsBeeResFatal(other)) {
    res = other;
  }
}

BeeRes Collector::read_counts(std::vector<SampleCount> &counts) {
  counts.clear();
  BEERES_CHECK_FWD_STRICT(_table.read_counts(_destructive, counts));
  beeprof_stats_set(STATS_COUNTS_ENTRIES, static_cast<long>(counts.size()));
  return {};
}

void Collector::compute_deltas(std::vector<SampleCount> &counts) {
  std::unordered_map<RawStackKey, uint64_t, RawStackKeyHash> current;
  current.reserve(counts.size());
  for (auto &sample : counts) {
    current[sample.key] = sample.count;
    auto it = _previous_counts.find(sample.key);
    if (it != _previous_counts.end()) {
      // a smaller value means the entry was removed and created again
      sample.count = sample.count >= it->second ? sample.count - it->second
                                                : sample.count;
    }
  }
  _previous_counts = std::move(current);
  std::erase_if(counts, [](const SampleCount &s) { return s.count == 0; });
}

void Collector::prefetch_maps(const std::vector<SampleCount> &counts) {
  if (!_map_cache) {
    return;
  }
  for (const auto &sample : counts) {
    auto const pid = static_cast<pid_t>(sample.key.pid);
    if (sample.key.has_user_stack() && !_map_cache->contains(pid)) {
      _map_cache->prefetch(pid);
    }
  }
}

BeeRes Collector::poll_exits(std::vector<uint32_t> &pids) {
  size_t const before = pids.size();
  BEERES_CHECK_FWD(_table.poll_exited_pids(pids));
  if (pids.size() > before) {
    LG_DBG("%zu process exit(s) notified", pids.size() - before);
  }
  return {};
}

const RawFrames &Collector::frames_of(StackId_t id) {
  auto it = _frames.find(id);
  if (it != _frames.end()) {
    return it->second;
  }
  RawFrames frames;
  if (id < 0) {
    frames.status = FramesStatus::kAbsent;
  } else {
    _current_ids.insert(id);
    BeeRes const res = _table.read_frames(id, frames.addresses);
    if (IsBeeResOK(res)) {
      frames.status = FramesStatus::kAvailable;
    } else {
      if (res._what != BEE_WHAT_STACK_UNAVAILABLE) {
        LG_DBG("Unable to read stack id %d - %s", id,
               beeres_error_message(res._what));
      }
      frames.status = FramesStatus::kUnavailable;
      frames.addresses.clear();
      beeprof_stats_add(STATS_FRAMES_UNAVAILABLE, 1, nullptr);
    }
  }
  return _frames.emplace(id, std::move(frames)).first->second;
}

BeeRes Collector::release_unreferenced() {
  // ids of the previous drain can still be referenced by counts recorded
  // after it: they are only released once a full drain did not see them
  std::vector<StackId_t> unreferenced;
  for (StackId_t const id : _previous_ids) {
    if (!_current_ids.contains(id)) {
      unreferenced.push_back(id);
    }
  }
  _previous_ids.swap(_current_ids);
  _current_ids.clear();
  if (unreferenced.empty()) {
    return {};
  }
  BEERES_CHECK_FWD(_table.release_stacks(unreferenced));
  return {};
}

BeeRes Collector::drain(bool final, SampleBatch &batch) {
  batch = SampleBatch{};
  batch.final = final;
  ++_nb_drains;

  // table errors do not discard what was already read: in destructive mode
  // those counts are no longer in the kernel
  BeeRes res = {};
  keep_first_error(res, poll_exits(_pending_exits));
  BeeRes const read_res = read_counts(_counts);
  if (IsBeeResFatal(read_res)) {
    keep_first_error(res, read_res);
    if (!_destructive) {
      // entries are still in the table, the next read reports them
      _counts.clear();
    }
  } else if (_mode == CollectionMode::kContinuous && !_destructive) {
    compute_deltas(_counts);
  }
  prefetch_maps(_counts);

  _frames.clear();
  batch.samples.reserve(_counts.size());
  for (const auto &count : _counts) {
    RawSample sample;
    sample.key = count.key;
    sample.count = count.count;
    sample.kernel = frames_of(count.key.kernel_stack_id);
    sample.user = frames_of(count.key.user_stack_id);
    batch.samples.push_back(std::move(sample));
  }
  _frames.clear();

  if (_destructive) {
    keep_first_error(res, release_unreferenced());
  } else {
    _current_ids.clear();
  }

  uint64_t kernel_drops = 0;
  BeeRes const drops_res = _table.dropped_samples(kernel_drops);
  if (IsBeeResOK(drops_res)) {
    _kernel_drops = kernel_drops;
  } else {
    keep_first_error(res, drops_res);
  }
  batch.kernel_drops = _kernel_drops;
  beeprof_stats_set(STATS_KERNEL_DROPS, static_cast<long>(_kernel_drops));
  // exits noticed while draining belong to this batch
  keep_first_error(res, poll_exits(_pending_exits));
  batch.exited_pids = std::move(_pending_exits);
  _pending_exits.clear();

  uint64_t const total = batch.total_count();
  beeprof_stats_add(STATS_SAMPLES_DRAINED, static_cast<long>(total), nullptr);
  LG_DBG("Drain #%lu: %zu stacks, %lu samples, %zu exits%s", _nb_drains,
         batch.samples.size(), total, batch.exited_pids.size(),
         final ? " (final)" : "");
  return res;
}

BeeRes Collector::observe() {
  BEERES_CHECK_FWD(poll_exits(_pending_exits));
  if (!_map_cache) {
    return {};
  }
  std::vector<SampleCount> counts;
  BEERES_CHECK_FWD_STRICT(_table.read_counts(false, counts));
  beeprof_stats_set(STATS_COUNTS_ENTRIES, static_cast<long>(counts.size()));
  prefetch_maps(counts);
  return {};
}

} // namespace beeprof
