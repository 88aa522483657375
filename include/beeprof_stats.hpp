// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"

#include <cstdint>

namespace beeprof {

enum BeeprofStatKind : uint8_t {
  STAT_MONOTONIC = 0, // only ever grows over the run
  STAT_GAUGE,         // value of the last cycle
};

#define X_ENUM(a, b, c) STATS_##a,
#define STATS_TABLE(X)                                                         \
  X(SAMPLES_DRAINED, "samples.drained", STAT_MONOTONIC)                        \
  X(COUNTS_ENTRIES, "counts.entries", STAT_GAUGE)                              \
  X(KERNEL_DROPS, "kernel.dropped_samples", STAT_MONOTONIC)                    \
  X(DRAIN_ERRORS, "kernel.drain_errors", STAT_MONOTONIC)                       \
  X(CHANNEL_DROPS, "channel.dropped_batches", STAT_MONOTONIC)                  \
  X(SUBSCRIBER_DROPS, "publisher.dropped_snapshots", STAT_MONOTONIC)           \
  X(FRAMES_UNAVAILABLE, "stacks.frames_unavailable", STAT_MONOTONIC)           \
  X(UNRESOLVED_FRAMES, "symbols.unresolved_frames", STAT_MONOTONIC)            \
  X(RESOLVED_FRAMES, "symbols.resolved_frames", STAT_MONOTONIC)                \
  X(MODULE_LOADS, "symbols.module_loads", STAT_MONOTONIC)                      \
  X(MAP_SNAPSHOTS, "maps.snapshots", STAT_MONOTONIC)                           \
  X(MAPS_EVICTED, "maps.evicted", STAT_MONOTONIC)                              \
  X(EXITED_PROCESSES, "maps.exited_processes", STAT_MONOTONIC)                 \
  X(FOLDED_STACKS, "profile.folded_stacks", STAT_GAUGE)                        \
  X(PROFILE_WEIGHT, "profile.total_samples", STAT_GAUGE)                       \
  X(CYCLE_DURATION, "pipeline.cycle_duration_us", STAT_GAUGE)

// Expand the enum/index for the individual stats
enum BEEPROF_STATS : uint8_t { STATS_TABLE(X_ENUM) STATS_LEN };
#undef X_ENUM

// Necessary for initializing the backend store for stats. Calling it twice
// keeps the existing store.
BeeRes beeprof_stats_init();

BeeRes beeprof_stats_free();

// The add operator is multithread-safe. `out` can be NULL.
BeeRes beeprof_stats_add(unsigned int stat, long in, long *out);

// Setting and clearing are last-through-the-gate operations
BeeRes beeprof_stats_set(unsigned int stat, long in);
BeeRes beeprof_stats_clear(unsigned int stat);
BeeRes beeprof_stats_clear_all();

// Merely gets the value of the statistic.
BeeRes beeprof_stats_get(unsigned int stat, long *out);

const char *beeprof_stats_name(unsigned int stat);

// Print all known stats to the configured log
void beeprof_stats_print();

} // namespace beeprof
