// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof_stats.hpp"

#include "beeres_helpers.hpp"
#include "logger.hpp"

#include <cstring>
#include <sys/mman.h>

namespace beeprof {

namespace {

#define X_PATH(a, b, c) b,
const char *stats_paths[] = {STATS_TABLE(X_PATH)};
#undef X_PATH

// Region (to be mmap'd here) for backend store
long *beeprof_stats = nullptr;
} // namespace

BeeRes beeprof_stats_init() {
  // This interface cannot be used to reset the existing mapping; to do so free
  // and then re-initialize.
  if (beeprof_stats) {
    return beeres_init();
  }

  void *region = mmap(nullptr, sizeof(long) * STATS_LEN,
                      PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1,
                      0);
  if (MAP_FAILED == region) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_BEEPROF_STATS,
                            "Unable to mmap for stats");
  }
  beeprof_stats = static_cast<long *>(region);

  // When we initialize the stats, we should zero out the region
  memset(beeprof_stats, 0, sizeof(long) * STATS_LEN);
  return beeres_init();
}

BeeRes beeprof_stats_free() {
  if (beeprof_stats) {
    BEERES_CHECK_INT(munmap(beeprof_stats, sizeof(long) * STATS_LEN),
                     BEE_WHAT_BEEPROF_STATS, "Error from munmap");
  }
  beeprof_stats = nullptr;

  return beeres_init();
}

BeeRes beeprof_stats_add(unsigned int stat, long in, long *out) {
  if (!beeprof_stats) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BEEPROF_STATS,
                           "Stats backend uninitialized");
  }
  if (stat >= STATS_LEN) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BEEPROF_STATS, "Invalid stat");
  }

  long const retval = __atomic_add_fetch(&beeprof_stats[stat], in,
                                         __ATOMIC_RELAXED);

  if (out) {
    *out = retval;
  }
  return beeres_init();
}

BeeRes beeprof_stats_set(unsigned int stat, long n) {
  if (!beeprof_stats) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BEEPROF_STATS,
                           "Stats backend uninitialized");
  }
  if (stat >= STATS_LEN) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BEEPROF_STATS, "Invalid stat");
  }
  __atomic_store_n(&beeprof_stats[stat], n, __ATOMIC_RELAXED);
  return beeres_init();
}

BeeRes beeprof_stats_clear(unsigned int stat) {
  return beeprof_stats_set(stat, 0);
}

BeeRes beeprof_stats_clear_all() {
  if (!beeprof_stats) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BEEPROF_STATS,
                           "Stats backend uninitialized");
  }
  for (unsigned int i = 0; i < STATS_LEN; i++) {
    __atomic_store_n(&beeprof_stats[i], 0, __ATOMIC_RELAXED);
  }
  return beeres_init();
}

BeeRes beeprof_stats_get(unsigned int stat, long *out) {
  if (!beeprof_stats) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BEEPROF_STATS,
                           "Stats backend uninitialized");
  }
  if (stat >= STATS_LEN) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BEEPROF_STATS, "Invalid stat");
  }

  if (out) {
    *out = __atomic_load_n(&beeprof_stats[stat], __ATOMIC_RELAXED);
  }
  return beeres_init();
}

const char *beeprof_stats_name(unsigned int stat) {
  return stat < STATS_LEN ? stats_paths[stat] : "unknown";
}

void beeprof_stats_print() {
  if (!beeprof_stats) {
    return;
  }
  for (unsigned int i = 0; i < STATS_LEN; ++i) {
    LG_NTC("%s: %ld", stats_paths[i],
           __atomic_load_n(&beeprof_stats[i], __ATOMIC_RELAXED));
  }
}

} // namespace beeprof
