// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "process_map_cache.hpp"

#include "beeprof_stats.hpp"
#include "beeres.hpp"

namespace beeprof {

ProcessMapCache::ProcessMapCache(std::chrono::nanoseconds idle_timeout,
                                 std::string path_to_proc, NowFunction now)
    : _path_to_proc(std::move(path_to_proc)), _idle_timeout(idle_timeout),
      _now(std::move(now)) {}

std::shared_ptr<const ProcessMaps> ProcessMapCache::get(pid_t pid) {
  {
    std::lock_guard const lock(_mutex);
    auto it = _entries.find(pid);
    if (it != _entries.end()) {
      it->second.last_used = _now();
      return it->second.maps;
    }
  }

  // Read outside of the lock, the first insertion wins
  auto maps = std::make_shared<ProcessMaps>(pid);
  BeeRes const res = read_process_maps(pid, _path_to_proc, *maps);
  Entry entry;
  entry.last_used = _now();
  if (IsBeeResOK(res)) {
    entry.maps = std::move(maps);
    LG_DBG("[MAPS] Snapshot of pid %d (%zu mappings)", pid,
           entry.maps->size());
  } else {
    entry.exited = true;
    beeprof_stats_add(STATS_EXITED_PROCESSES, 1, nullptr);
  }

  std::lock_guard const lock(_mutex);
  auto [it, inserted] = _entries.try_emplace(pid, std::move(entry));
  if (inserted) {
    ++_nb_snapshots;
    beeprof_stats_add(STATS_MAP_SNAPSHOTS, 1, nullptr);
  }
  return it->second.maps;
}

void ProcessMapCache::notify_exit(pid_t pid) {
  std::lock_guard const lock(_mutex);
  _exits_current.push_back(pid);
}

void ProcessMapCache::end_cycle() {
  std::lock_guard const lock(_mutex);
  size_t nb_evicted = 0;
  for (pid_t const pid : _exits_previous) {
    nb_evicted += _entries.erase(pid);
  }
  _exits_previous.swap(_exits_current);
  _exits_current.clear();

  auto const now = _now();
  for (auto it = _entries.begin(); it != _entries.end();) {
    if (now - it->second.last_used >= _idle_timeout) {
      LG_DBG("[MAPS] Evicting idle pid %d", it->first);
      it = _entries.erase(it);
      ++nb_evicted;
    } else {
      ++it;
    }
  }
  if (nb_evicted) {
    beeprof_stats_add(STATS_MAPS_EVICTED, static_cast<long>(nb_evicted),
                      nullptr);
  }
}

bool ProcessMapCache::contains(pid_t pid) const {
  std::lock_guard const lock(_mutex);
  return _entries.contains(pid);
}

bool ProcessMapCache::is_exited(pid_t pid) const {
  std::lock_guard const lock(_mutex);
  auto it = _entries.find(pid);
  return it != _entries.end() && it->second.exited;
}

size_t ProcessMapCache::size() const {
  std::lock_guard const lock(_mutex);
  return _entries.size();
}

uint64_t ProcessMapCache::nb_snapshots() const {
  std::lock_guard const lock(_mutex);
  return _nb_snapshots;
}

} // namespace beeprof
