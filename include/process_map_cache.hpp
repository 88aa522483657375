// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "proc_maps.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace beeprof {

// Process wide cache of /proc/<pid>/maps snapshots.
// A pid is read once, at first observation. A pid that could not be read
// (process already gone) is remembered as exited: all its frames stay
// unresolved. Entries are evicted one cycle after an exit notification, or
// once they have not been used for the idle timeout.
// Thread safe: the poll thread prefetches, the processing thread reads.
class ProcessMapCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFunction = std::function<Clock::time_point()>;

  explicit ProcessMapCache(std::chrono::nanoseconds idle_timeout,
                           std::string path_to_proc = "",
                           NowFunction now = &Clock::now);

  // Snapshot of the pid, nullptr when the process exited before it was read
  std::shared_ptr<const ProcessMaps> get(pid_t pid);

  // Reads the maps of a pid that was never seen
  void prefetch(pid_t pid) { (void)get(pid); }

  // The process is gone: its snapshot is evicted at the second end_cycle()
  void notify_exit(pid_t pid);

  // Applies exit and idle evictions. Called after each processed batch.
  void end_cycle();

  [[nodiscard]] bool contains(pid_t pid) const;
  [[nodiscard]] bool is_exited(pid_t pid) const;
  [[nodiscard]] size_t size() const;
  // Number of /proc/<pid>/maps reads
  [[nodiscard]] uint64_t nb_snapshots() const;

private:
  struct Entry {
    std::shared_ptr<const ProcessMaps> maps;
    Clock::time_point last_used;
    bool exited{false};
  };

  std::string _path_to_proc;
  std::chrono::nanoseconds _idle_timeout;
  NowFunction _now;

  mutable std::mutex _mutex;
  std::unordered_map<pid_t, Entry> _entries;
  std::vector<pid_t> _exits_current;
  std::vector<pid_t> _exits_previous;
  uint64_t _nb_snapshots{0};
};

} // namespace beeprof
