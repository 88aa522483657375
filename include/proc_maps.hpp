// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"
#include "memory_map_entry.hpp"
#include "unique_fd.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace beeprof {

// Sorted, non overlapping view of the mappings of a process
class ProcessMaps {
public:
  using Map = std::map<ProcessAddress_t, MemoryMapEntry>;

  explicit ProcessMaps(pid_t pid) : _pid(pid) {}

  // Inserts the entry, erasing the entries it overlaps (most recent wins)
  void insert_erase_overlap(MemoryMapEntry &&entry);

  // Mapping containing addr, nullptr if none
  [[nodiscard]] const MemoryMapEntry *find(ProcessAddress_t addr) const;

  [[nodiscard]] pid_t pid() const { return _pid; }
  [[nodiscard]] const Map &entries() const { return _map; }
  [[nodiscard]] size_t size() const { return _map.size(); }

private:
  pid_t _pid;
  Map _map;
};

UniqueFile open_proc_maps(pid_t pid, std::string_view path_to_proc = "");

// Parse one line of /proc/<pid>/maps, nullopt on formatting errors
std::optional<MemoryMapEntry> parse_proc_maps_line(const char *line);

// Reads /proc/<pid>/maps. Returns a warning with BEE_WHAT_PROCESS_EXITED
// when the process is gone.
BeeRes read_process_maps(pid_t pid, std::string_view path_to_proc,
                         ProcessMaps &maps);

} // namespace beeprof
