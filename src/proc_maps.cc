// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "proc_maps.hpp"

#include "beeres.hpp"
#include "defer.hpp"
#include "signal_helper.hpp"

#include <absl/strings/str_format.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace beeprof {

namespace {
uint32_t mode_string_to_prot(const char mode[4]) {
  return ((mode[0] == 'r') ? PROT_READ : 0) |
      ((mode[1] == 'w') ? PROT_WRITE : 0) | ((mode[2] == 'x') ? PROT_EXEC : 0);
}
} // namespace

void ProcessMaps::insert_erase_overlap(MemoryMapEntry &&entry) {
  // Lower bound will return the first over our current element.
  //         <700--1050> <1100--1500> <1600--2200>
  // Elt to insert :  <1000-------------2000>
  // Go to previous as it could also overlap
  auto first = _map.lower_bound(entry._start);
  if (first != _map.begin()) {
    auto prev = std::prev(first);
    if (prev->second.intersects(entry)) {
      first = prev;
    }
  }
  auto last = first;
  while (last != _map.end() && last->second.intersects(entry)) {
    ++last;
  }
  if (first != last) {
    LG_DBG("[MAPS] PID %d overlap on insert of %s", _pid,
           entry.to_string().c_str());
    _map.erase(first, last);
  }
  ProcessAddress_t const start = entry._start;
  _map.emplace(start, std::move(entry));
}

const MemoryMapEntry *ProcessMaps::find(ProcessAddress_t addr) const {
  // First element not less than (can match a start addr)
  auto it = _map.lower_bound(addr);
  if (it != _map.end() && it->second.is_within(addr)) {
    return &it->second;
  }
  // previous element is more likely to contain our addr
  if (it == _map.begin()) {
    return nullptr;
  }
  --it;
  return it->second.is_within(addr) ? &it->second : nullptr;
}

UniqueFile open_proc_maps(pid_t pid, std::string_view path_to_proc) {
  std::string const proc_map_filename =
      absl::StrFormat("%s/proc/%d/maps", path_to_proc, pid);
  return UniqueFile{fopen(proc_map_filename.c_str(), "re")};
}

std::optional<MemoryMapEntry> parse_proc_maps_line(const char *line) {
  // clang-format off
  // Example of format
  /*
    55d78839f000-55d7883a1000 r--p 00000000 fe:01 3287864                    /usr/local/bin/BadBoggleSolver_run
    55d7883a1000-55d7883a5000 r-xp 00002000 fe:01 3287864                    /usr/local/bin/BadBoggleSolver_run
    55d78a12b000-55d78a165000 rw-p 00000000 00:00 0                          [heap]
    7f531437b000-7f531439e000 r-xp 00001000 fe:01 3932979                    /usr/lib/x86_64-linux-gnu/ld-2.31.so
    7f53143a9000-7f53143aa000 rw-p 00000000 00:00 0
    7ffcd6ce6000-7ffcd6ce8000 r-xp 00000000 00:00 0                          [vdso]
  */
  // clang-format on
  ProcessAddress_t m_start = 0;
  ProcessAddress_t m_end = 0;
  Offset_t m_off = 0;
  char m_mode[4] = {};
  uint32_t m_dev_major = 0;
  uint32_t m_dev_minor = 0;
  inode_t m_inode = 0;
  int m_p = 0;

  // %n specifier does not increase count returned by sscanf
  constexpr int k_expected_number_of_matches = 7;
  if (k_expected_number_of_matches !=
      // NOLINTNEXTLINE(cert-err34-c)
      sscanf(line, "%lx-%lx %4c %lx %x:%x %lu%n", &m_start, &m_end, m_mode,
             &m_off, &m_dev_major, &m_dev_minor, &m_inode, &m_p)) {
    LG_DBG("[MAPS] Failed to scan proc line: %s", line);
    return std::nullopt;
  }
  if (m_end <= m_start) {
    return std::nullopt;
  }

  // trim spaces on the left
  std::string_view remaining{line + m_p};
  remaining.remove_prefix(
      std::min(remaining.find_first_not_of(" \t"), remaining.size()));
  // remove new line at end if present
  if (remaining.ends_with('\n')) {
    remaining.remove_suffix(1);
  }

  return MemoryMapEntry{m_start,
                        m_end - 1,
                        m_off,
                        std::string(remaining),
                        m_inode,
                        mode_string_to_prot(m_mode)};
}

BeeRes read_process_maps(pid_t pid, std::string_view path_to_proc,
                         ProcessMaps &maps) {
  UniqueFile file = open_proc_maps(pid, path_to_proc);
  if (!file) {
    int const e = errno;
    if (e == ENOENT || e == ESRCH || !process_is_alive(pid)) {
      LG_DBG("[MAPS] Process %d exited", pid);
      return beeres_warn(BEE_WHAT_PROCESS_EXITED);
    }
    BEERES_RETURN_WARN_LOG(BEE_WHAT_PROCMAPS,
                           "Unable to open maps of pid %d: %s", pid,
                           strerror(e));
  }
  char *buf = nullptr;
  defer { free(buf); };
  size_t sz_buf = 0;
  int nb_lines = 0;
  while (-1 != getline(&buf, &sz_buf, file.get())) {
    std::optional<MemoryMapEntry> entry = parse_proc_maps_line(buf);
    if (entry) {
      maps.insert_erase_overlap(std::move(*entry));
      ++nb_lines;
    }
  }
  // the kernel returns an empty file for a zombie
  if (!nb_lines) {
    return beeres_warn(BEE_WHAT_PROCESS_EXITED);
  }
  return {};
}

} // namespace beeprof
