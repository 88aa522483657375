// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "dso_type.hpp"

#include <string>
#include <sys/mman.h>
#include <sys/types.h>

namespace beeprof {

// One line of /proc/<pid>/maps
class MemoryMapEntry {
public:
  MemoryMapEntry() = default;
  MemoryMapEntry(ProcessAddress_t start, ProcessAddress_t end, Offset_t offset,
                 std::string &&path, inode_t inode, uint32_t prot);

  // Check if the provided address falls within the mapping
  [[nodiscard]] bool is_within(ProcessAddress_t addr) const {
    return addr >= _start && addr <= _end;
  }
  [[nodiscard]] bool intersects(const MemoryMapEntry &o) const;
  [[nodiscard]] bool is_executable() const { return _prot & PROT_EXEC; }
  // Executable mapping of a file that can be opened for symbols
  [[nodiscard]] bool is_symbolizable() const {
    return is_executable() && has_relevant_path(_type);
  }

  // Position of a process address in the backing file
  [[nodiscard]] Offset_t file_offset_of(ProcessAddress_t addr) const {
    return addr - _start + _offset;
  }

  [[nodiscard]] std::string to_string() const;

  ProcessAddress_t _start{};
  ProcessAddress_t _end{}; // inclusive
  Offset_t _offset{};
  std::string _path;
  inode_t _inode{};
  uint32_t _prot{};
  DsoType _type{DsoType::kUndef};
  // file was unlinked while mapped
  bool _deleted{false};
};

} // namespace beeprof
