// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "beeres_def.hpp"
#include "symbol.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <elfutils/libdwfl.h>

namespace beeprof {

struct Segment {
  ElfAddress_t vaddr{};
  Offset_t offset{};
  Offset_t filesz{};
};

// PT_LOAD segment holding the file offset
const Segment *find_load_segment(const std::vector<Segment> &segments,
                                 Offset_t file_offset);

// Debug metadata of one ELF file: symbol table, line table and inlining
// information, through an offline libdwfl session. Addresses are ELF virtual
// addresses (the module is reported without bias).
class ModuleSymbols {
public:
  static BeeRes load(const std::string &path, const std::string &debug_path,
                     std::unique_ptr<ModuleSymbols> &module);

  ~ModuleSymbols();
  ModuleSymbols(const ModuleSymbols &) = delete;
  ModuleSymbols &operator=(const ModuleSymbols &) = delete;

  // Converts an offset in the file to an ELF address through PT_LOAD
  [[nodiscard]] std::optional<ElfAddress_t>
  to_elf_address(Offset_t file_offset) const;

  // Frames covering the ELF address, innermost first. Returns false when no
  // symbol covers the address.
  bool resolve(ElfAddress_t elf_addr, ProcessAddress_t process_addr,
               bool expand_inlined, std::vector<ResolvedFrame> &frames) const;

  [[nodiscard]] const std::string &name() const { return _name; }
  [[nodiscard]] const std::string &path() const { return _path; }
  [[nodiscard]] const std::string &build_id() const { return _build_id; }
  [[nodiscard]] const std::vector<Segment> &segments() const {
    return _segments;
  }

private:
  ModuleSymbols() = default;

  Dwfl_Callbacks _callbacks{};
  std::string _debug_path;
  char *_debug_path_ptr{nullptr};
  Dwfl *_dwfl{nullptr};
  Dwfl_Module *_mod{nullptr};
  std::string _path;
  std::string _name;
  std::string _build_id;
  std::vector<Segment> _segments;
};

} // namespace beeprof
