// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "module_symbols.hpp"

#include "beeres.hpp"
#include "build_id.hpp"
#include "defer.hpp"
#include "demangler.hpp"
#include "dwarf_helpers.hpp"
#include "unique_fd.hpp"

#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <gelf.h>
#include <libelf.h>
#include <unistd.h>

namespace beeprof {

namespace {

BeeRes read_load_segments(Elf *elf, const std::string &filepath,
                          std::vector<Segment> &segments) {
  GElf_Ehdr ehdr_mem;
  GElf_Ehdr *ehdr = gelf_getehdr(elf, &ehdr_mem);
  if (ehdr == nullptr) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_INVALID_ELF, "Invalid elf %s",
                           filepath.c_str());
  }
  if (ehdr->e_type != ET_EXEC && ehdr->e_type != ET_DYN) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_INVALID_ELF,
                           "Unsupported elf type (%d) %s", ehdr->e_type,
                           filepath.c_str());
  }
  size_t phnum;
  if (unlikely(elf_getphdrnum(elf, &phnum) != 0)) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_INVALID_ELF, "Invalid elf %s",
                           filepath.c_str());
  }
  for (size_t i = 0; i < phnum; ++i) {
    GElf_Phdr phdr_mem;
    GElf_Phdr *ph = gelf_getphdr(elf, i, &phdr_mem);
    if (unlikely(ph == nullptr)) {
      BEERES_RETURN_WARN_LOG(BEE_WHAT_INVALID_ELF, "Invalid elf %s",
                             filepath.c_str());
    }
    if (ph->p_type == PT_LOAD) {
      segments.push_back({ph->p_vaddr, ph->p_offset, ph->p_filesz});
    }
  }
  if (segments.empty()) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_NO_MATCHING_LOAD_SEGMENT,
                           "No LOAD segment in %s", filepath.c_str());
  }
  return {};
}

std::string module_name_from_path(const std::string &path) {
  auto pos = path.rfind('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}
} // namespace

const Segment *find_load_segment(const std::vector<Segment> &segments,
                                 Offset_t file_offset) {
  auto it = std::ranges::find_if(segments, [&](const Segment &segment) {
    return file_offset >= segment.offset &&
        file_offset < segment.offset + segment.filesz;
  });
  return it == segments.end() ? nullptr : &*it;
}

BeeRes ModuleSymbols::load(const std::string &path,
                           const std::string &debug_path,
                           std::unique_ptr<ModuleSymbols> &module) {
  std::unique_ptr<ModuleSymbols> loaded{new ModuleSymbols()};
  loaded->_path = path;
  loaded->_name = module_name_from_path(path);

  UniqueFd fd_holder{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
  if (!fd_holder) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_MODULE,
                           "[Mod] Couldn't open fd to module (%s)",
                           path.c_str());
  }

  elf_version(EV_CURRENT);
  {
    Elf *elf = elf_begin(fd_holder.get(), ELF_C_READ_MMAP, nullptr);
    if (elf == nullptr) {
      BEERES_RETURN_WARN_LOG(BEE_WHAT_INVALID_ELF, "Invalid elf %s",
                             path.c_str());
    }
    defer { elf_end(elf); };
    BEERES_CHECK_FWD_STRICT(
        read_load_segments(elf, path, loaded->_segments));
    auto maybe_build_id = find_build_id(elf);
    if (maybe_build_id) {
      loaded->_build_id = std::move(*maybe_build_id);
    }
  }

  // for split debug, the search path uses the elfutils syntax
  loaded->_debug_path = debug_path;
  loaded->_debug_path_ptr =
      loaded->_debug_path.empty() ? nullptr : loaded->_debug_path.data();
  loaded->_callbacks = {
      .find_elf = dwfl_build_id_find_elf,
      .find_debuginfo = dwfl_standard_find_debuginfo,
      .section_address = dwfl_offline_section_address,
      .debuginfo_path =
          loaded->_debug_path_ptr ? &loaded->_debug_path_ptr : nullptr,
  };
  loaded->_dwfl = dwfl_begin(&loaded->_callbacks);
  if (!loaded->_dwfl) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_DWFL_LIB_ERROR, "dwfl_begin failed (%s)",
                           dwfl_errmsg(-1));
  }

  dwfl_report_begin(loaded->_dwfl);
  loaded->_mod = dwfl_report_elf(loaded->_dwfl, loaded->_name.c_str(),
                                 path.c_str(), fd_holder.get(), 0, true);
  if (!loaded->_mod) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_MODULE, "Couldn't report module %s (%s)",
                           path.c_str(), dwfl_errmsg(-1));
  }
  // dwfl now has ownership of the file descriptor
  (void)fd_holder.release(); // NOLINT
  if (dwfl_report_end(loaded->_dwfl, nullptr, nullptr) != 0) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_DWFL_LIB_ERROR,
                           "dwfl_report_end failed (%s)", dwfl_errmsg(-1));
  }

  LG_NFO("Loaded module %s build-id: %s", path.c_str(),
         loaded->_build_id.empty() ? "none" : loaded->_build_id.c_str());
  module = std::move(loaded);
  return {};
}

ModuleSymbols::~ModuleSymbols() {
  if (_dwfl) {
    dwfl_end(_dwfl);
  }
}

std::optional<ElfAddress_t>
ModuleSymbols::to_elf_address(Offset_t file_offset) const {
  const Segment *segment = find_load_segment(_segments, file_offset);
  if (!segment) {
    return std::nullopt;
  }
  return file_offset - segment->offset + segment->vaddr;
}

bool ModuleSymbols::resolve(ElfAddress_t elf_addr,
                            ProcessAddress_t process_addr, bool expand_inlined,
                            std::vector<ResolvedFrame> &frames) const {
  GElf_Off sym_offset = 0;
  GElf_Sym sym;
  const char *sym_name = dwfl_module_addrinfo(
      _mod, elf_addr, &sym_offset, &sym, nullptr, nullptr, nullptr);

  // Source location of the address itself (innermost frame)
  const char *src_file = nullptr;
  int src_line = 0;
  if (Dwfl_Line *line = dwfl_module_getsrc(_mod, elf_addr)) {
    src_file = dwfl_lineinfo(line, nullptr, &src_line, nullptr, nullptr,
                             nullptr);
  }

  std::vector<InlinedScope> scopes;
  const char *subprogram_name = nullptr;
  if (expand_inlined) {
    Dwarf_Addr cu_bias = 0;
    if (Dwarf_Die *cudie = dwfl_module_addrdie(_mod, elf_addr, &cu_bias)) {
      collect_inlined_scopes(cudie, elf_addr - cu_bias, scopes,
                             &subprogram_name);
    }
  }

  const char *outer_name = sym_name ? sym_name : subprogram_name;
  if (!outer_name && scopes.empty()) {
    return false;
  }

  auto make_frame = [&](const char *name, const char *file, int line,
                        bool inlined) {
    ResolvedFrame frame;
    frame.module = _name;
    frame.function = name ? demangle(name) : std::string{};
    if (file) {
      frame.file = file;
    }
    if (line > 0) {
      frame.line = static_cast<uint32_t>(line);
    }
    frame.address = process_addr;
    frame.inlined = inlined;
    return frame;
  };

  // Each inlined scope is located by the call site recorded in its callee
  const char *file = src_file;
  int line = src_line;
  for (const InlinedScope &scope : scopes) {
    frames.push_back(make_frame(scope.func_name, file, line, true));
    file = scope.call_file;
    line = scope.call_line;
  }
  frames.push_back(make_frame(outer_name, file, line, false));
  return true;
}

} // namespace beeprof
