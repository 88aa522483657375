// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "symbolizer.hpp"

#include "beeprof_stats.hpp"
#include "logger.hpp"

namespace beeprof {

Symbolizer::Symbolizer(SymbolizerOptions options, ProcessMapCache &map_cache)
    : _options(std::move(options)), _map_cache(map_cache),
      _module_cache(_options.debug_path, _options.path_to_proc) {}

const ModuleSymbols *Symbolizer::module_for(pid_t pid,
                                            const MemoryMapEntry &entry) {
  MappingKey const key{pid, entry._start, entry._inode};
  auto it = _batch_modules.find(key);
  if (it != _batch_modules.end()) {
    return it->second;
  }
  const ModuleSymbols *module = _module_cache.get(pid, entry);
  _batch_modules.emplace(key, module);
  return module;
}

SymbolResult Symbolizer::symbolize_user(pid_t pid, ProcessAddress_t addr,
                                        bool is_return_address) {
  auto maps = _map_cache.get(pid);
  if (!maps) {
    return Unresolved{addr, UnresolvedReason::kProcessExited, {}, 0};
  }
  const MemoryMapEntry *entry = maps->find(addr);
  if (!entry) {
    return Unresolved{addr, UnresolvedReason::kNoMapping, {}, 0};
  }
  Offset_t const module_offset = entry->file_offset_of(addr);
  std::string module_name = has_relevant_path(entry->_type)
      ? entry->_path.substr(entry->_path.rfind('/') + 1)
      : std::string(dso_type_label(entry->_type));
  if (!entry->is_symbolizable()) {
    return Unresolved{addr, UnresolvedReason::kNotFileBacked,
                      std::move(module_name), module_offset};
  }

  const ModuleSymbols *module = module_for(pid, *entry);
  if (!module) {
    return Unresolved{addr, UnresolvedReason::kModuleError,
                      std::move(module_name), module_offset};
  }
  auto elf_addr = module->to_elf_address(module_offset);
  if (!elf_addr) {
    LG_DBG("No LOAD segment for offset %lx in %s", module_offset,
           module->path().c_str());
    return Unresolved{addr, UnresolvedReason::kModuleError,
                      std::move(module_name), module_offset};
  }

  // return addresses point after the call instruction
  ElfAddress_t const lookup_addr =
      is_return_address && *elf_addr > 0 ? *elf_addr - 1 : *elf_addr;
  Resolved resolved;
  if (!module->resolve(lookup_addr, addr, _options.inlined_functions,
                       resolved.frames)) {
    return Unresolved{addr, UnresolvedReason::kNoSymbol,
                      std::move(module_name), module_offset};
  }
  for (auto &frame : resolved.frames) {
    frame.module_offset = module_offset;
  }
  return resolved;
}

SymbolResult Symbolizer::symbolize_kernel(ProcessAddress_t addr) {
  if (!_kernel_symbols_attempted) {
    _kernel_symbols_attempted = true;
    if (_options.kernel_symbols) {
      // unavailable kernel symbols degrade to [unknown] labels
      BeeRes const res = _kernel_symbols.load(_options.kallsyms_path);
      if (IsBeeResNotOK(res)) {
        LG_NTC("Kernel frames will not be symbolized");
      }
    }
  }
  const KernelSymbol *symbol = _kernel_symbols.find(addr);
  if (!symbol) {
    return Unresolved{addr, UnresolvedReason::kKernelNoSymbol, {}, 0};
  }
  ResolvedFrame frame;
  frame.module = symbol->module.empty() ? std::string(k_kernel_module_name)
                                        : symbol->module;
  frame.function = symbol->name;
  frame.address = addr;
  return Resolved{{std::move(frame)}};
}

void Symbolizer::count_result(const SymbolResult &result) {
  if (std::holds_alternative<Resolved>(result)) {
    beeprof_stats_add(STATS_RESOLVED_FRAMES, 1, nullptr);
  } else {
    beeprof_stats_add(STATS_UNRESOLVED_FRAMES, 1, nullptr);
  }
}

void Symbolizer::user_labels(pid_t pid, std::span<const uint64_t> addresses,
                             std::vector<std::string> &labels) {
  for (size_t i = 0; i < addresses.size(); ++i) {
    SymbolResult const result = symbolize_user(pid, addresses[i], i != 0);
    count_result(result);
    append_labels(result, labels);
  }
}

void Symbolizer::kernel_labels(std::span<const uint64_t> addresses,
                               std::vector<std::string> &labels) {
  for (uint64_t const addr : addresses) {
    SymbolResult const result = symbolize_kernel(addr);
    count_result(result);
    append_labels(result, labels);
  }
}

void Symbolizer::end_batch() { _batch_modules.clear(); }

} // namespace beeprof
