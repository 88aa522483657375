// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "frame_labeler.hpp"
#include "hash_helper.hpp"
#include "kallsyms.hpp"
#include "module_cache.hpp"
#include "process_map_cache.hpp"
#include "symbol.hpp"

#include <span>
#include <string>
#include <sys/types.h>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace beeprof {

struct SymbolizerOptions {
  // elfutils debuginfo_path syntax
  std::string debug_path;
  bool inlined_functions{true};
  bool kernel_symbols{true};
  std::string path_to_proc;
  std::string kallsyms_path{"/proc/kallsyms"};
};

// Turns raw addresses into frames. Never fails a stack: addresses that
// cannot be resolved give an Unresolved result.
class Symbolizer : public FrameLabeler {
public:
  Symbolizer(SymbolizerOptions options, ProcessMapCache &map_cache);

  SymbolResult symbolize_user(pid_t pid, ProcessAddress_t addr,
                              bool is_return_address);
  SymbolResult symbolize_kernel(ProcessAddress_t addr);

  // Labels of a raw stack (innermost first in, innermost first out)
  void user_labels(pid_t pid, std::span<const uint64_t> addresses,
                   std::vector<std::string> &labels) override;
  void kernel_labels(std::span<const uint64_t> addresses,
                     std::vector<std::string> &labels) override;

  // Drops per-batch memoization
  void end_batch() override;

  [[nodiscard]] const ModuleCache &module_cache() const {
    return _module_cache;
  }
  [[nodiscard]] const KernelSymbols &kernel_symbols() const {
    return _kernel_symbols;
  }

private:
  using MappingKey = std::tuple<pid_t, ProcessAddress_t, inode_t>;
  struct MappingKeyHash {
    size_t operator()(const MappingKey &key) const {
      size_t seed = 0;
      hash_combine(seed, std::get<0>(key));
      hash_combine(seed, std::get<1>(key));
      hash_combine(seed, std::get<2>(key));
      return seed;
    }
  };

  const ModuleSymbols *module_for(pid_t pid, const MemoryMapEntry &entry);
  void count_result(const SymbolResult &result);

  SymbolizerOptions _options;
  ProcessMapCache &_map_cache;
  ModuleCache _module_cache;
  KernelSymbols _kernel_symbols;
  bool _kernel_symbols_attempted{false};
  std::unordered_map<MappingKey, const ModuleSymbols *, MappingKeyHash>
      _batch_modules;
};

} // namespace beeprof
