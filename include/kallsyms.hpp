// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "beeres_def.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace beeprof {

struct KernelSymbol {
  ProcessAddress_t start{};
  // exclusive, set when loading
  ProcessAddress_t end{};
  std::string name;
  // loadable kernel module, empty for the core kernel
  std::string module;
};

// Text symbols of the running kernel, read once per run
class KernelSymbols {
public:
  // Warning when the symbols are unavailable (restricted kptr)
  BeeRes load(std::string_view path = "/proc/kallsyms");

  // A symbol covers addresses up to the start of the next one. The last
  // symbol of the kernel or of a module covers at most the next page.
  [[nodiscard]] const KernelSymbol *find(ProcessAddress_t addr) const;

  [[nodiscard]] size_t size() const { return _symbols.size(); }
  [[nodiscard]] bool loaded() const { return _loaded; }

  // Parse "ffffffff81000000 T _stext [module]", false when not a text symbol
  static bool parse_line(std::string_view line, KernelSymbol &symbol);

private:
  std::vector<KernelSymbol> _symbols; // sorted by start
  bool _loaded{false};
};

} // namespace beeprof
