// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "kallsyms.hpp"

#include "beeres.hpp"
#include "defer.hpp"
#include "unique_fd.hpp"

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace beeprof {

namespace {
// A text symbol followed by nothing of its own code region is assumed to fit
// in the rest of its page plus one page
constexpr ProcessAddress_t k_page_size = 4096;

ProcessAddress_t bounded_end(ProcessAddress_t start) {
  return (start & ~(k_page_size - 1)) + 2 * k_page_size;
}
} // namespace

bool KernelSymbols::parse_line(std::string_view line, KernelSymbol &symbol) {
  if (line.ends_with('\n')) {
    line.remove_suffix(1);
  }
  std::vector<std::string_view> fields =
      absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  if (fields.size() < 3 || fields[1].size() != 1) {
    return false;
  }
  char const type = fields[1][0];
  if (type != 't' && type != 'T' && type != 'w' && type != 'W') {
    return false;
  }
  if (!absl::SimpleHexAtoi(fields[0], &symbol.start)) {
    return false;
  }
  symbol.name = std::string(fields[2]);
  symbol.module.clear();
  if (fields.size() > 3 && fields[3].starts_with('[') &&
      fields[3].ends_with(']')) {
    symbol.module = std::string(fields[3].substr(1, fields[3].size() - 2));
  }
  return true;
}

BeeRes KernelSymbols::load(std::string_view path) {
  _symbols.clear();
  _loaded = false;
  std::string const path_str{path};
  UniqueFile file{fopen(path_str.c_str(), "re")};
  if (!file) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_KALLSYMS, "Unable to open %s",
                           path_str.c_str());
  }

  char *buf = nullptr;
  defer { free(buf); };
  size_t sz_buf = 0;
  bool all_zero = true;
  KernelSymbol symbol;
  while (-1 != getline(&buf, &sz_buf, file.get())) {
    if (!parse_line(buf, symbol)) {
      continue;
    }
    all_zero = all_zero && symbol.start == 0;
    _symbols.push_back(std::move(symbol));
  }
  if (_symbols.empty() || all_zero) {
    _symbols.clear();
    BEERES_RETURN_WARN_LOG(BEE_WHAT_KALLSYMS,
                           "Kernel symbols hidden, consider lowering "
                           "kernel.kptr_restrict");
  }
  std::ranges::stable_sort(_symbols, {}, &KernelSymbol::start);
  // a symbol ends where the next one of the same code region starts
  for (size_t i = 0; i < _symbols.size(); ++i) {
    KernelSymbol &current = _symbols[i];
    ProcessAddress_t end = bounded_end(current.start);
    if (i + 1 < _symbols.size()) {
      const KernelSymbol &next = _symbols[i + 1];
      ProcessAddress_t const next_start =
          std::max(current.start + 1, next.start);
      end = next.module == current.module ? next_start
                                          : std::min(end, next_start);
    }
    current.end = end;
  }
  _loaded = true;
  LG_NFO("Loaded %zu kernel symbols", _symbols.size());
  return {};
}

const KernelSymbol *KernelSymbols::find(ProcessAddress_t addr) const {
  auto it = std::ranges::upper_bound(_symbols, addr, {}, &KernelSymbol::start);
  if (it == _symbols.begin()) {
    return nullptr;
  }
  const KernelSymbol &symbol = *std::prev(it);
  return addr < symbol.end ? &symbol : nullptr;
}

} // namespace beeprof
