// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace beeprof {

inline constexpr std::string_view k_unknown_label = "[unknown]";
inline constexpr std::string_view k_kernel_module_name = "[kernel.kallsyms]";

struct ResolvedFrame {
  std::string module;
  std::string function; // demangled
  std::optional<std::string> file;
  std::optional<uint32_t> line;
  ProcessAddress_t address{};
  // position in the module file, used when no function name is known
  Offset_t module_offset{};
  bool inlined{false};
};

// One raw address can expand to several logical frames (inlining),
// innermost first
struct Resolved {
  std::vector<ResolvedFrame> frames;
};

enum class UnresolvedReason : uint8_t {
  kNoMapping,        // address outside of every known mapping
  kProcessExited,    // pid gone before its mappings were read
  kNotFileBacked,    // anonymous, vdso, heap...
  kModuleError,      // module could not be opened or parsed
  kNoSymbol,         // module loaded, no symbol covers the address
  kKernelNoSymbol,   // kernel address with no kallsyms entry
};

struct Unresolved {
  ProcessAddress_t address{};
  UnresolvedReason reason{UnresolvedReason::kNoMapping};
  // empty when no mapping is known
  std::string module;
  Offset_t module_offset{};
};

using SymbolResult = std::variant<Resolved, Unresolved>;

const char *unresolved_reason_str(UnresolvedReason reason);

// Labels of a result, innermost first. Unresolved frames give
// `module+0xoffset` when the module is known. User addresses outside of any
// known mapping give `[unknown] 0xaddress`, other frames `[unknown]`.
void append_labels(const SymbolResult &result, std::vector<std::string> &labels);

} // namespace beeprof
