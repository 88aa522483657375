// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "symbol.hpp"

#include <absl/strings/str_format.h>

namespace beeprof {

const char *unresolved_reason_str(UnresolvedReason reason) {
  switch (reason) {
  case UnresolvedReason::kNoMapping:
    return "no mapping";
  case UnresolvedReason::kProcessExited:
    return "process exited";
  case UnresolvedReason::kNotFileBacked:
    return "not file backed";
  case UnresolvedReason::kModuleError:
    return "module error";
  case UnresolvedReason::kNoSymbol:
    return "no symbol";
  case UnresolvedReason::kKernelNoSymbol:
    return "no kernel symbol";
  }
  return "unknown";
}

void append_labels(const SymbolResult &result,
                   std::vector<std::string> &labels) {
  if (const auto *resolved = std::get_if<Resolved>(&result)) {
    for (const auto &frame : resolved->frames) {
      if (!frame.function.empty()) {
        labels.push_back(frame.function);
      } else if (!frame.module.empty()) {
        labels.push_back(absl::StrFormat("%s+0x%x", frame.module,
                                         frame.module_offset));
      } else {
        labels.emplace_back(k_unknown_label);
      }
    }
    return;
  }
  const auto &unresolved = std::get<Unresolved>(result);
  if (!unresolved.module.empty()) {
    labels.push_back(absl::StrFormat("%s+0x%x", unresolved.module,
                                     unresolved.module_offset));
    return;
  }
  switch (unresolved.reason) {
  case UnresolvedReason::kNoMapping:
  case UnresolvedReason::kProcessExited:
    // the raw address is all that is known about the frame
    labels.push_back(
        absl::StrFormat("%s 0x%x", k_unknown_label, unresolved.address));
    break;
  default:
    labels.emplace_back(k_unknown_label);
    break;
  }
}

} // namespace beeprof
