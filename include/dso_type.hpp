// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace beeprof {

enum class DsoType : uint8_t {
  kStandard = 0, // meaning backed by a file that we can open
  kVdso,
  kVsysCall,
  kStack,
  kHeap,
  kUndef,
  kAnon,
  kSocket,
  kNbDsoTypes
};

inline bool has_relevant_path(DsoType dso_type) {
  return dso_type == DsoType::kStandard;
}

inline const char *dso_type_str(DsoType path_type) {
  switch (path_type) {
  case DsoType::kStandard:
    return "Standard";
  case DsoType::kVdso:
    return "Vdso";
  case DsoType::kVsysCall:
    return "VsysCall";
  case DsoType::kStack:
    return "Stack";
  case DsoType::kHeap:
    return "Heap";
  case DsoType::kUndef:
    return "Undefined";
  case DsoType::kAnon:
    return "Anonymous";
  case DsoType::kSocket:
    return "Socket";
  default:
    break;
  }
  return "Unhandled";
}

// Label used in folded stacks when a mapping has no usable file
inline std::string_view dso_type_label(DsoType dso_type) {
  switch (dso_type) {
  case DsoType::kVdso:
    return "[vdso]";
  case DsoType::kVsysCall:
    return "[vsyscall]";
  case DsoType::kStack:
    return "[stack]";
  case DsoType::kHeap:
    return "[heap]";
  case DsoType::kAnon:
    return "[anon]";
  case DsoType::kSocket:
    return "[socket]";
  default:
    break;
  }
  return "[unknown]";
}

DsoType determine_dso_type(std::string_view file_path);

} // namespace beeprof
