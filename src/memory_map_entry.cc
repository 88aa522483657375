// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "memory_map_entry.hpp"

#include <absl/strings/str_format.h>

namespace beeprof {

namespace {
constexpr std::string_view s_vdso_str = "[vdso]";
constexpr std::string_view s_vsyscall_str = "[vsyscall]";
constexpr std::string_view s_stack_str = "[stack]";
constexpr std::string_view s_heap_str = "[heap]";
constexpr std::string_view s_anon_str = "//anon";
constexpr std::string_view s_anon_2_str = "[anon";
constexpr std::string_view s_mem_fd_str = "/memfd";
// Example of these include : anon_inode:[perf_event]
constexpr std::string_view s_anon_inode_str = "anon_inode";
// Example socket:[123456]
constexpr std::string_view s_socket_str = "socket";
constexpr std::string_view s_dev_zero_str = "/dev/zero";
constexpr std::string_view s_dev_null_str = "/dev/null";
constexpr std::string_view s_deleted_str = " (deleted)";
} // namespace

DsoType determine_dso_type(std::string_view file_path) {
  if (file_path.starts_with(s_vdso_str)) {
    return DsoType::kVdso;
  }
  if (file_path.starts_with(s_vsyscall_str)) {
    return DsoType::kVsysCall;
  }
  if (file_path.starts_with(s_stack_str)) {
    return DsoType::kStack;
  }
  if (file_path.starts_with(s_heap_str)) {
    return DsoType::kHeap;
  }
  if (file_path.empty() || file_path.starts_with(s_anon_str) ||
      file_path.starts_with(s_anon_inode_str) ||
      file_path.starts_with(s_anon_2_str) ||
      file_path.starts_with(s_dev_zero_str) ||
      file_path.starts_with(s_dev_null_str) ||
      file_path.starts_with(s_mem_fd_str)) {
    return DsoType::kAnon;
  }
  if (file_path.starts_with(s_socket_str)) {
    return DsoType::kSocket;
  }
  if (file_path[0] == '[') {
    return DsoType::kUndef;
  }
  return DsoType::kStandard;
}

MemoryMapEntry::MemoryMapEntry(ProcessAddress_t start, ProcessAddress_t end,
                               Offset_t offset, std::string &&path,
                               inode_t inode, uint32_t prot)
    : _start(start), _end(end), _offset(offset), _path(std::move(path)),
      _inode(inode), _prot(prot) {
  if (_path.ends_with(s_deleted_str)) {
    _path.resize(_path.size() - s_deleted_str.size());
    _deleted = true;
  }
  _type = determine_dso_type(_path);
}

bool MemoryMapEntry::intersects(const MemoryMapEntry &o) const {
  if (_start < o._start) {
    return _end >= o._start;
  }
  return o._end >= _start;
}

std::string MemoryMapEntry::to_string() const {
  return absl::StrFormat("%x-%x %x (%s)(T-%s)(%c%c%c)", _start, _end, _offset,
                         _path, dso_type_str(_type),
                         _prot & PROT_READ ? 'r' : '-',
                         _prot & PROT_WRITE ? 'w' : '-',
                         _prot & PROT_EXEC ? 'x' : '-');
}

} // namespace beeprof
