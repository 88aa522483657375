// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "hash_helper.hpp"
#include "memory_map_entry.hpp"
#include "module_symbols.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>
#include <unordered_map>

namespace beeprof {

/// Defines file uniqueness
/// Considering we can have the same path within several containers, we check
/// device and inode
struct FileInfoKey {
  bool operator==(const FileInfoKey &o) const = default;
  uint64_t _dev{};
  inode_t _inode{};
  int64_t _mtime_ns{};
  int64_t _size{};
};

/// Identity of the debug metadata: the build id when the file has one,
/// the path with inode and modification time otherwise
struct ModuleKey {
  bool operator==(const ModuleKey &o) const = default;
  std::string _build_id;
  std::string _path;
  inode_t _inode{};
  int64_t _mtime_ns{};
};

} // namespace beeprof

namespace std {
template <> struct hash<beeprof::FileInfoKey> {
  std::size_t operator()(const beeprof::FileInfoKey &k) const {
    std::size_t seed = 0;
    beeprof::hash_combine(seed, k._dev);
    beeprof::hash_combine(seed, k._inode);
    beeprof::hash_combine(seed, k._mtime_ns);
    beeprof::hash_combine(seed, k._size);
    return seed;
  }
};

template <> struct hash<beeprof::ModuleKey> {
  std::size_t operator()(const beeprof::ModuleKey &k) const {
    std::size_t seed = 0;
    beeprof::hash_combine(seed, k._build_id);
    beeprof::hash_combine(seed, k._path);
    beeprof::hash_combine(seed, k._inode);
    beeprof::hash_combine(seed, k._mtime_ns);
    return seed;
  }
};
} // namespace std

namespace beeprof {

// Process wide cache of module debug metadata. Each module is parsed at most
// once per run; files that failed to load are remembered and not retried.
// Used from the processing thread only.
class ModuleCache {
public:
  explicit ModuleCache(std::string debug_path = {},
                       std::string path_to_proc = {});

  // Symbols of the file backing the mapping, nullptr when unavailable
  const ModuleSymbols *get(pid_t pid, const MemoryMapEntry &entry);

  // Number of module parses (successful or not)
  [[nodiscard]] uint64_t nb_parsed() const { return _nb_parsed; }
  [[nodiscard]] size_t nb_modules() const { return _modules.size(); }

private:
  // Path usable from our mount namespace, empty when not found
  std::string find_module_path(pid_t pid, const MemoryMapEntry &entry,
                               FileInfoKey &file_key) const;

  std::string _debug_path;
  std::string _path_to_proc;
  std::unordered_map<FileInfoKey, const ModuleSymbols *> _files;
  std::unordered_map<ModuleKey, std::unique_ptr<ModuleSymbols>> _modules;
  uint64_t _nb_parsed{0};
};

} // namespace beeprof
