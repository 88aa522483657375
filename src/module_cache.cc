// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "module_cache.hpp"

#include "beeprof_stats.hpp"
#include "beeres.hpp"
#include "build_id.hpp"

#include <absl/strings/str_format.h>
#include <sys/stat.h>

namespace beeprof {

namespace {
bool stat_file(const std::string &path, FileInfoKey &key) {
  struct stat info;
  if (stat(path.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
    return false;
  }
  key._dev = info.st_dev;
  key._inode = info.st_ino;
  key._mtime_ns = static_cast<int64_t>(info.st_mtim.tv_sec) * 1000000000 +
      info.st_mtim.tv_nsec;
  key._size = info.st_size;
  return true;
}
} // namespace

ModuleCache::ModuleCache(std::string debug_path, std::string path_to_proc)
    : _debug_path(std::move(debug_path)),
      _path_to_proc(std::move(path_to_proc)) {}

std::string ModuleCache::find_module_path(pid_t pid,
                                          const MemoryMapEntry &entry,
                                          FileInfoKey &file_key) const {
  // Paths are relative to the mount namespace of the process
  std::string candidates[] = {
      absl::StrFormat("%s/proc/%d/root%s", _path_to_proc, pid, entry._path),
      entry._path,
      // unlinked files stay reachable while mapped
      absl::StrFormat("%s/proc/%d/map_files/%x-%x", _path_to_proc, pid,
                      entry._start, entry._end + 1),
  };
  for (auto &candidate : candidates) {
    if (stat_file(candidate, file_key) &&
        (entry._inode == 0 || file_key._inode == entry._inode)) {
      return std::move(candidate);
    }
  }
  return {};
}

const ModuleSymbols *ModuleCache::get(pid_t pid, const MemoryMapEntry &entry) {
  FileInfoKey file_key;
  std::string const path = find_module_path(pid, entry, file_key);
  if (path.empty()) {
    LG_DBG("[Mod] Unable to find %s for pid %d", entry._path.c_str(), pid);
    return nullptr;
  }

  auto file_it = _files.find(file_key);
  if (file_it != _files.end()) {
    return file_it->second;
  }

  ModuleKey module_key;
  auto maybe_build_id = find_build_id(path.c_str());
  if (maybe_build_id) {
    module_key._build_id = std::move(*maybe_build_id);
  } else {
    module_key._path = entry._path;
    module_key._inode = file_key._inode;
    module_key._mtime_ns = file_key._mtime_ns;
  }
  auto module_it = _modules.find(module_key);
  if (module_it != _modules.end()) {
    LG_DBG("[Mod] %s shares its build id with %s", path.c_str(),
           module_it->second->path().c_str());
    _files.emplace(file_key, module_it->second.get());
    return module_it->second.get();
  }

  ++_nb_parsed;
  beeprof_stats_add(STATS_MODULE_LOADS, 1, nullptr);
  std::unique_ptr<ModuleSymbols> module;
  BeeRes const res = ModuleSymbols::load(path, _debug_path, module);
  if (IsBeeResNotOK(res)) {
    // avoid bouncing on errors
    _files.emplace(file_key, nullptr);
    return nullptr;
  }
  module_it = _modules.emplace(std::move(module_key), std::move(module)).first;
  const ModuleSymbols *symbols = module_it->second.get();
  _files.emplace(file_key, symbols);
  return symbols;
}

} // namespace beeprof
