// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "process_map_cache.hpp"

#include "loghandle.hpp"

#include <absl/strings/str_format.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace beeprof {

namespace {

// Fake procfs root: <root>/proc/<pid>/maps
class FakeProc {
public:
  FakeProc() {
    char tmpl[] = "/tmp/beeprof-proc-XXXXXX";
    const char *dir = mkdtemp(tmpl);
    if (dir) {
      _root = dir;
    }
  }
  ~FakeProc() {
    std::error_code ec;
    std::filesystem::remove_all(_root, ec);
  }
  FakeProc(const FakeProc &) = delete;
  FakeProc &operator=(const FakeProc &) = delete;

  void add_process(pid_t pid, const std::string &maps) const {
    std::filesystem::path const dir =
        std::filesystem::path(_root) / "proc" / std::to_string(pid);
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "maps") << maps;
  }

  [[nodiscard]] const std::string &root() const { return _root; }

private:
  std::string _root;
};

constexpr std::string_view k_maps =
    "00400000-00452000 r-xp 00000000 08:02 173521      /usr/bin/dbus-daemon\n"
    "00e03000-00e24000 rw-p 00000000 00:00 0           [heap]\n"
    "7f2f09f5c000-7f2f0a0d4000 r-xp 00000000 08:02 135522  "
    "/usr/lib64/libc-2.15.so\n";

struct FakeClock {
  ProcessMapCache::Clock::time_point now{};
};

} // namespace

TEST(ProcessMapCache, snapshot_once) {
  LogHandle handle;
  FakeProc proc;
  ASSERT_FALSE(proc.root().empty());
  proc.add_process(12, std::string(k_maps));

  ProcessMapCache cache(std::chrono::seconds(60), proc.root());
  auto maps = cache.get(12);
  ASSERT_TRUE(maps);
  EXPECT_EQ(maps->size(), 3);
  const MemoryMapEntry *entry = maps->find(0x7f2f09f5c100);
  ASSERT_TRUE(entry);
  EXPECT_EQ(entry->_path, "/usr/lib64/libc-2.15.so");

  // later maps changes are not observed
  proc.add_process(12, "00400000-00452000 r-xp 00000000 08:02 1 /other\n");
  auto again = cache.get(12);
  EXPECT_EQ(again, maps);
  EXPECT_EQ(cache.nb_snapshots(), 1);
}

TEST(ProcessMapCache, exited_process) {
  LogHandle handle;
  FakeProc proc;
  ProcessMapCache cache(std::chrono::seconds(60), proc.root());
  EXPECT_EQ(cache.get(77), nullptr);
  EXPECT_TRUE(cache.contains(77));
  EXPECT_TRUE(cache.is_exited(77));
  // the failure is remembered
  EXPECT_EQ(cache.get(77), nullptr);
  EXPECT_EQ(cache.nb_snapshots(), 1);
}

TEST(ProcessMapCache, exit_notification) {
  LogHandle handle;
  FakeProc proc;
  proc.add_process(12, std::string(k_maps));
  proc.add_process(13, std::string(k_maps));
  ProcessMapCache cache(std::chrono::seconds(60), proc.root());
  cache.prefetch(12);
  cache.prefetch(13);
  EXPECT_EQ(cache.size(), 2);

  cache.notify_exit(12);
  // samples of the cycle that saw the exit can still be symbolized
  cache.end_cycle();
  EXPECT_TRUE(cache.contains(12));
  cache.end_cycle();
  EXPECT_FALSE(cache.contains(12));
  EXPECT_TRUE(cache.contains(13));
}

TEST(ProcessMapCache, idle_timeout) {
  LogHandle handle;
  FakeProc proc;
  proc.add_process(12, std::string(k_maps));
  proc.add_process(13, std::string(k_maps));
  auto clock = std::make_shared<FakeClock>();
  ProcessMapCache cache(std::chrono::seconds(10), proc.root(),
                        [clock]() { return clock->now; });
  cache.prefetch(12);
  cache.prefetch(13);

  clock->now += std::chrono::seconds(6);
  // 13 is used again
  EXPECT_TRUE(cache.get(13));
  cache.end_cycle();
  EXPECT_EQ(cache.size(), 2);

  clock->now += std::chrono::seconds(5);
  cache.end_cycle();
  EXPECT_FALSE(cache.contains(12));
  EXPECT_TRUE(cache.contains(13));

  // evicted pids are read again on the next observation
  EXPECT_TRUE(cache.get(12));
  EXPECT_EQ(cache.nb_snapshots(), 3);
}

} // namespace beeprof
