// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "aggregator.hpp"
#include "beeprof_stats.hpp"
#include "beeres.hpp"
#include "bpf_stack_table.hpp"
#include "defer.hpp"
#include "loghandle.hpp"
#include "profile_publisher.hpp"
#include "profiler_pipeline.hpp"
#include "symbolizer.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sys/wait.h>
#include <unistd.h>

#ifndef BEEPROF_TEST_BPF_OBJECT
#  define BEEPROF_TEST_BPF_OBJECT "beeprof.bpf.o"
#endif

extern "C" {
__attribute__((noinline)) void beeprof_test_c(volatile uint64_t *v) {
  for (int i = 0; i < 1000; ++i) {
    *v = *v * 2862933555777941757ULL + 3037000493ULL;
  }
}

__attribute__((noinline)) void beeprof_test_b(volatile uint64_t *v) {
  beeprof_test_c(v);
  asm volatile("" ::: "memory");
}

__attribute__((noinline)) void beeprof_test_a(volatile uint64_t *v) {
  beeprof_test_b(v);
  asm volatile("" ::: "memory");
}
}

namespace beeprof {

namespace {
std::string proc_comm_path(pid_t pid) {
  return "/proc/" + std::to_string(pid) + "/comm";
}

[[noreturn]] void burn_cpu() {
  volatile uint64_t v = 1;
  while (true) {
    beeprof_test_a(&v);
  }
}
} // namespace

// Needs CAP_BPF and CAP_PERFMON (or root) and the compiled probe
TEST(BpfProfile, a_b_c_at_99hz) {
  LogHandle handle(LL_NOTICE);
  if (geteuid() != 0) {
    GTEST_SKIP() << "requires root privileges";
  }
  if (!std::filesystem::exists(BEEPROF_TEST_BPF_OBJECT)) {
    GTEST_SKIP() << "probe object not found: " << BEEPROF_TEST_BPF_OBJECT;
  }
  ASSERT_TRUE(IsBeeResOK(beeprof_stats_init()));
  defer { beeprof_stats_free(); };

  pid_t const child = fork();
  ASSERT_NE(child, -1);
  if (child == 0) {
    burn_cpu();
  }
  defer {
    kill(child, SIGKILL);
    waitpid(child, nullptr, 0);
  };

  BpfProbeOptions probe_options;
  probe_options.object_path = BEEPROF_TEST_BPF_OBJECT;
  probe_options.frequency = 99;
  probe_options.stack_mode = BEEPROF_STACK_USER;
  probe_options.target_kind = BEEPROF_TARGET_PID;
  probe_options.target_pid = static_cast<uint32_t>(child);
  std::unique_ptr<BpfStackTable> table;
  BeeRes res = BpfStackTable::create(probe_options, table);
  if (IsBeeResNotOK(res)) {
    GTEST_SKIP() << "unable to load the probe: "
                 << beeres_error_message(res._what);
  }

  ProcessMapCache map_cache(std::chrono::seconds(60));
  Symbolizer symbolizer({}, map_cache);
  ProfilePublisher publisher;
  PipelineOptions options;
  options.mode = CollectionMode::kContinuous;
  options.poll_period = std::chrono::milliseconds(200);
  options.duration = std::chrono::milliseconds(2000);
  options.print_stats = false;
  ProfilerPipeline pipeline(options, *table, map_cache, symbolizer,
                            {.show_pid = false,
                             .stack_mode = BEEPROF_STACK_USER},
                            publisher);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  ASSERT_TRUE(IsBeeResOK(pipeline.wait()));

  const FoldedProfile &profile = pipeline.profile();
  // 99Hz over 2 seconds on a busy process
  EXPECT_GT(profile.total(), 100);
  EXPECT_LT(profile.total(), 300);

  std::string comm;
  std::getline(std::ifstream(proc_comm_path(child)), comm);
  ASSERT_FALSE(comm.empty());

  // one dominant line: comm;<callers>;a;b;c
  auto dominant = std::max_element(
      profile.entries().begin(), profile.entries().end(),
      [](const auto &lhs, const auto &rhs) { return lhs.second < rhs.second; });
  ASSERT_NE(dominant, profile.entries().end());
  const std::string &key = dominant->first;
  EXPECT_TRUE(key.starts_with(comm + ";")) << key;
  EXPECT_TRUE(key.ends_with(";beeprof_test_a;beeprof_test_b;beeprof_test_c"))
      << key;
  // nearly all of the time is spent in c
  EXPECT_GT(dominant->second, profile.total() / 2);
  for (const auto &[other_key, count] : profile.entries()) {
    EXPECT_TRUE(other_key.starts_with(comm + ";")) << other_key;
  }

  // clearing reads are only offered with batch map operations
  std::vector<SampleCount> counts;
  EXPECT_EQ(IsBeeResOK(table->read_counts(true, counts)),
            table->supports_clear());
}

} // namespace beeprof
