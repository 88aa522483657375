// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "symbolizer.hpp"

#include "aggregator.hpp"
#include "defer.hpp"
#include "loghandle.hpp"
#include "proc_maps.hpp"

#include <absl/strings/str_format.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <unistd.h>

extern "C" __attribute__((noinline)) int beeprof_test_leaf_function(int n) {
  // keep the body from being folded
  asm volatile("" ::: "memory");
  return n * 3;
}

namespace beeprof {

namespace {
ProcessAddress_t leaf_address() {
  return reinterpret_cast<ProcessAddress_t>(&beeprof_test_leaf_function);
}

bool has_function(const SymbolResult &result, std::string_view name) {
  const auto *resolved = std::get_if<Resolved>(&result);
  return resolved &&
      std::ranges::any_of(resolved->frames, [&](const ResolvedFrame &frame) {
           return frame.function == name;
         });
}
} // namespace

TEST(Symbolizer, self_function) {
  LogHandle handle;
  ProcessMapCache map_cache(std::chrono::seconds(60));
  Symbolizer symbolizer({}, map_cache);
  SymbolResult result = symbolizer.symbolize_user(getpid(), leaf_address(),
                                                  false);
  ASSERT_TRUE(std::holds_alternative<Resolved>(result));
  EXPECT_TRUE(has_function(result, "beeprof_test_leaf_function"));
  const auto &frames = std::get<Resolved>(result).frames;
  ASSERT_FALSE(frames.empty());
  EXPECT_EQ(frames.front().address, leaf_address());
  EXPECT_FALSE(frames.front().module.empty());
  EXPECT_EQ(beeprof_test_leaf_function(2), 6);
}

TEST(Symbolizer, module_parsed_once) {
  LogHandle handle;
  ProcessMapCache map_cache(std::chrono::seconds(60));
  Symbolizer symbolizer({}, map_cache);
  for (int i = 0; i < 10; ++i) {
    SymbolResult result = symbolizer.symbolize_user(
        getpid(), leaf_address() + (i % 2), i % 2 == 1);
    EXPECT_TRUE(has_function(result, "beeprof_test_leaf_function"));
    if (i % 3 == 0) {
      symbolizer.end_batch();
    }
  }
  EXPECT_EQ(symbolizer.module_cache().nb_parsed(), 1);
  EXPECT_EQ(symbolizer.module_cache().nb_modules(), 1);
  EXPECT_EQ(map_cache.nb_snapshots(), 1);
}

TEST(Symbolizer, unresolved) {
  LogHandle handle;
  ProcessMapCache map_cache(std::chrono::seconds(60));
  Symbolizer symbolizer({}, map_cache);

  SymbolResult result = symbolizer.symbolize_user(getpid(), 0x10, false);
  ASSERT_TRUE(std::holds_alternative<Unresolved>(result));
  EXPECT_EQ(std::get<Unresolved>(result).reason, UnresolvedReason::kNoMapping);

  // heap memory is mapped but not file backed
  auto heap_value = std::make_unique<int>(3);
  result = symbolizer.symbolize_user(
      getpid(), reinterpret_cast<ProcessAddress_t>(heap_value.get()), false);
  ASSERT_TRUE(std::holds_alternative<Unresolved>(result));
  EXPECT_EQ(std::get<Unresolved>(result).reason,
            UnresolvedReason::kNotFileBacked);

  std::vector<std::string> labels;
  append_labels(result, labels);
  ASSERT_EQ(labels.size(), 1);
  EXPECT_TRUE(labels[0].starts_with("[")) << labels[0];
  EXPECT_NE(labels[0].find("+0x"), std::string::npos);
}

TEST(Symbolizer, exited_process) {
  LogHandle handle;
  ProcessMapCache map_cache(std::chrono::seconds(60),
                            "/this/proc/does/not/exist");
  Symbolizer symbolizer({.path_to_proc = "/this/proc/does/not/exist"},
                        map_cache);
  std::vector<std::string> labels;
  uint64_t const addresses[] = {0x1000, 0x2000};
  symbolizer.user_labels(4242, addresses, labels);
  // no module, the raw addresses are kept
  EXPECT_EQ(labels, (std::vector<std::string>{"[unknown] 0x1000",
                                              "[unknown] 0x2000"}));
}

TEST(Symbolizer, labels) {
  LogHandle handle;
  ProcessMapCache map_cache(std::chrono::seconds(60));
  Symbolizer symbolizer({.inlined_functions = false}, map_cache);
  std::vector<std::string> labels;
  // innermost first, callers are return addresses
  uint64_t const addresses[] = {leaf_address(), 0x10};
  symbolizer.user_labels(getpid(), addresses, labels);
  ASSERT_EQ(labels.size(), 2);
  EXPECT_EQ(labels[0], "beeprof_test_leaf_function");
  EXPECT_EQ(labels[1], "[unknown] 0x10");
}

TEST(Symbolizer, nameless_frame_uses_module_offset) {
  ResolvedFrame frame;
  frame.module = "libfoo.so";
  frame.address = 0x7f0000001234;
  frame.module_offset = 0x1234;
  std::vector<std::string> labels;
  append_labels(Resolved{{frame}}, labels);
  EXPECT_EQ(labels, std::vector<std::string>{"libfoo.so+0x1234"});

  labels.clear();
  append_labels(Unresolved{0xffffffff81000210,
                           UnresolvedReason::kKernelNoSymbol, {}, 0},
                labels);
  EXPECT_EQ(labels, std::vector<std::string>{"[unknown]"});
}

// Two processes map the same file at different addresses: their samples
// fold into one stack
TEST(Symbolizer, same_module_at_two_load_addresses) {
  LogHandle handle;
  ProcessMaps self_maps(getpid());
  ASSERT_TRUE(IsBeeResOK(read_process_maps(getpid(), "", self_maps)));
  const MemoryMapEntry *entry = self_maps.find(leaf_address());
  ASSERT_NE(entry, nullptr);
  ProcessAddress_t const leaf_delta = leaf_address() - entry->_start;
  ProcessAddress_t const size = entry->_end - entry->_start + 1;

  char tmpl[] = "/tmp/beeprof-proc-XXXXXX";
  ASSERT_NE(mkdtemp(tmpl), nullptr);
  std::string const root = tmpl;
  defer { std::filesystem::remove_all(root); };

  constexpr pid_t k_pids[] = {101, 102};
  constexpr ProcessAddress_t k_starts[] = {0x10000000, 0x7f0000000000};
  for (int i = 0; i < 2; ++i) {
    std::string const dir = absl::StrFormat("%s/proc/%d", root, k_pids[i]);
    std::filesystem::create_directories(dir);
    std::ofstream(dir + "/maps") << absl::StrFormat(
        "%x-%x r-xp %08x 08:01 %lu %s\n", k_starts[i], k_starts[i] + size,
        entry->_offset, entry->_inode, entry->_path);
  }

  ProcessMapCache map_cache(std::chrono::seconds(60), root);
  Symbolizer symbolizer({.inlined_functions = false, .path_to_proc = root},
                        map_cache);
  Aggregator aggregator({.show_pid = false, .stack_mode = BEEPROF_STACK_USER},
                        symbolizer);
  SampleBatch batch;
  for (int i = 0; i < 2; ++i) {
    RawSample sample;
    sample.key.pid = static_cast<uint32_t>(k_pids[i]);
    sample.key.set_comm("prog");
    sample.key.user_stack_id = i + 1;
    sample.count = 3 + i;
    sample.user.status = FramesStatus::kAvailable;
    sample.user.addresses = {k_starts[i] + leaf_delta};
    batch.samples.push_back(std::move(sample));
  }
  aggregator.add_batch(batch);

  const FoldedProfile &profile = aggregator.profile();
  EXPECT_EQ(profile.size(), 1);
  EXPECT_EQ(profile.count_of("prog;beeprof_test_leaf_function"), 7);
  EXPECT_EQ(symbolizer.module_cache().nb_parsed(), 1);
  EXPECT_EQ(map_cache.nb_snapshots(), 2);
}

TEST(Symbolizer, kernel) {
  LogHandle handle;
  char tmpl[] = "/tmp/beeprof-kallsyms-XXXXXX";
  int const fd = mkstemp(tmpl);
  ASSERT_NE(fd, -1);
  close(fd);
  std::ofstream(tmpl) << "ffffffff81000000 T _stext\n"
                         "ffffffff81000200 T do_syscall_64\n"
                         "ffffffffc0a01000 t nf_hook_slow [nf_tables]\n";

  ProcessMapCache map_cache(std::chrono::seconds(60));
  Symbolizer symbolizer({.kallsyms_path = tmpl}, map_cache);
  SymbolResult result = symbolizer.symbolize_kernel(0xffffffff81000210);
  unlink(tmpl);
  ASSERT_TRUE(std::holds_alternative<Resolved>(result));
  const auto &frame = std::get<Resolved>(result).frames.at(0);
  EXPECT_EQ(frame.function, "do_syscall_64");
  EXPECT_EQ(frame.module, "[kernel.kallsyms]");
  EXPECT_TRUE(symbolizer.kernel_symbols().loaded());

  // loaded once
  result = symbolizer.symbolize_kernel(0xffffffffc0a01004);
  EXPECT_EQ(std::get<Resolved>(result).frames.at(0).module, "nf_tables");

  std::vector<std::string> labels;
  uint64_t const addresses[] = {0xffffffff81000210, 0x10};
  symbolizer.kernel_labels(addresses, labels);
  EXPECT_EQ(labels, (std::vector<std::string>{"do_syscall_64", "[unknown]"}));
}

TEST(Symbolizer, kernel_symbols_disabled) {
  LogHandle handle;
  ProcessMapCache map_cache(std::chrono::seconds(60));
  Symbolizer symbolizer({.kernel_symbols = false}, map_cache);
  SymbolResult result = symbolizer.symbolize_kernel(0xffffffff81000210);
  ASSERT_TRUE(std::holds_alternative<Unresolved>(result));
  EXPECT_EQ(std::get<Unresolved>(result).reason,
            UnresolvedReason::kKernelNoSymbol);
  EXPECT_FALSE(symbolizer.kernel_symbols().loaded());
}

} // namespace beeprof
