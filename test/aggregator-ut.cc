// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "aggregator.hpp"

#include "loghandle.hpp"
#include "mock_frame_labeler.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace beeprof {

namespace {

RawSample make_sample(uint32_t pid, std::string_view comm, uint64_t count,
                      std::vector<uint64_t> user,
                      std::vector<uint64_t> kernel = {}) {
  RawSample sample;
  sample.key.pid = pid;
  sample.key.set_comm(comm);
  sample.count = count;
  if (!user.empty()) {
    sample.key.user_stack_id = 1;
    sample.user = {FramesStatus::kAvailable, std::move(user)};
  }
  if (!kernel.empty()) {
    sample.key.kernel_stack_id = 2;
    sample.kernel = {FramesStatus::kAvailable, std::move(kernel)};
  }
  return sample;
}

MockFrameLabeler make_labeler() {
  MockFrameLabeler labeler;
  labeler.user_names = {
      {0x10, "main"}, {0x20, "helper"}, {0x30, "inner"}, {0x40, "other"}};
  labeler.kernel_names = {{0xff10, "entry_SYSCALL_64"},
                          {0xff20, "do_syscall_64"},
                          {0xff30, "ksys_read"}};
  return labeler;
}

} // namespace

TEST(Aggregator, sanitize) {
  EXPECT_EQ(sanitize_label("a;b"), "a_b");
  EXPECT_EQ(sanitize_label("  operator()  (int,\t  long)\n"),
            "operator() (int, long)");
  EXPECT_EQ(sanitize_label(""), "[unknown]");
  EXPECT_EQ(sanitize_label(" \t "), "[unknown]");
  EXPECT_EQ(sanitize_label("std::vector<int>::push_back"),
            "std::vector<int>::push_back");
}

TEST(Aggregator, folded_format) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  Aggregator aggregator({.show_pid = false, .stack_mode = BEEPROF_STACK_USER},
                        labeler);
  // innermost first, as captured by the probe
  aggregator.add(make_sample(42, "prog", 42, {0x30, 0x20, 0x10}));
  std::ostringstream out;
  write_folded(aggregator.profile(), out);
  EXPECT_EQ(out.str(), "prog;main;helper;inner 42\n");
}

TEST(Aggregator, frame_order) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  Aggregator aggregator({}, labeler);
  RawSample sample =
      make_sample(42, "prog", 3, {0x20, 0x10}, {0xff30, 0xff20, 0xff10});
  std::vector<std::string> labels;
  aggregator.stack_labels(sample, labels);
  // user frames then kernel frames, each side outermost first
  EXPECT_EQ(labels, (std::vector<std::string>{"prog", "main", "helper",
                                              "entry_SYSCALL_64",
                                              "do_syscall_64", "ksys_read"}));
}

TEST(Aggregator, show_pid) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  Aggregator aggregator({.show_pid = true, .stack_mode = BEEPROF_STACK_USER},
                        labeler);
  aggregator.add(make_sample(42, "prog", 1, {0x10}));
  aggregator.add(make_sample(43, "prog", 2, {0x10}));
  EXPECT_EQ(aggregator.profile().count_of("prog-42;main"), 1);
  EXPECT_EQ(aggregator.profile().count_of("prog-43;main"), 2);
}

TEST(Aggregator, weight_conservation) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  Aggregator aggregator({}, labeler);
  SampleBatch batch;
  uint64_t expected_total = 0;
  for (uint32_t i = 0; i < 50; ++i) {
    uint64_t const count = (i % 7) + 1;
    expected_total += count;
    if (i % 3 == 0) {
      batch.samples.push_back(make_sample(i % 5, "prog", count, {0x20, 0x10}));
    } else if (i % 3 == 1) {
      batch.samples.push_back(
          make_sample(i % 5, "prog", count, {0x40}, {0xff20}));
    } else {
      // nothing captured on either side
      batch.samples.push_back(make_sample(i % 5, "idle", count, {}));
    }
  }
  EXPECT_EQ(batch.total_count(), expected_total);
  aggregator.add_batch(batch);
  EXPECT_EQ(labeler.nb_end_batch, 1);

  const FoldedProfile &profile = aggregator.profile();
  EXPECT_EQ(profile.total(), expected_total);
  uint64_t sum = 0;
  for (const auto &[key, count] : profile.entries()) {
    sum += count;
  }
  EXPECT_EQ(sum, expected_total);
  // identical stacks across pids merge
  EXPECT_EQ(profile.size(), 3);
}

TEST(Aggregator, missing_side) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  Aggregator aggregator({}, labeler);
  // kernel only sample
  aggregator.add(make_sample(1, "kworker/0:1", 5, {}, {0xff30}));
  EXPECT_EQ(aggregator.profile().count_of("kworker/0:1;[no stack];ksys_read"),
            5);

  // the stack id was recycled before it was read
  RawSample sample = make_sample(2, "prog", 2, {0x10});
  sample.key.kernel_stack_id = 9;
  sample.kernel.status = FramesStatus::kUnavailable;
  aggregator.add(sample);
  EXPECT_EQ(aggregator.profile().count_of("prog;main;[unavailable]"), 2);
  EXPECT_EQ(aggregator.profile().total(), 7);
}

TEST(Aggregator, disabled_side_omitted) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  Aggregator aggregator({.show_pid = false, .stack_mode = BEEPROF_STACK_KERNEL},
                        labeler);
  aggregator.add(make_sample(1, "prog", 1, {}, {0xff20, 0xff10}));
  EXPECT_EQ(
      aggregator.profile().count_of("prog;entry_SYSCALL_64;do_syscall_64"), 1);
}

TEST(Aggregator, exited_process) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  labeler.exited.insert(7);
  Aggregator aggregator({.show_pid = false, .stack_mode = BEEPROF_STACK_USER},
                        labeler);
  aggregator.add(make_sample(7, "gone", 4, {0x20, 0x10}));
  EXPECT_EQ(aggregator.profile().count_of("gone;[unknown];[unknown]"), 4);
}

TEST(Aggregator, sanitized_labels) {
  LogHandle handle;
  MockFrameLabeler labeler;
  labeler.user_names = {{0x10, "odd;name"}, {0x20, "  spaced   out "}};
  Aggregator aggregator({.show_pid = false, .stack_mode = BEEPROF_STACK_USER},
                        labeler);
  aggregator.add(make_sample(1, "my prog", 1, {0x20, 0x10}));
  EXPECT_EQ(aggregator.profile().count_of("my prog;odd_name;spaced out"), 1);
}

TEST(FoldedProfile, merge) {
  FoldedProfile lhs;
  lhs.add_folded("a;b", 2);
  lhs.add_folded("a;c", 1);
  FoldedProfile rhs;
  rhs.add_folded("a;b", 3);
  rhs.add_folded("d", 4);
  rhs.add_folded("e", 0);
  lhs.merge(rhs);
  EXPECT_EQ(lhs.size(), 3);
  EXPECT_EQ(lhs.count_of("a;b"), 5);
  EXPECT_EQ(lhs.count_of("a;c"), 1);
  EXPECT_EQ(lhs.count_of("d"), 4);
  EXPECT_EQ(lhs.count_of("e"), 0);
  EXPECT_EQ(lhs.total(), 10);
}

TEST(FoldedProfile, sorted_output) {
  FoldedProfile profile;
  profile.add_folded("b;x", 1);
  profile.add_folded("a;y", 2);
  profile.add_folded("a", 3);
  std::ostringstream out;
  write_folded(profile, out);
  EXPECT_EQ(out.str(), "a 3\na;y 2\nb;x 1\n");

  std::vector<FoldedStack> stacks = profile.stacks();
  ASSERT_EQ(stacks.size(), 3);
  EXPECT_EQ(stacks[1].frames, (std::vector<std::string>{"a", "y"}));
  EXPECT_EQ(format_folded(stacks[1]), "a;y 2");
}

TEST(Aggregator, take) {
  LogHandle handle;
  MockFrameLabeler labeler = make_labeler();
  Aggregator aggregator({.show_pid = false, .stack_mode = BEEPROF_STACK_USER},
                        labeler);
  aggregator.add(make_sample(1, "prog", 1, {0x10}));
  FoldedProfile taken = aggregator.take();
  EXPECT_EQ(taken.total(), 1);
  EXPECT_TRUE(aggregator.profile().empty());
  EXPECT_EQ(aggregator.profile().total(), 0);
}

} // namespace beeprof
