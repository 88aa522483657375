// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profiler_pipeline.hpp"

#include "beeprof_stats.hpp"
#include "beeres.hpp"
#include "loghandle.hpp"
#include "mock_frame_labeler.hpp"
#include "mock_stack_table.hpp"

#include <gtest/gtest.h>
#include <thread>

namespace beeprof {

namespace {

constexpr std::string_view k_proc_root = "/this/proc/does/not/exist";

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(IsBeeResOK(beeprof_stats_init()));
    _labeler.user_names = {{0x10, "main"}, {0x20, "helper"}};
    _labeler.kernel_names = {{0xff10, "do_syscall_64"}};
  }
  void TearDown() override { beeprof_stats_free(); }

  PipelineOptions options(CollectionMode mode) const {
    PipelineOptions opts;
    opts.mode = mode;
    opts.poll_period = std::chrono::milliseconds(5);
    opts.channel_capacity = 4;
    opts.print_stats = false;
    return opts;
  }

  LogHandle _handle{LL_NOTICE};
  MockFrameLabeler _labeler;
  ProcessMapCache _map_cache{std::chrono::seconds(60), std::string(k_proc_root)};
  ProfilePublisher _publisher;
};

} // namespace

TEST_F(PipelineTest, snapshot_mode) {
  MockStackTable table(true);
  table.set_stack(1, {0x20, 0x10});
  table.set_stack(2, {0xff10});
  ProfilerPipeline pipeline(options(CollectionMode::kSnapshot), table,
                            _map_cache, _labeler, {}, _publisher);
  auto subscription = _publisher.subscribe();
  table.record(10, "prog", 2, 1, 40);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  table.record(10, "prog", 2, 1, 2);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  pipeline.request_stop();
  ASSERT_TRUE(IsBeeResOK(pipeline.wait()));

  EXPECT_TRUE(pipeline.finished());
  // a single batch, read at the end
  EXPECT_EQ(pipeline.nb_batches_processed(), 1);
  EXPECT_EQ(pipeline.profile().count_of("prog;main;helper;do_syscall_64"), 42);
  // the counts are left in place
  EXPECT_EQ(table.nb_entries(), 1);
  // ticks prefetched the maps of the pid
  EXPECT_TRUE(_map_cache.contains(10));

  ProfileSnapshotPtr latest = _publisher.get_latest_snapshot();
  ASSERT_TRUE(latest);
  EXPECT_TRUE(latest->final);
  EXPECT_EQ(latest->profile.total(), 42);
  auto snapshot = subscription->next();
  ASSERT_TRUE(snapshot);
  EXPECT_TRUE((*snapshot)->final);
  // the publisher is closed with the pipeline
  EXPECT_FALSE(subscription->next());
}

TEST_F(PipelineTest, continuous_mode_conserves_weight) {
  MockStackTable table(true);
  table.set_stack(1, {0x20, 0x10});
  ProfilerPipeline pipeline(options(CollectionMode::kContinuous), table,
                            _map_cache, _labeler,
                            {.show_pid = false,
                             .stack_mode = BEEPROF_STACK_USER},
                            _publisher);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  for (int i = 0; i < 20; ++i) {
    table.record(10 + (i % 3), "prog", -14, 1, 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  pipeline.request_stop();
  ASSERT_TRUE(IsBeeResOK(pipeline.wait()));

  EXPECT_GE(pipeline.nb_batches_processed(), 1);
  EXPECT_EQ(pipeline.nb_channel_drops(), 0);
  // cumulative over every drain
  EXPECT_EQ(pipeline.profile().count_of("prog;main;helper"), 20);
  EXPECT_EQ(table.nb_entries(), 0);
  ProfileSnapshotPtr latest = _publisher.get_latest_snapshot();
  ASSERT_TRUE(latest);
  EXPECT_TRUE(latest->final);
  EXPECT_EQ(latest->profile.total(), 20);

  long drained = 0;
  beeprof_stats_get(STATS_SAMPLES_DRAINED, &drained);
  EXPECT_EQ(drained, 20);
}

TEST_F(PipelineTest, table_error_does_not_end_run) {
  MockStackTable table(true);
  table.set_stack(1, {0x20, 0x10});
  table.fail_read_at(2);
  ProfilerPipeline pipeline(options(CollectionMode::kContinuous), table,
                            _map_cache, _labeler,
                            {.show_pid = false,
                             .stack_mode = BEEPROF_STACK_USER},
                            _publisher);
  table.record(10, "prog", -14, 1, 3);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  for (int i = 0; i < 2000 && table.nb_reads() < 3; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_GE(table.nb_reads(), 3);
  table.record(10, "prog", -14, 1, 7);
  pipeline.request_stop();
  ASSERT_TRUE(IsBeeResOK(pipeline.wait()));

  EXPECT_TRUE(pipeline.finished());
  EXPECT_EQ(pipeline.profile().count_of("prog;main;helper"), 10);
  EXPECT_EQ(table.nb_entries(), 0);
  long errors = 0;
  beeprof_stats_get(STATS_DRAIN_ERRORS, &errors);
  EXPECT_EQ(errors, 1);
  ProfileSnapshotPtr latest = _publisher.get_latest_snapshot();
  ASSERT_TRUE(latest);
  EXPECT_TRUE(latest->final);
}

TEST_F(PipelineTest, lagging_processing_drops_batches) {
  MockStackTable table(true);
  table.set_stack(1, {0x10});
  _labeler.user_delay = std::chrono::milliseconds(20);
  PipelineOptions opts = options(CollectionMode::kContinuous);
  opts.poll_period = std::chrono::milliseconds(2);
  opts.channel_capacity = 1;
  ProfilerPipeline pipeline(opts, table, _map_cache, _labeler,
                            {.show_pid = false,
                             .stack_mode = BEEPROF_STACK_USER},
                            _publisher);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  for (int i = 0; i < 100; ++i) {
    table.record(10, "prog", -14, 1, 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  pipeline.request_stop();
  ASSERT_TRUE(IsBeeResOK(pipeline.wait()));

  // the poll thread never waited on the processing thread
  EXPECT_GT(pipeline.nb_channel_drops(), 0);
  long channel_drops = 0;
  beeprof_stats_get(STATS_CHANNEL_DROPS, &channel_drops);
  EXPECT_EQ(static_cast<uint64_t>(channel_drops), pipeline.nb_channel_drops());
  long drained = 0;
  beeprof_stats_get(STATS_SAMPLES_DRAINED, &drained);
  EXPECT_EQ(drained, 100);
  EXPECT_LE(pipeline.profile().total(), 100);
  ProfileSnapshotPtr latest = _publisher.get_latest_snapshot();
  ASSERT_TRUE(latest);
  EXPECT_TRUE(latest->final);
}

TEST_F(PipelineTest, duration) {
  MockStackTable table(false);
  table.set_stack(1, {0x10});
  PipelineOptions opts = options(CollectionMode::kContinuous);
  opts.duration = std::chrono::milliseconds(30);
  ProfilerPipeline pipeline(opts, table, _map_cache, _labeler, {},
                            _publisher);
  table.record(10, "prog", -14, 1, 3);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  // no stop request: the deadline ends the run
  ASSERT_TRUE(IsBeeResOK(pipeline.wait()));
  EXPECT_TRUE(pipeline.finished());
  EXPECT_EQ(pipeline.profile().count_of("prog;main;[no stack]"), 3);
}

TEST_F(PipelineTest, exit_notifications) {
  MockStackTable table(true);
  table.set_stack(1, {0x10});
  ProfilerPipeline pipeline(options(CollectionMode::kContinuous), table,
                            _map_cache, _labeler, {}, _publisher);
  table.record(10, "prog", -14, 1, 1);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  table.process_exit(10);
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  pipeline.request_stop();
  ASSERT_TRUE(IsBeeResOK(pipeline.wait()));
  // evicted a cycle after the notification
  EXPECT_FALSE(_map_cache.contains(10));
}

TEST_F(PipelineTest, invalid_start) {
  MockStackTable table(true);
  PipelineOptions opts = options(CollectionMode::kContinuous);
  opts.poll_period = std::chrono::milliseconds(0);
  {
    ProfilerPipeline pipeline(opts, table, _map_cache, _labeler, {},
                              _publisher);
    EXPECT_FALSE(IsBeeResOK(pipeline.start()));
  }
  ProfilerPipeline pipeline(options(CollectionMode::kContinuous), table,
                            _map_cache, _labeler, {}, _publisher);
  ASSERT_TRUE(IsBeeResOK(pipeline.start()));
  EXPECT_FALSE(IsBeeResOK(pipeline.start()));
  // the destructor stops and joins
}

} // namespace beeprof
