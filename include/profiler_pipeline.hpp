// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "aggregator.hpp"
#include "beeprof_defs.hpp"
#include "beeres_def.hpp"
#include "bounded_channel.hpp"
#include "collector.hpp"
#include "frame_labeler.hpp"
#include "process_map_cache.hpp"
#include "profile_publisher.hpp"
#include "raw_sample.hpp"
#include "stack_table.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace beeprof {

struct PipelineOptions {
  CollectionMode mode{CollectionMode::kSnapshot};
  std::chrono::milliseconds poll_period{kDefaultPollPeriod};
  // zero runs until request_stop()
  std::chrono::milliseconds duration{0};
  size_t channel_capacity{kDefaultChannelCapacity};
  // notice level dump of the stats after each cycle
  bool print_stats{true};
};

// Poll thread: timer cadence, final drain on shutdown, sole clearer of the
// kernel counters. Processing thread: symbolizes and folds the batches, then
// publishes the cumulative profile.
class ProfilerPipeline {
public:
  ProfilerPipeline(PipelineOptions options, StackTable &table,
                   ProcessMapCache &map_cache, FrameLabeler &labeler,
                   AggregatorOptions aggregator_options,
                   ProfilePublisher &publisher);
  ~ProfilerPipeline();

  ProfilerPipeline(const ProfilerPipeline &) = delete;
  ProfilerPipeline &operator=(const ProfilerPipeline &) = delete;

  BeeRes start();

  // Thread safe. The poll thread performs the final drain and exits.
  void request_stop();

  // Joins both threads and returns the first error they hit
  BeeRes wait();

  // True once the last batch was processed
  [[nodiscard]] bool finished() const { return _finished.load(); }

  // Cumulative profile, only meaningful once wait() returned
  [[nodiscard]] const FoldedProfile &profile() const {
    return _aggregator.profile();
  }
  [[nodiscard]] uint64_t nb_batches_processed() const {
    return _nb_batches_processed;
  }
  [[nodiscard]] uint64_t nb_channel_drops() const {
    return _channel.nb_dropped();
  }

private:
  BeeRes poll_main();
  BeeRes poll_loop();
  BeeRes drain_and_push(bool final);
  void report_poll_error(const char *step, BeeRes res);
  BeeRes push_batch(SampleBatch batch);
  BeeRes process_main();
  BeeRes process_loop();
  void process_batch(const SampleBatch &batch);
  bool wait_next_tick(std::chrono::steady_clock::time_point tick,
                      std::chrono::steady_clock::time_point deadline);

  PipelineOptions _options;
  StackTable &_table;
  ProcessMapCache &_map_cache;
  Collector _collector;
  Aggregator _aggregator;
  ProfilePublisher &_publisher;
  BoundedChannel<SampleBatch> _channel;

  std::mutex _stop_mutex;
  std::condition_variable _stop_cv;
  bool _stop_requested{false};

  std::thread _poll_thread;
  std::thread _process_thread;
  BeeRes _poll_res{};
  BeeRes _process_res{};
  bool _started{false};
  std::atomic<bool> _finished{false};
  // exits carried by batches dropped from the channel
  std::vector<uint32_t> _carried_exits;
  uint64_t _nb_batches_processed{0};
};

} // namespace beeprof
