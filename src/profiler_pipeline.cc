// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profiler_pipeline.hpp"

#include "beeprof_stats.hpp"
#include "beeres.hpp"
#include "defer.hpp"
#include "logger.hpp"

#include <algorithm>
#include <optional>

namespace beeprof {

namespace {
OverflowPolicy channel_policy(CollectionMode mode) {
  // bounded runs must not lose samples, live runs must not lag
  return mode == CollectionMode::kSnapshot ? OverflowPolicy::kBlock
                                           : OverflowPolicy::kDropOldest;
}
} // namespace

ProfilerPipeline::ProfilerPipeline(PipelineOptions options, StackTable &table,
                                   ProcessMapCache &map_cache,
                                   FrameLabeler &labeler,
                                   AggregatorOptions aggregator_options,
                                   ProfilePublisher &publisher)
    : _options(options), _table(table), _map_cache(map_cache),
      _collector(table, options.mode,
                 (aggregator_options.stack_mode & BEEPROF_STACK_USER)
                     ? &map_cache
                     : nullptr),
      _aggregator(aggregator_options, labeler), _publisher(publisher),
      _channel(options.channel_capacity, channel_policy(options.mode)) {}

ProfilerPipeline::~ProfilerPipeline() {
  if (_started) {
    request_stop();
    BeeRes const res = wait();
    if (IsBeeResNotOK(res)) {
      LG_WRN("Profiler pipeline ended with error - %s",
             beeres_error_message(res._what));
    }
  }
}

BeeRes ProfilerPipeline::start() {
  if (_started) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_PIPELINE, "Pipeline already started");
  }
  if (_options.poll_period <= std::chrono::milliseconds::zero()) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Invalid poll period %ld ms",
                            _options.poll_period.count());
  }
  _started = true;
  _process_thread = std::thread([this] { _process_res = process_main(); });
  _poll_thread = std::thread([this] { _poll_res = poll_main(); });
  LG_NFO("Profiling started (%s collection, poll period %ld ms)",
         collection_mode_str(_options.mode), _options.poll_period.count());
  return {};
}

void ProfilerPipeline::request_stop() {
  {
    std::lock_guard const lock{_stop_mutex};
    _stop_requested = true;
  }
  _stop_cv.notify_all();
}

BeeRes ProfilerPipeline::wait() {
  if (_poll_thread.joinable()) {
    _poll_thread.join();
  }
  if (_process_thread.joinable()) {
    _process_thread.join();
  }
  _started = false;
  BEERES_CHECK_FWD_STRICT(_poll_res);
  BEERES_CHECK_FWD_STRICT(_process_res);
  return {};
}

bool ProfilerPipeline::wait_next_tick(
    std::chrono::steady_clock::time_point tick,
    std::chrono::steady_clock::time_point deadline) {
  std::unique_lock lock{_stop_mutex};
  _stop_cv.wait_until(lock, std::min(tick, deadline),
                      [this] { return _stop_requested; });
  return !_stop_requested && std::chrono::steady_clock::now() < deadline;
}

BeeRes ProfilerPipeline::push_batch(SampleBatch batch) {
  if (!_carried_exits.empty()) {
    batch.exited_pids.insert(batch.exited_pids.end(), _carried_exits.begin(),
                             _carried_exits.end());
    _carried_exits.clear();
  }
  std::optional<SampleBatch> dropped;
  switch (_channel.push(std::move(batch), &dropped)) {
  case PushResult::kPushed:
    break;
  case PushResult::kDroppedOldest:
    beeprof_stats_add(STATS_CHANNEL_DROPS, 1, nullptr);
    LG_WRN("Processing is lagging, dropped a batch of %lu samples",
           dropped->total_count());
    _carried_exits = std::move(dropped->exited_pids);
    break;
  case PushResult::kClosed:
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_CHANNEL_CLOSED,
                            "Processing ended before the poll thread");
  }
  return {};
}

void ProfilerPipeline::report_poll_error(const char *step, BeeRes res) {
  beeprof_stats_add(STATS_DRAIN_ERRORS, 1, nullptr);
  LG_WRN("%s of the kernel tables failed, continuing - %s", step,
         beeres_error_message(res._what));
}

BeeRes ProfilerPipeline::drain_and_push(bool final) {
  SampleBatch batch;
  BeeRes const res = _collector.drain(final, batch);
  if (IsBeeResNotOK(res)) {
    // the samples read before the failure are still forwarded
    report_poll_error("Drain", res);
  }
  BEERES_CHECK_FWD_STRICT(push_batch(std::move(batch)));
  return {};
}

BeeRes ProfilerPipeline::poll_loop() {
  using Clock = std::chrono::steady_clock;
  auto const start = Clock::now();
  auto const deadline = _options.duration.count() > 0
      ? start + _options.duration
      : Clock::time_point::max();
  auto tick = start + _options.poll_period;

  // kernel table errors are reported and never end the run
  while (wait_next_tick(tick, deadline)) {
    if (Clock::now() < tick) {
      continue; // spurious wakeup
    }
    tick += _options.poll_period;
    if (_options.mode == CollectionMode::kContinuous) {
      BEERES_CHECK_FWD_STRICT(drain_and_push(false));
    } else {
      BeeRes const res = _collector.observe();
      if (IsBeeResNotOK(res)) {
        report_poll_error("Observation", res);
      }
    }
  }

  BEERES_CHECK_FWD_STRICT(drain_and_push(true));
  LG_NTC("Final drain done after %lu drain(s)", _collector.nb_drains());
  return {};
}

BeeRes ProfilerPipeline::poll_main() {
  // the processing thread completes the batches already queued
  defer { _channel.close(); };
  try {
    return poll_loop();
  }
  CatchExcept2BeeRes();
  return {};
}

void ProfilerPipeline::process_batch(const SampleBatch &batch) {
  auto const start = std::chrono::steady_clock::now();
  for (uint32_t const pid : batch.exited_pids) {
    _map_cache.notify_exit(static_cast<pid_t>(pid));
  }
  _aggregator.add_batch(batch);
  const FoldedProfile &profile = _aggregator.profile();
  _publisher.publish(profile, batch.final);
  _map_cache.end_cycle();
  ++_nb_batches_processed;

  auto const elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  beeprof_stats_set(STATS_FOLDED_STACKS, static_cast<long>(profile.size()));
  beeprof_stats_set(STATS_PROFILE_WEIGHT, static_cast<long>(profile.total()));
  beeprof_stats_set(STATS_CYCLE_DURATION, static_cast<long>(elapsed.count()));
  if (_options.print_stats) {
    beeprof_stats_print();
  }
}

BeeRes ProfilerPipeline::process_loop() {
  while (std::optional<SampleBatch> batch = _channel.pop()) {
    process_batch(*batch);
    if (batch->final) {
      break;
    }
  }
  return {};
}

BeeRes ProfilerPipeline::process_main() {
  defer {
    // a poll thread still running is unblocked and stops
    _channel.close();
    request_stop();
    _publisher.close();
    _finished = true;
  };
  try {
    return process_loop();
  }
  CatchExcept2BeeRes();
  return {};
}

} // namespace beeprof
