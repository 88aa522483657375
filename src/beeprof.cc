// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof.hpp"

#include "beeprof_context.hpp"
#include "beeprof_stats.hpp"
#include "beeres.hpp"
#include "bpf_stack_table.hpp"
#include "logger.hpp"
#include "process_map_cache.hpp"
#include "profile_publisher.hpp"
#include "profile_writer.hpp"
#include "profiler_pipeline.hpp"
#include "signal_helper.hpp"
#include "symbolizer.hpp"

#include <thread>

namespace beeprof {

namespace {
constexpr std::chrono::milliseconds k_main_wait_period{100};

BpfProbeOptions probe_options(const BeeprofContext &ctx) {
  const auto &params = ctx.params;
  BpfProbeOptions options;
  options.object_path = params.bpf_object;
  options.frequency = params.frequency;
  options.stack_mode = params.stack_mode;
  options.target_kind = params.target_kind;
  options.target_pid = static_cast<uint32_t>(params.target_pid);
  options.target_cgroup_id = params.cgroup_id;
  options.counts_size = params.counts_table_size;
  options.stacks_size = params.stack_table_size;
  options.exit_notifications = params.exit_notifications;
  return options;
}

void log_summary(const ProfilerPipeline &pipeline, const FoldedProfile &profile) {
  long kernel_drops = 0;
  if (IsBeeResNotOK(beeprof_stats_get(STATS_KERNEL_DROPS, &kernel_drops))) {
    kernel_drops = -1;
  }
  LG_NTC("Profile: %lu samples in %zu stacks, %lu batch(es) processed",
         profile.total(), profile.size(), pipeline.nb_batches_processed());
  if (kernel_drops > 0) {
    LG_WRN("%ld sample(s) dropped by the probe (table full), consider a "
           "larger --counts-table-size or a shorter --poll-period",
           kernel_drops);
  }
  if (pipeline.nb_channel_drops() > 0) {
    LG_WRN("%lu batch(es) dropped because processing lagged",
           pipeline.nb_channel_drops());
  }
}
} // namespace

BeeRes beeprof_setup(const BeeprofContext &ctx) {
  try {
    BEERES_CHECK_FWD_STRICT(beeprof_stats_init());
    BEERES_CHECK_FWD_STRICT(install_termination_handler());
    LG_NFO("Sampling at %dHz, %s collection", ctx.params.frequency,
           collection_mode_str(ctx.params.collection_mode));
  }
  CatchExcept2BeeRes();
  return {};
}

BeeRes beeprof_run(const BeeprofContext &ctx) {
  const auto &params = ctx.params;
  try {
    std::unique_ptr<BpfStackTable> table;
    BEERES_CHECK_FWD_STRICT(BpfStackTable::create(probe_options(ctx), table));
    LG_NTC("Probe attached on %zu CPU(s)", table->nb_attached_cpus());

    ProcessMapCache map_cache(params.idle_timeout);
    SymbolizerOptions symbolizer_options;
    symbolizer_options.debug_path = params.debug_path;
    symbolizer_options.inlined_functions = params.inlined_functions;
    symbolizer_options.kernel_symbols = params.kernel_symbols;
    Symbolizer symbolizer(std::move(symbolizer_options), map_cache);
    ProfilePublisher publisher(params.subscriber_capacity);

    PipelineOptions pipeline_options;
    pipeline_options.mode = params.collection_mode;
    pipeline_options.poll_period = params.poll_period;
    pipeline_options.duration = params.duration;
    pipeline_options.channel_capacity = params.channel_capacity;
    pipeline_options.print_stats = params.show_stats;
    AggregatorOptions aggregator_options;
    aggregator_options.show_pid = params.show_pid;
    aggregator_options.stack_mode = params.stack_mode;

    ProfilerPipeline pipeline(pipeline_options, *table, map_cache, symbolizer,
                              aggregator_options, publisher);
    BEERES_CHECK_FWD_STRICT(pipeline.start());
    bool stop_sent = false;
    while (!pipeline.finished()) {
      if (!stop_sent && termination_requested()) {
        LG_NTC("Termination requested, collecting the last samples");
        pipeline.request_stop();
        stop_sent = true;
      }
      std::this_thread::sleep_for(k_main_wait_period);
    }
    BEERES_CHECK_FWD_STRICT(pipeline.wait());

    log_summary(pipeline, pipeline.profile());
    BEERES_CHECK_FWD_STRICT(write_profile(pipeline.profile(), params.format,
                                          params.output_path, params.title));
    // the probe is detached when the table goes out of scope
  }
  CatchExcept2BeeRes();
  return {};
}

BeeRes beeprof_teardown() {
  if (IsBeeResNotOK(beeprof_stats_free())) {
    LG_WRN("Error when calling beeprof_stats_free.");
  }
  return {};
}

} // namespace beeprof
