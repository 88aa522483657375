// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof_context_lib.hpp"

#include "beeprof_cli.hpp"
#include "beeprof_cmdline.hpp"
#include "beeprof_context.hpp"
#include "beeres.hpp"
#include "logger.hpp"
#include "logger_setup.hpp"
#include "signal_helper.hpp"

#include <array>
#include <string>
#include <sys/stat.h>

namespace beeprof {

namespace {
constexpr std::array<std::string_view, 3> k_stack_modes{"kernel", "user",
                                                       "both"};
constexpr std::array<std::string_view, 2> k_collection_modes{"snapshot",
                                                            "continuous"};
constexpr std::array<std::string_view, 3> k_output_formats{"folded", "json",
                                                          "html"};

BeeRes copy_cli_values(const BeeprofCLI &beeprof_cli, BeeprofContext &ctx) {
  auto &params = ctx.params;
  params.frequency = beeprof_cli.frequency;
  if (!parse_stack_mode(beeprof_cli.stack_mode, params.stack_mode)) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Invalid stack mode (%s)",
                            beeprof_cli.stack_mode.c_str());
  }
  if (beeprof_cli.pid != 0 && !beeprof_cli.cgroup.empty()) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT,
                            "pid and cgroup targets are mutually exclusive");
  }
  if (beeprof_cli.pid != 0) {
    params.target_kind = BEEPROF_TARGET_PID;
    params.target_pid = beeprof_cli.pid;
  } else if (!beeprof_cli.cgroup.empty()) {
    params.target_kind = BEEPROF_TARGET_CGROUP;
    params.cgroup_path = beeprof_cli.cgroup;
  } else {
    params.target_kind = BEEPROF_TARGET_ALL;
  }
  params.duration = beeprof_cli.duration;

  int const mode_idx =
      arg_which(beeprof_cli.collection_mode, k_collection_modes);
  if (mode_idx < 0) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Invalid collection mode (%s)",
                            beeprof_cli.collection_mode.c_str());
  }
  params.collection_mode = mode_idx == 0 ? CollectionMode::kSnapshot
                                         : CollectionMode::kContinuous;
  params.poll_period = beeprof_cli.poll_period;
  params.channel_capacity = beeprof_cli.channel_capacity;
  params.subscriber_capacity = beeprof_cli.subscriber_capacity;
  params.idle_timeout = beeprof_cli.idle_timeout;

  params.debug_path = beeprof_cli.debug_path;
  params.inlined_functions = beeprof_cli.inlined_functions;
  params.kernel_symbols = beeprof_cli.kernel_symbols;

  params.output_path = beeprof_cli.output;
  int const format_idx = arg_which(beeprof_cli.format, k_output_formats);
  if (format_idx < 0) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Invalid output format (%s)",
                            beeprof_cli.format.c_str());
  }
  params.format = static_cast<OutputFormat>(format_idx);
  params.title = beeprof_cli.title;
  params.show_pid = beeprof_cli.show_pid;
  params.show_stats = beeprof_cli.show_stats;

  params.bpf_object = beeprof_cli.bpf_object;
  params.counts_table_size = beeprof_cli.counts_table_size;
  params.stack_table_size = beeprof_cli.stack_table_size;
  params.exit_notifications = beeprof_cli.exit_notifications;
  return {};
}
} // namespace

bool parse_stack_mode(std::string_view str, uint32_t &stack_mode) {
  switch (arg_which(str, k_stack_modes)) {
  case 0:
    stack_mode = BEEPROF_STACK_KERNEL;
    return true;
  case 1:
    stack_mode = BEEPROF_STACK_USER;
    return true;
  case 2:
    stack_mode = BEEPROF_STACK_BOTH;
    return true;
  default:
    return false;
  }
}

BeeRes cgroup_id_from_path(std::string_view path, uint64_t &cgroup_id) {
  std::string const path_str{path};
  struct stat info;
  if (stat(path_str.c_str(), &info) != 0) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_CGROUP, "Unable to access cgroup %s",
                            path_str.c_str());
  }
  if (!S_ISDIR(info.st_mode)) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_CGROUP, "cgroup %s is not a directory",
                            path_str.c_str());
  }
  // on cgroup v2, bpf_get_current_cgroup_id() is the kernfs inode number
  cgroup_id = info.st_ino;
  return {};
}

BeeRes context_validate(BeeprofContext &ctx) {
  auto &params = ctx.params;
  if (params.frequency < 1 || params.frequency > kMaxSamplingFrequency) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT,
                            "Frequency %d outside of [1, %d]",
                            params.frequency, kMaxSamplingFrequency);
  }
  if ((params.stack_mode & BEEPROF_STACK_BOTH) == 0) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "No stack to capture");
  }
  if (params.poll_period <= std::chrono::milliseconds::zero()) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Poll period should be positive");
  }
  if (params.channel_capacity < 1 || params.subscriber_capacity < 1) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT,
                            "Queue capacities should be at least 1");
  }
  if (params.counts_table_size < 1 || params.stack_table_size < 1) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT,
                            "Kernel table sizes should be at least 1");
  }
  if (params.duration < std::chrono::seconds::zero()) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Negative duration");
  }
  if (params.output_path.empty()) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "No output file");
  }
  switch (params.target_kind) {
  case BEEPROF_TARGET_ALL:
    break;
  case BEEPROF_TARGET_PID:
    if (params.target_pid <= 0) {
      BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Invalid pid %d",
                              params.target_pid);
    }
    if (!process_is_alive(params.target_pid)) {
      BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "No process with pid %d",
                              params.target_pid);
    }
    break;
  case BEEPROF_TARGET_CGROUP:
    BEERES_CHECK_FWD_STRICT(
        cgroup_id_from_path(params.cgroup_path, params.cgroup_id));
    break;
  default:
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_ARGUMENT, "Unknown target kind %u",
                            params.target_kind);
  }
  return {};
}

BeeRes context_set(const BeeprofCLI &beeprof_cli, BeeprofContext &ctx) {
  setup_logger(beeprof_cli.log_mode, beeprof_cli.log_level);

  BEERES_CHECK_FWD_STRICT(copy_cli_values(beeprof_cli, ctx));
  BEERES_CHECK_FWD_STRICT(context_validate(ctx));

  if (beeprof_cli.show_config) {
    beeprof_cli.print();
    if (ctx.params.target_kind == BEEPROF_TARGET_CGROUP) {
      PRINT_NFO("  - cgroup id: %lu", ctx.params.cgroup_id);
    }
  }
  return {};
}

} // namespace beeprof
