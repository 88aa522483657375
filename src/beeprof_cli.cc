// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof_cli.hpp"

#include "logger.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <vector>

namespace beeprof {

namespace {
std::string get_default_config_file() {
  // config files are read before the environment is processed
  if (char *env_config_path = std::getenv("BEEPROF_CONFIG");
      env_config_path != nullptr) {
    return env_config_path;
  }
  return "./beeprof.toml";
}

void write_config_file(const CLI::App &app, const std::string &file_path) {
  std::ofstream out_file;
  out_file.open(file_path);
  if (!out_file) {
    // logger is not configured
    (void)fprintf(stderr, MYNAME ": cannot open the file %s\n",
                  file_path.c_str());
    return;
  }
  out_file << app.config_to_str();
  out_file.close();
}
} // namespace

int BeeprofCLI::parse(int argc, const char *argv[]) {
  std::string capture_config;
  CLI::App app{MYNAME " samples the call stacks of running processes with an "
                      "eBPF probe and writes them as folded stacks.\n"
                      " eg: " MYNAME " --pid 1234 --duration 10 "
                      "--output stacks.folded\n",
               MYNAME}; // avoid auto-generation of NAME (which includes path)

  // Profiling settings
  app.add_option("--frequency,-F", frequency, "Sampling frequency (Hz).")
      ->default_val(kDefaultSamplingFrequency)
      ->check(CLI::Range(1, kMaxSamplingFrequency))
      ->group("Profiling settings")
      ->envname("BEEPROF_FREQUENCY");
  app.add_option("--stack_mode,--stack-mode", stack_mode,
                 "Stacks to capture: kernel, user or both.")
      ->default_val("both")
      ->check(CLI::IsMember({"kernel", "user", "both"}))
      ->group("Profiling settings")
      ->envname("BEEPROF_STACK_MODE");
  CLI::Option *pid_opt =
      app.add_option("--pid,-p", pid,
                     "Only profile the given process (all of its threads).")
          ->check(CLI::PositiveNumber)
          ->group("Profiling settings")
          ->envname("BEEPROF_PID");
  app.add_option("--cgroup", cgroup,
                 "Only profile the processes of a cgroup (v2 directory).")
      ->group("Profiling settings")
      ->excludes(pid_opt)
      ->envname("BEEPROF_CGROUP");
  app.add_option<std::chrono::seconds, unsigned>(
         "--duration,-d", duration,
         "Profiling duration (in seconds). 0 runs until interrupted.")
      ->default_val(0)
      ->group("Profiling settings")
      ->envname("BEEPROF_DURATION");
  app.add_option("--collection_mode,--collection-mode", collection_mode,
                 "snapshot: read the counts once at the end of the run.\n"
                 "continuous: drain the counts periodically.")
      ->default_val("snapshot")
      ->check(CLI::IsMember({"snapshot", "continuous"}))
      ->group("Profiling settings")
      ->envname("BEEPROF_COLLECTION_MODE");
  app.add_option<std::chrono::milliseconds, unsigned>(
         "--poll_period,--poll-period", poll_period,
         "Period between two reads of the kernel tables (in ms).")
      ->default_val(kDefaultPollPeriod.count())
      ->check(CLI::PositiveNumber)
      ->group("Profiling settings")
      ->envname("BEEPROF_POLL_PERIOD");

  // Symbolization
  app.add_option("--debug_path,--debug-path", debug_path,
                 "Where to look for separate debug information.\n"
                 "Colon separated list, elfutils debuginfo path syntax.")
      ->group("Symbolization")
      ->envname("BEEPROF_DEBUG_PATH");
  app.add_option("--inlined_functions,--inlined-functions,-I",
                 inlined_functions,
                 "Report inlined functions in call stacks.\n"
                 "This is possible if debug sections are available.")
      ->default_val(true)
      ->group("Symbolization")
      ->envname("BEEPROF_INLINED_FUNCTIONS");
  app.add_option("--kernel_symbols,--kernel-symbols", kernel_symbols,
                 "Resolve kernel frames with /proc/kallsyms.")
      ->default_val(true)
      ->group("Symbolization")
      ->envname("BEEPROF_KERNEL_SYMBOLS");
  app.add_option<std::chrono::seconds, unsigned>(
         "--idle_timeout,--idle-timeout", idle_timeout,
         "Time after which the mappings of an inactive process are dropped "
         "(in seconds).")
      ->default_val(kDefaultIdleTimeout.count())
      ->check(CLI::PositiveNumber)
      ->group("Symbolization")
      ->envname("BEEPROF_IDLE_TIMEOUT");

  // Output
  app.add_option("--output,-O", output, "Output file.")
      ->default_val("stacks.folded")
      ->group("Output")
      ->envname("BEEPROF_OUTPUT");
  app.add_option("--format,-f", format,
                 "folded: one `frame;frame;... count` line per stack.\n"
                 "json: d3-flamegraph hierarchy.\n"
                 "html: standalone flame graph page.")
      ->default_val("folded")
      ->check(CLI::IsMember({"folded", "json", "html"}))
      ->group("Output")
      ->envname("BEEPROF_FORMAT");
  app.add_option("--title", title, "Title of the html page.")
      ->default_val(MYNAME)
      ->group("Output");
  app.add_flag("--show_pid,--show-pid", show_pid,
               "Split the root frame per process (comm-pid).")
      ->group("Output")
      ->envname("BEEPROF_SHOW_PID");

  // allow configuration files - default is local toml file
  app.set_config("--config", get_default_config_file(),
                 "A configuration file\n"
                 "Check the capture_config to generate the initial file")
      ->group("Advanced settings");

  // Debug
  app.add_option("--log_level,--log-level,-l", log_level,
                 "One of debug, informational, notice, warn, error.")
      ->default_val("error")
      ->check(
          CLI::IsMember({"debug", "informational", "notice", "warn", "error"}))
      ->group("Debug options")
      ->envname("BEEPROF_LOG_LEVEL");
  app.add_option("--log_mode,--log-mode,-o", log_mode,
                 "One of stdout, stderr, syslog, disabled or a file path.")
      ->default_val("stderr")
      ->group("Debug options")
      ->envname("BEEPROF_LOG_MODE");
  app.add_flag("--show_config,--show-config", show_config,
               "Display the configuration.")
      ->default_val(false)
      ->group("Debug options");
  app.add_flag("--show_stats,--show-stats", show_stats,
               "Log internal statistics after each cycle.")
      ->default_val(false)
      ->group("Debug options")
      ->envname("BEEPROF_SHOW_STATS");
  app.add_flag("--version,-v", version, "Display the profiler's version.\n")
      ->group("Debug options");
  app.add_option("--capture_config,--capture-config", capture_config,
                 "Capture the current configuration to a file.\n"
                 "You can then give this configuration through --config.\n")
      ->group("Debug options");

  // EXTENDED OPTIONS
  std::vector<CLI::Option *> extended_options;
  extended_options.push_back(
      app.add_option("--bpf_object,--bpf-object", bpf_object,
                     "Path of the compiled sampling probe.")
          ->default_val(BEEPROF_DEFAULT_BPF_OBJECT)
          ->envname("BEEPROF_BPF_OBJECT")
          ->group(""));
  extended_options.push_back(
      app.add_option("--channel_capacity,--channel-capacity",
                     channel_capacity,
                     "Batches queued between collection and processing.")
          ->default_val(kDefaultChannelCapacity)
          ->check(CLI::PositiveNumber)
          ->envname("BEEPROF_CHANNEL_CAPACITY")
          ->group(""));
  extended_options.push_back(
      app.add_option("--subscriber_capacity,--subscriber-capacity",
                     subscriber_capacity,
                     "Snapshots queued for each live subscriber.")
          ->default_val(kDefaultSubscriberCapacity)
          ->check(CLI::PositiveNumber)
          ->group(""));
  extended_options.push_back(
      app.add_option("--counts_table_size,--counts-table-size",
                     counts_table_size,
                     "Maximum number of distinct stacks between two drains.")
          ->default_val(kDefaultCountsTableSize)
          ->check(CLI::PositiveNumber)
          ->group(""));
  extended_options.push_back(
      app.add_option("--stack_table_size,--stack-table-size",
                     stack_table_size, "Size of the kernel stack table.")
          ->default_val(kDefaultStackTableSize)
          ->check(CLI::PositiveNumber)
          ->group(""));
  extended_options.push_back(
      app.add_option("--exit_notifications,--exit-notifications",
                     exit_notifications,
                     "Evict the mappings of processes when they exit.")
          ->default_val(true)
          ->group(""));
  extended_options.push_back(app.add_flag("--help_extended,--help-extended",
                                          help_extended,
                                          "Show extended options")
                                 ->group(""));
  // Parse
  CLI11_PARSE(app, argc, argv);

  // Dump config file
  if (!capture_config.empty()) {
    write_config_file(app, capture_config);
  }

  // Help on Extended options
  if (help_extended) {
    // Adjust the groups before calling help function
    for (auto *el : extended_options) {
      el->group("Extended options");
    }
    std::cout << app.help() << '\n';
    return static_cast<int>(CLI::ExitCodes::Success);
  }

  // Version then exit
  if (version) {
    print_version();
    return static_cast<int>(CLI::ExitCodes::Success);
  }

  continue_exec = true;
  return static_cast<int>(CLI::ExitCodes::Success);
}

void BeeprofCLI::print() const {
  auto version_str = str_version();
  PRINT_NFO("Version: %.*s", static_cast<int>(version_str.size()),
            version_str.data());
  PRINT_NFO("Profiling options:");
  PRINT_NFO("  - frequency: %dHz", frequency);
  PRINT_NFO("  - stack_mode: %s", stack_mode.c_str());
  if (pid) {
    PRINT_NFO("  - pid: %d", pid);
  } else if (!cgroup.empty()) {
    PRINT_NFO("  - cgroup: %s", cgroup.c_str());
  } else {
    PRINT_NFO("  - target: all processes");
  }
  PRINT_NFO("  - duration: %lds", duration.count());
  PRINT_NFO("  - collection_mode: %s", collection_mode.c_str());
  PRINT_NFO("  - poll_period: %ldms", poll_period.count());
  PRINT_NFO("Symbolization:");
  if (!debug_path.empty()) {
    PRINT_NFO("  - debug_path: %s", debug_path.c_str());
  }
  PRINT_NFO("  - inlined_functions: %s", inlined_functions ? "true" : "false");
  PRINT_NFO("  - kernel_symbols: %s", kernel_symbols ? "true" : "false");
  PRINT_NFO("  - idle_timeout: %lds", idle_timeout.count());
  PRINT_NFO("Output:");
  PRINT_NFO("  - output: %s", output.c_str());
  PRINT_NFO("  - format: %s", format.c_str());
  PRINT_NFO("  - show_pid: %s", show_pid ? "true" : "false");
  PRINT_NFO("Debug:");
  PRINT_NFO("  - log_level: %s", log_level.c_str());
  PRINT_NFO("  - log_mode: %s", log_mode.c_str());
  PRINT_NFO("Extended:");
  PRINT_NFO("  - bpf_object: %s", bpf_object.c_str());
  PRINT_NFO("  - channel_capacity: %zu", channel_capacity);
  PRINT_NFO("  - subscriber_capacity: %zu", subscriber_capacity);
  PRINT_NFO("  - counts_table_size: %u", counts_table_size);
  PRINT_NFO("  - stack_table_size: %u", stack_table_size);
  PRINT_NFO("  - exit_notifications: %s",
            exit_notifications ? "true" : "false");
}

} // namespace beeprof
