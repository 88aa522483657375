// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"

#include <chrono>
#include <string>

#ifndef BEEPROF_DEFAULT_BPF_OBJECT
#  define BEEPROF_DEFAULT_BPF_OBJECT "beeprof.bpf.o"
#endif

namespace beeprof {

// NOLINTNEXTLINE(clang-analyzer-optin.performance.Padding)
struct BeeprofCLI {
public:
  int parse(int argc, const char *argv[]);

  void print() const;

  // Sampling
  int frequency{kDefaultSamplingFrequency};
  std::string stack_mode;
  int pid{0};
  std::string cgroup;
  std::chrono::seconds duration{0};
  std::string collection_mode;
  std::chrono::milliseconds poll_period{kDefaultPollPeriod};

  // Symbolization
  std::string debug_path;
  bool inlined_functions{true};
  bool kernel_symbols{true};
  std::chrono::seconds idle_timeout{kDefaultIdleTimeout};

  // Output
  std::string output;
  std::string format;
  std::string title;
  bool show_pid{false};

  // debug
  std::string log_level;
  std::string log_mode;
  bool show_config{false};
  bool show_stats{false};
  bool version{false}; // request version

  // extended
  std::string bpf_object;
  size_t channel_capacity{kDefaultChannelCapacity};
  size_t subscriber_capacity{kDefaultSubscriberCapacity};
  uint32_t counts_table_size{kDefaultCountsTableSize};
  uint32_t stack_table_size{kDefaultStackTableSize};
  bool exit_notifications{true};
  bool help_extended{false};

  bool continue_exec{false};
};

} // namespace beeprof
