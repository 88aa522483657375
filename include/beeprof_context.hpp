// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "collector.hpp"
#include "profile_writer.hpp"

#include <chrono>
#include <string>
#include <sys/types.h>

namespace beeprof {

struct BeeprofContext {
  struct {
    int frequency{kDefaultSamplingFrequency};
    uint32_t stack_mode{BEEPROF_STACK_BOTH};
    uint32_t target_kind{BEEPROF_TARGET_ALL};
    pid_t target_pid{0};
    std::string cgroup_path;
    uint64_t cgroup_id{0};
    std::chrono::seconds duration{0};
    CollectionMode collection_mode{CollectionMode::kSnapshot};
    std::chrono::milliseconds poll_period{kDefaultPollPeriod};
    size_t channel_capacity{kDefaultChannelCapacity};
    size_t subscriber_capacity{kDefaultSubscriberCapacity};
    std::chrono::seconds idle_timeout{kDefaultIdleTimeout};
    std::string debug_path;
    bool inlined_functions{true};
    bool kernel_symbols{true};
    std::string output_path;
    OutputFormat format{OutputFormat::kFolded};
    std::string title;
    bool show_pid{false};
    bool show_stats{false};
    std::string bpf_object;
    uint32_t counts_table_size{kDefaultCountsTableSize};
    uint32_t stack_table_size{kDefaultStackTableSize};
    bool exit_notifications{true};
  } params;
};

} // namespace beeprof
