// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

// Layouts shared between the sampling probe and user space.
// This header is compiled both as BPF C and as C++.

#ifndef BEEPROF_PROFILE_SHARED_H
#define BEEPROF_PROFILE_SHARED_H

#include <linux/types.h>

#define BEEPROF_MAX_STACK_DEPTH 127
#define BEEPROF_COMM_LEN 16

// Names of the objects inside the probe's BPF object file
#define BEEPROF_PROG_SAMPLE "beeprof_sample"
#define BEEPROF_PROG_EXIT "beeprof_process_exit"
#define BEEPROF_MAP_COUNTS "counts"
#define BEEPROF_MAP_STACKS "stacks"
#define BEEPROF_MAP_CONFIG "config"
#define BEEPROF_MAP_DROPPED "dropped"
#define BEEPROF_MAP_EXITS "exits"

enum beeprof_stack_mode {
  BEEPROF_STACK_KERNEL = 1 << 0,
  BEEPROF_STACK_USER = 1 << 1,
  BEEPROF_STACK_BOTH = BEEPROF_STACK_KERNEL | BEEPROF_STACK_USER,
};

enum beeprof_target_kind {
  BEEPROF_TARGET_ALL = 0,
  BEEPROF_TARGET_PID = 1,
  BEEPROF_TARGET_CGROUP = 2,
};

// Key of the aggregation table: one distinct stack shape of one process.
// A negative stack id means the capture of that side failed or was disabled.
struct beeprof_stack_key {
  __u32 pid;
  __s32 kernel_stack_id;
  __s32 user_stack_id;
  char comm[BEEPROF_COMM_LEN];
};

// Written once by user space before the probe is attached
struct beeprof_probe_config {
  __u32 stack_mode;
  __u32 target_kind;
  __u32 target_pid;
  __u32 self_pid;
  __u64 target_cgroup_id;
};

struct beeprof_exit_event {
  __u32 pid;
};

#endif
