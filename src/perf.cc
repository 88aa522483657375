// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "perf.hpp"

#include <sys/syscall.h>
#include <unistd.h>

namespace beeprof {

int perf_event_open(struct perf_event_attr *attr, pid_t pid, int cpu, int gfd,
                    unsigned long flags) {
  return syscall(__NR_perf_event_open, attr, pid, cpu, gfd, flags);
}

perf_event_attr perf_config_cpu_clock(int frequency) {
  perf_event_attr attr = {};
  attr.size = sizeof(perf_event_attr);
  attr.type = PERF_TYPE_SOFTWARE;
  attr.config = PERF_COUNT_SW_CPU_CLOCK;
  attr.freq = 1;
  attr.sample_freq = frequency;
  attr.disabled = 0;
  return attr;
}

const char *perf_type_str(int type_id) {
  switch (type_id) {
  case PERF_TYPE_HARDWARE:
    return "HARDWARE";
  case PERF_TYPE_SOFTWARE:
    return "SOFTWARE";
  case PERF_TYPE_TRACEPOINT:
    return "TRACEPOINT";
  case PERF_TYPE_HW_CACHE:
    return "HW_CACHE";
  case PERF_TYPE_RAW:
    return "RAW";
  case PERF_TYPE_BREAKPOINT:
    return "BREAKPOINT";
  default:
    return "UNKNOWN";
  }
}

} // namespace beeprof
