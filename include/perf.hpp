// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <linux/perf_event.h>
#include <sys/types.h>

namespace beeprof {

int perf_event_open(struct perf_event_attr *attr, pid_t pid, int cpu, int gfd,
                    unsigned long flags);

// Software cpu-clock event firing `frequency` times per second on a CPU
perf_event_attr perf_config_cpu_clock(int frequency);

const char *perf_type_str(int type_id);

} // namespace beeprof
