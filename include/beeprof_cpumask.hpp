// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"

#include <string_view>
#include <vector>

namespace beeprof {

// Parse a kernel cpu list ("0-3,5,8-9")
bool parse_cpu_list(std::string_view sv, std::vector<int> &cpus);

// CPUs listed in /sys/devices/system/cpu/online
BeeRes online_cpus(std::vector<int> &cpus);

} // namespace beeprof
