// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace beeprof {
inline constexpr auto kMaxLogPerSecForNonDebug = 100;

// log_mode: stdout, stderr, syslog, disabled or a file path
// log_level: debug, informational, notice, warn, error
void setup_logger(
    std::string_view log_mode, std::string_view log_level,
    uint64_t max_log_per_sec_for_non_debug = kMaxLogPerSecForNonDebug);

} // namespace beeprof
