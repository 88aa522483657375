// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <chrono>
#include <time.h>

namespace beeprof {

constexpr std::chrono::nanoseconds timespec_to_duration(timespec ts) {
  return std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
}

// Seconds with a fractional part, as printed in stats and logs
template <typename Duration> constexpr double to_seconds(Duration d) {
  return std::chrono::duration<double>(d).count();
}

} // namespace beeprof
