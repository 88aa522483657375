// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof_cpumask.hpp"

#include "beeres_helpers.hpp"
#include "unique_fd.hpp"

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <cstdio>

namespace beeprof {

namespace {
constexpr const char *k_online_cpus_path = "/sys/devices/system/cpu/online";
constexpr size_t k_cpu_list_max_len = 4096;
} // namespace

bool parse_cpu_list(std::string_view sv, std::vector<int> &cpus) {
  cpus.clear();
  sv = absl::StripAsciiWhitespace(sv);
  if (sv.empty()) {
    return false;
  }
  for (std::string_view range : absl::StrSplit(sv, ',')) {
    std::pair<std::string_view, std::string_view> bounds =
        absl::StrSplit(range, absl::MaxSplits('-', 1));
    int first = 0;
    if (!absl::SimpleAtoi(bounds.first, &first) || first < 0) {
      return false;
    }
    int last = first;
    if (!bounds.second.empty() &&
        (!absl::SimpleAtoi(bounds.second, &last) || last < first)) {
      return false;
    }
    for (int cpu = first; cpu <= last; ++cpu) {
      cpus.push_back(cpu);
    }
  }
  return true;
}

BeeRes online_cpus(std::vector<int> &cpus) {
  UniqueFile file{fopen(k_online_cpus_path, "re")};
  if (!file) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_PERFOPEN, "Unable to open %s",
                            k_online_cpus_path);
  }
  char buf[k_cpu_list_max_len];
  if (!fgets(buf, sizeof(buf), file.get())) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_PERFOPEN, "Unable to read %s",
                            k_online_cpus_path);
  }
  if (!parse_cpu_list(buf, cpus)) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_PERFOPEN, "Invalid cpu list: %s", buf);
  }
  return {};
}

} // namespace beeprof
