// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "aggregator.hpp"
#include "beeres_def.hpp"

#include <cstdint>
#include <string_view>

namespace beeprof {

enum class OutputFormat : uint8_t {
  kFolded,
  kJson,
  kHtml,
};

const char *output_format_str(OutputFormat format);

// Writes to a temporary file renamed over `path`: readers never see a
// partial profile
BeeRes write_profile(const FoldedProfile &profile, OutputFormat format,
                     std::string_view path, std::string_view title);

} // namespace beeprof
