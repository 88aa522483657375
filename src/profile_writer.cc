// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profile_writer.hpp"

#include "beeres.hpp"
#include "flamegraph.hpp"
#include "logger.hpp"

#include <absl/strings/str_cat.h>
#include <cstdio>
#include <fstream>
#include <string>

namespace beeprof {

const char *output_format_str(OutputFormat format) {
  switch (format) {
  case OutputFormat::kFolded:
    return "folded";
  case OutputFormat::kJson:
    return "json";
  case OutputFormat::kHtml:
    return "html";
  }
  return "undef";
}

BeeRes write_profile(const FoldedProfile &profile, OutputFormat format,
                     std::string_view path, std::string_view title) {
  std::string const final_path{path};
  std::string const tmp_path = absl::StrCat(final_path, ".tmp");
  {
    std::ofstream out{tmp_path, std::ios::out | std::ios::trunc};
    if (!out) {
      BEERES_RETURN_ERROR_LOG(BEE_WHAT_OUTPUT, "Unable to open %s",
                              tmp_path.c_str());
    }
    switch (format) {
    case OutputFormat::kFolded:
      write_folded(profile, out);
      break;
    case OutputFormat::kJson:
      out << flamegraph_json(profile) << '\n';
      break;
    case OutputFormat::kHtml:
      out << flamegraph_html(profile, title);
      break;
    }
    out.flush();
    if (!out) {
      BEERES_RETURN_ERROR_LOG(BEE_WHAT_OUTPUT, "Unable to write %s",
                              tmp_path.c_str());
    }
  }
  BEERES_CHECK_ERRNO(std::rename(tmp_path.c_str(), final_path.c_str()),
                     BEE_WHAT_OUTPUT, "Unable to rename %s to %s",
                     tmp_path.c_str(), final_path.c_str());
  LG_NTC("Wrote %zu stacks (%lu samples) to %s as %s", profile.size(),
         profile.total(), final_path.c_str(), output_format_str(format));
  return {};
}

} // namespace beeprof
