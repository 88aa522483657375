// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger_setup.hpp"

#include "beeprof_cmdline.hpp"
#include "logger.hpp"

#include <string>

namespace beeprof {

void setup_logger(std::string_view log_mode, std::string_view log_level,
                  uint64_t max_log_per_sec_for_non_debug) {
  // Process logging mode
  static constexpr std::string_view logpattern[] = {"stdout", "stderr",
                                                    "syslog", "disabled"};
  int const idx_log_mode =
      log_mode.empty() ? 1 : arg_which(log_mode, logpattern);
  switch (idx_log_mode) {
  case 0:
    LOG_open(LOG_STDOUT, "");
    break;
  case 1:
    LOG_open(LOG_STDERR, "");
    break;
  case 2:
    if (!LOG_open(LOG_SYSLOG, "")) {
      LOG_open(LOG_STDERR, "");
      LG_WRN("Unable to reach syslog, logging to stderr");
    }
    break;
  case 3:
    LOG_open(LOG_DISABLE, "");
    break;
  default: {
    std::string const path{log_mode};
    if (!LOG_open(LOG_FILE, path.c_str())) {
      LOG_open(LOG_STDERR, "");
      LG_WRN("Unable to open log file %s, logging to stderr", path.c_str());
    }
    break;
  }
  }

  // Process logging level
  static constexpr std::string_view loglpattern[] = {
      "debug", "informational", "notice", "warn", "error"};
  switch (arg_which(log_level, loglpattern)) {
  case 0:
    LOG_setlevel(LL_DEBUG);
    break;
  case 1:
    LOG_setlevel(LL_INFORMATIONAL);
    break;
  case 2:
    LOG_setlevel(LL_NOTICE);
    break;
  case 4:
    LOG_setlevel(LL_ERROR);
    break;
  case -1: // default
  case 3:
  default:
    LOG_setlevel(LL_WARNING);
    break;
  }

  if (LOG_getlevel() < LL_DEBUG) {
    LOG_setratelimit(max_log_per_sec_for_non_debug, std::chrono::seconds(1));
  }
}

} // namespace beeprof
