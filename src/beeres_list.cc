// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeres_list.hpp"

#include <cstring>
#include <iterator>

namespace {
const char *s_common_error_messages[] = {
    COMMON_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

const char *s_native_error_messages[] = {
    NATIVE_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};
} // namespace

const char *beeres_error_message(int16_t what) {
  if (what >= BEE_WHAT_MIN_ERRNO && what < COMMON_ERROR_SIZE) {
    const int idx = what - BEE_WHAT_MIN_ERRNO - 1;
    if (idx >= 0 && idx < static_cast<int>(std::size(s_common_error_messages))) {
      return s_common_error_messages[idx];
    }
  } else if (what > BEE_WHAT_MIN_NATIVE && what < NATIVE_ERROR_SIZE) {
    return s_native_error_messages[what - BEE_WHAT_MIN_NATIVE - 1];
  } else if (what > 0 && what < BEE_WHAT_MIN_ERRNO) {
    return strerror(what);
  }
  return "BEEPROF_UNKNOWN_ERROR";
}
