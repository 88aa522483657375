// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof_cmdline.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace beeprof {

int arg_which(std::string_view str, std::span<const std::string_view> str_set) {
  auto it = std::ranges::find_if(str_set, [&str](std::string_view s) {
    return s.size() == str.size() &&
        std::equal(str.begin(), str.end(), s.begin(), s.end(),
                   [](char a, char b) {
                     return std::tolower(static_cast<unsigned char>(a)) ==
                         std::tolower(static_cast<unsigned char>(b));
                   });
  });
  return (it == str_set.end()) ? -1 : std::distance(str_set.begin(), it);
}

} // namespace beeprof
