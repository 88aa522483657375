// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <optional>
#include <span>
#include <string>

extern "C" {
typedef struct Elf Elf;
}

namespace beeprof {
using BuildIdSpan = std::span<const unsigned char>;
using BuildIdStr = std::string;

// Lowercase hex rendering of a build id
BuildIdStr format_build_id(BuildIdSpan build_id_span);

// GNU build id (hex) or Go build id (as stored), from sections or notes
std::optional<BuildIdStr> find_build_id(Elf *elf);
std::optional<BuildIdStr> find_build_id(const char *filepath);

} // namespace beeprof
