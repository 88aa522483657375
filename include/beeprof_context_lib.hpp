// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"

#include <cstdint>
#include <string_view>

namespace beeprof {

struct BeeprofCLI;
struct BeeprofContext;

// Sets up the logger, then copies and validates the command line values.
// Nothing touches the kernel before this succeeds.
BeeRes context_set(const BeeprofCLI &beeprof_cli, BeeprofContext &ctx);

// Checks the values of an already filled context
BeeRes context_validate(BeeprofContext &ctx);

bool parse_stack_mode(std::string_view str, uint32_t &stack_mode);

// cgroup v2 id of a directory (its inode number)
BeeRes cgroup_id_from_path(std::string_view path, uint64_t &cgroup_id);

} // namespace beeprof
