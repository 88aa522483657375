// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"

namespace beeprof {
struct BeeprofContext;

// Stats and signal handlers
BeeRes beeprof_setup(const BeeprofContext &ctx);

// Attaches the probe, runs the pipeline until the duration elapses or a
// termination signal arrives, then writes the profile
BeeRes beeprof_run(const BeeprofContext &ctx);

BeeRes beeprof_teardown();
} // namespace beeprof
