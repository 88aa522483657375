// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"

#include <atomic>

namespace beeprof {
bool process_is_alive(int pidId);

// SIGTERM / SIGINT raise the flag returned by termination_requested()
BeeRes install_termination_handler();

bool termination_requested();

// Clears the flag (used by tests)
void reset_termination_request();

} // namespace beeprof
