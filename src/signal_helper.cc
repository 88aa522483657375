// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "signal_helper.hpp"

#include "beeres_helpers.hpp"

#include <cerrno>
#include <csignal>
#include <signal.h>

namespace beeprof {

namespace {
std::atomic<bool> g_termination_requested{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void handle_signal(int) {
  g_termination_requested.store(true, std::memory_order_relaxed);
}
} // namespace

bool process_is_alive(int pidId) {
  return -1 != kill(pidId, 0) || errno != ESRCH;
}

BeeRes install_termination_handler() {
  sigset_t sigset;
  struct sigaction sa = {};
  BEERES_CHECK_ERRNO(sigemptyset(&sigset), BEE_WHAT_SIGNAL,
                     "sigemptyset failed");
  sa.sa_handler = &handle_signal;
  sa.sa_mask = sigset;
  sa.sa_flags = SA_RESTART;
  BEERES_CHECK_ERRNO(sigaction(SIGTERM, &sa, nullptr), BEE_WHAT_SIGNAL,
                     "Setting SIGTERM handler failed");
  BEERES_CHECK_ERRNO(sigaction(SIGINT, &sa, nullptr), BEE_WHAT_SIGNAL,
                     "Setting SIGINT handler failed");
  return {};
}

bool termination_requested() {
  return g_termination_requested.load(std::memory_order_relaxed);
}

void reset_termination_request() {
  g_termination_requested.store(false, std::memory_order_relaxed);
}

} // namespace beeprof
