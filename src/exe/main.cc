// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof.hpp"
#include "beeprof_cli.hpp"
#include "beeprof_context.hpp"
#include "beeprof_context_lib.hpp"
#include "beeres.hpp"
#include "defer.hpp"
#include "logger.hpp"
#include "version.hpp"

#include <memory>

int main(int argc, char *argv[]) {
  using namespace beeprof;

  auto ctx = std::make_unique<BeeprofContext>();
  {
    BeeprofCLI cli;
    int const res = cli.parse(argc, const_cast<const char **>(argv));
    if (!cli.continue_exec) {
      return res;
    }

    // parse inputs and populate context
    if (IsBeeResNotOK(context_set(cli, *ctx))) {
      LOG_close();
      return -1;
    }
  }
  defer { LOG_close(); };

  if (IsBeeResNotOK(beeprof_setup(*ctx))) {
    LG_ERR("Unable to set up " MYNAME);
    return -1;
  }
  BeeRes const res = beeprof_run(*ctx);
  if (IsBeeResNotOK(beeprof_teardown())) {
    LG_WRN("Error during teardown");
  }
  if (IsBeeResNotOK(res)) {
    LG_ERR("Profiling failed - %s", beeres_error_message(res._what));
    return -1;
  }
  return 0;
}
