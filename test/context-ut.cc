// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "beeprof_cli.hpp"
#include "beeprof_context.hpp"
#include "beeprof_context_lib.hpp"
#include "beeres.hpp"
#include "loghandle.hpp"
#include "version.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace beeprof {

namespace {
BeeprofCLI valid_cli() {
  BeeprofCLI cli;
  cli.stack_mode = "both";
  cli.collection_mode = "snapshot";
  cli.output = "stacks.folded";
  cli.format = "folded";
  cli.log_mode = "stderr";
  cli.log_level = "error";
  return cli;
}
} // namespace

TEST(BeeprofContext, from_command_line) {
  LogHandle handle;
  std::string const self_pid = std::to_string(getpid());
  const char *argv[] = {MYNAME,      "--pid",           self_pid.c_str(),
                        "-F",        "99",              "--stack-mode",
                        "kernel",    "--collection-mode", "continuous",
                        "--format",  "json"};
  int argc = sizeof(argv) / sizeof(argv[0]);
  BeeprofCLI beeprof_cli;
  ASSERT_EQ(0, beeprof_cli.parse(argc, argv));
  ASSERT_TRUE(beeprof_cli.continue_exec);

  BeeprofContext ctx;
  BeeRes res = context_set(beeprof_cli, ctx);
  ASSERT_TRUE(IsBeeResOK(res));
  EXPECT_EQ(ctx.params.frequency, 99);
  EXPECT_EQ(ctx.params.stack_mode, BEEPROF_STACK_KERNEL);
  EXPECT_EQ(ctx.params.target_kind, BEEPROF_TARGET_PID);
  EXPECT_EQ(ctx.params.target_pid, getpid());
  EXPECT_EQ(ctx.params.collection_mode, CollectionMode::kContinuous);
  EXPECT_EQ(ctx.params.format, OutputFormat::kJson);
  EXPECT_EQ(ctx.params.output_path, "stacks.folded");
}

TEST(BeeprofContext, stack_modes) {
  uint32_t mode = 0;
  EXPECT_TRUE(parse_stack_mode("kernel", mode));
  EXPECT_EQ(mode, BEEPROF_STACK_KERNEL);
  EXPECT_TRUE(parse_stack_mode("USER", mode));
  EXPECT_EQ(mode, BEEPROF_STACK_USER);
  EXPECT_TRUE(parse_stack_mode("both", mode));
  EXPECT_EQ(mode, BEEPROF_STACK_BOTH);
  EXPECT_FALSE(parse_stack_mode("none", mode));
}

TEST(BeeprofContext, validation) {
  LogHandle handle;
  {
    BeeprofContext ctx;
    ctx.params.output_path = "out";
    EXPECT_TRUE(IsBeeResOK(context_validate(ctx)));
  }
  {
    BeeprofContext ctx;
    ctx.params.output_path = "out";
    ctx.params.frequency = 10001;
    EXPECT_FALSE(IsBeeResOK(context_validate(ctx)));
  }
  {
    BeeprofContext ctx;
    ctx.params.output_path = "out";
    ctx.params.poll_period = std::chrono::milliseconds(0);
    EXPECT_FALSE(IsBeeResOK(context_validate(ctx)));
  }
  {
    BeeprofContext ctx;
    ctx.params.output_path = "out";
    ctx.params.channel_capacity = 0;
    EXPECT_FALSE(IsBeeResOK(context_validate(ctx)));
  }
  {
    BeeprofContext ctx;
    ctx.params.output_path = "";
    EXPECT_FALSE(IsBeeResOK(context_validate(ctx)));
  }
  {
    BeeprofContext ctx;
    ctx.params.output_path = "out";
    ctx.params.target_kind = BEEPROF_TARGET_PID;
    ctx.params.target_pid = -3;
    EXPECT_FALSE(IsBeeResOK(context_validate(ctx)));
  }
}

TEST(BeeprofContext, unknown_pid) {
  LogHandle handle;
  BeeprofContext ctx;
  ctx.params.output_path = "out";
  ctx.params.target_kind = BEEPROF_TARGET_PID;
  ctx.params.target_pid = getpid();
  EXPECT_TRUE(IsBeeResOK(context_validate(ctx)));

  // above the default pid_max
  ctx.params.target_pid = 4194305;
  BeeRes res = context_validate(ctx);
  EXPECT_FALSE(IsBeeResOK(res));
  EXPECT_EQ(res._what, BEE_WHAT_ARGUMENT);

  BeeprofCLI cli = valid_cli();
  cli.pid = 4194305;
  BeeprofContext cli_ctx;
  res = context_set(cli, cli_ctx);
  EXPECT_FALSE(IsBeeResOK(res));
  EXPECT_EQ(res._what, BEE_WHAT_ARGUMENT);
}

TEST(BeeprofContext, pid_and_cgroup_exclusive) {
  LogHandle handle;
  BeeprofCLI cli = valid_cli();
  cli.pid = 12;
  cli.cgroup = "/sys/fs/cgroup";
  BeeprofContext ctx;
  BeeRes res = context_set(cli, ctx);
  EXPECT_FALSE(IsBeeResOK(res));
  EXPECT_EQ(res._what, BEE_WHAT_ARGUMENT);
}

TEST(BeeprofContext, cgroup_path) {
  LogHandle handle;
  char tmpl[] = "/tmp/beeprof-cgroup-XXXXXX";
  ASSERT_NE(mkdtemp(tmpl), nullptr);
  {
    BeeprofCLI cli = valid_cli();
    cli.cgroup = tmpl;
    BeeprofContext ctx;
    ASSERT_TRUE(IsBeeResOK(context_set(cli, ctx)));
    struct stat info;
    ASSERT_EQ(stat(tmpl, &info), 0);
    EXPECT_EQ(ctx.params.target_kind, BEEPROF_TARGET_CGROUP);
    EXPECT_EQ(ctx.params.cgroup_id, info.st_ino);
  }
  {
    // a cgroup is a directory
    std::string const file = std::string(tmpl) + "/cgroup.procs";
    FILE *f = fopen(file.c_str(), "w");
    ASSERT_NE(f, nullptr);
    fclose(f);
    uint64_t id = 0;
    BeeRes res = cgroup_id_from_path(file, id);
    EXPECT_FALSE(IsBeeResOK(res));
    EXPECT_EQ(res._what, BEE_WHAT_CGROUP);
  }
  std::filesystem::remove_all(tmpl);

  BeeprofCLI cli = valid_cli();
  cli.cgroup = "/this/cgroup/does/not/exist";
  BeeprofContext ctx;
  BeeRes res = context_set(cli, ctx);
  EXPECT_FALSE(IsBeeResOK(res));
  EXPECT_EQ(res._what, BEE_WHAT_CGROUP);
}

} // namespace beeprof
