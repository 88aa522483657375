// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "loghandle.hpp"
#include "logger_setup.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

static int call_counter = 0;

static const char *func_incr() {
  ++call_counter;
  return "foo";
}

namespace beeprof {
TEST(Logger, LevelFilter) {
  LogHandle log_handle(LL_ERROR);
  LG_WRN("Some warning that should not show %s", func_incr());
  EXPECT_EQ(call_counter, 0);
  LG_ERR("Print the foo: %s", func_incr());
  EXPECT_EQ(call_counter, 1);
  EXPECT_FALSE(LOG_is_logging_enabled_for_level(LL_DEBUG));
  EXPECT_TRUE(LOG_is_logging_enabled_for_level(LL_ERROR));
}

TEST(Logger, FileMode) {
  std::string const path =
      "/tmp/beeprof_logger_ut_" + std::to_string(getpid()) + ".log";
  unlink(path.c_str());
  setup_logger(path, "notice");
  EXPECT_EQ(LOG_getlevel(), LL_NOTICE);
  LG_NTC("notice %d", 42);
  LG_DBG("debug %d", 43);
  LOG_close();

  std::ifstream in{path};
  ASSERT_TRUE(in.good());
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_NE(content.str().find("notice 42"), std::string::npos);
  EXPECT_EQ(content.str().find("debug 43"), std::string::npos);
  unlink(path.c_str());
}

TEST(Logger, SetupLevels) {
  setup_logger("disabled", "debug");
  EXPECT_EQ(LOG_getlevel(), LL_DEBUG);
  setup_logger("disabled", "informational");
  EXPECT_EQ(LOG_getlevel(), LL_INFORMATIONAL);
  setup_logger("disabled", "error");
  EXPECT_EQ(LOG_getlevel(), LL_ERROR);
  // unknown levels fall back to warnings
  setup_logger("disabled", "verbose");
  EXPECT_EQ(LOG_getlevel(), LL_WARNING);
  LOG_close();
}
} // namespace beeprof
