// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "beeprof_cpumask.hpp"

#include "beeres.hpp"
#include "loghandle.hpp"

#include <gtest/gtest.h>

namespace beeprof {

TEST(CPUMask, parse) {
  std::vector<int> cpus;
  EXPECT_TRUE(parse_cpu_list("0", cpus));
  EXPECT_EQ(cpus, std::vector<int>{0});

  EXPECT_TRUE(parse_cpu_list("0-3\n", cpus));
  EXPECT_EQ(cpus, (std::vector<int>{0, 1, 2, 3}));

  EXPECT_TRUE(parse_cpu_list("0-1,4,6-7", cpus));
  EXPECT_EQ(cpus, (std::vector<int>{0, 1, 4, 6, 7}));
}

TEST(CPUMask, invalid) {
  std::vector<int> cpus;
  EXPECT_FALSE(parse_cpu_list("", cpus));
  EXPECT_FALSE(parse_cpu_list("a-b", cpus));
  EXPECT_FALSE(parse_cpu_list("3-1", cpus));
  EXPECT_FALSE(parse_cpu_list("0,,1", cpus));
}

TEST(CPUMask, online) {
  LogHandle handle;
  std::vector<int> cpus;
  BeeRes res = online_cpus(cpus);
  ASSERT_TRUE(IsBeeResOK(res));
  EXPECT_FALSE(cpus.empty());
}

} // namespace beeprof
