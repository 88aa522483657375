// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "flamegraph.hpp"

#include <gtest/gtest.h>

namespace beeprof {

TEST(Flamegraph, json_tree) {
  FoldedProfile profile;
  profile.add_folded("a", 1);
  profile.add_folded("a;b", 1);
  profile.add_folded("a;b", 1);
  profile.add_folded("a;b;c", 1);
  profile.add_folded("a;b;c;d", 1);
  profile.add_folded("a;b;e", 3);
  profile.add_folded("f;g", 1);
  EXPECT_EQ(
      flamegraph_json(profile),
      R"({"name":"","value":9,"children":[{"name":"a","value":8,"children":[{"name":"b","value":7,"children":[{"name":"c","value":2,"children":[{"name":"d","value":1,"children":[]}]},{"name":"e","value":3,"children":[]}]}]},{"name":"f","value":1,"children":[{"name":"g","value":1,"children":[]}]}]})");
}

TEST(Flamegraph, empty) {
  FoldedProfile profile;
  EXPECT_EQ(flamegraph_json(profile), R"({"name":"","value":0,"children":[]})");
}

TEST(Flamegraph, shared_prefix_not_contiguous) {
  FoldedProfile profile;
  // "main.cold" sorts between "main" and "main;x"
  profile.add_folded("p;main", 1);
  profile.add_folded("p;main.cold", 2);
  profile.add_folded("p;main;x", 3);
  nlohmann::ordered_json tree = flamegraph_tree(profile);
  ASSERT_EQ(tree["children"].size(), 1);
  const auto &p = tree["children"][0];
  EXPECT_EQ(p["value"], 6);
  ASSERT_EQ(p["children"].size(), 2);
  EXPECT_EQ(p["children"][0]["name"], "main");
  EXPECT_EQ(p["children"][0]["value"], 4);
  EXPECT_EQ(p["children"][1]["name"], "main.cold");
  EXPECT_EQ(p["children"][1]["value"], 2);
}

TEST(Flamegraph, html) {
  FoldedProfile profile;
  profile.add_folded("prog;</script>", 2);
  std::string const html = flamegraph_html(profile, "cpu <profile>");
  EXPECT_NE(html.find("<title>cpu &lt;profile&gt;</title>"), std::string::npos);
  EXPECT_NE(html.find(R"("name":"prog")"), std::string::npos);
  // the embedded data cannot close the script element
  EXPECT_EQ(html.find("</script>\""), std::string::npos);
  EXPECT_NE(html.find("<\\/script>"), std::string::npos);
  EXPECT_EQ(html.find("{stack}"), std::string::npos);
}

} // namespace beeprof
