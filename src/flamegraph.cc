// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "flamegraph.hpp"

#include <absl/strings/str_replace.h>
#include <absl/strings/str_split.h>
#include <algorithm>
#include <vector>

namespace beeprof {

namespace {
struct FlameNode {
  std::string name;
  uint64_t value{0};
  std::vector<FlameNode> children;
};

nlohmann::ordered_json to_json(const FlameNode &node) {
  nlohmann::ordered_json json;
  json["name"] = node.name;
  json["value"] = node.value;
  json["children"] = nlohmann::ordered_json::array();
  for (const auto &child : node.children) {
    json["children"].push_back(to_json(child));
  }
  return json;
}

std::string escape_html(std::string_view text) {
  return absl::StrReplaceAll(
      text, {{"&", "&amp;"}, {"<", "&lt;"}, {">", "&gt;"}, {"\"", "&quot;"}});
}

constexpr std::string_view k_html_template = R"html(<!DOCTYPE html>
<html lang="en">
  <head>
    <meta charset="utf-8">
    <link rel="stylesheet" type="text/css" href="https://cdn.jsdelivr.net/npm/d3-flame-graph@4.1.3/dist/d3-flamegraph.css">
    <style>
      body { font-family: sans-serif; margin: 20px; }
      .header { display: flex; justify-content: space-between; border-bottom: 1px solid #e5e5e5; }
      #chart { margin-top: 10px; }
    </style>
    <title>{title}</title>
  </head>
  <body>
    <div class="header">
      <h3>{title}</h3>
      <form id="form">
        <a href="javascript: flameGraph.resetZoom();">Reset zoom</a>
        <a href="javascript: clearSearch();">Clear</a>
        <input type="text" id="term">
        <a href="javascript: search();">Search</a>
      </form>
    </div>
    <div id="chart"></div>
    <hr>
    <div id="details"></div>
    <script type="text/javascript" src="https://d3js.org/d3.v7.min.js"></script>
    <script type="text/javascript" src="https://cdn.jsdelivr.net/npm/d3-flame-graph@4.1.3/dist/d3-flamegraph.min.js"></script>
    <script type="text/javascript">
      var data = {stack};
      var flameGraph = flamegraph()
        .width(960)
        .cellHeight(18)
        .minFrameSize(5)
        .sort(true)
        .selfValue(false);
      d3.select("#chart").datum(data).call(flameGraph);
      flameGraph.setDetailsElement(document.getElementById("details"));
      document.getElementById("form").addEventListener("submit", function(event) {
        event.preventDefault();
        search();
      });
      function search() {
        flameGraph.search(document.getElementById("term").value);
      }
      function clearSearch() {
        document.getElementById("term").value = "";
        flameGraph.clear();
      }
    </script>
  </body>
</html>
)html";
} // namespace

nlohmann::ordered_json flamegraph_tree(const FoldedProfile &profile) {
  FlameNode root;
  // children keep the order of the sorted entries
  for (const auto &[key, count] : profile.entries()) {
    root.value += count;
    FlameNode *node = &root;
    for (std::string_view const name : absl::StrSplit(key, ';')) {
      // labels sorting below ';' ("main.cold") can separate two stacks
      // sharing a prefix, look past the last child
      auto it = std::find_if(
          node->children.rbegin(), node->children.rend(),
          [&](const FlameNode &child) { return child.name == name; });
      if (it == node->children.rend()) {
        node->children.push_back(FlameNode{std::string(name), 0, {}});
        node = &node->children.back();
      } else {
        node = &*it;
      }
      node->value += count;
    }
  }
  return to_json(root);
}

std::string flamegraph_json(const FoldedProfile &profile) {
  return flamegraph_tree(profile).dump();
}

std::string flamegraph_html(const FoldedProfile &profile,
                            std::string_view title) {
  // keep a symbol name from closing the script element
  std::string const data =
      absl::StrReplaceAll(flamegraph_json(profile), {{"</", "<\\/"}});
  return absl::StrReplaceAll(
      k_html_template, {{"{title}", escape_html(title)}, {"{stack}", data}});
}

} // namespace beeprof
