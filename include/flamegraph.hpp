// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "aggregator.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace beeprof {

// d3-flamegraph hierarchy: {name, value, children}. The root is unnamed and
// holds the total; every node holds the weight of the stacks going through it.
nlohmann::ordered_json flamegraph_tree(const FoldedProfile &profile);

std::string flamegraph_json(const FoldedProfile &profile);

// Standalone page rendering the profile with d3-flamegraph
std::string flamegraph_html(const FoldedProfile &profile,
                            std::string_view title);

} // namespace beeprof
