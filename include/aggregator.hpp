// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "beeres_def.hpp"
#include "frame_labeler.hpp"
#include "raw_sample.hpp"

#include <cstdint>
#include <map>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beeprof {

inline constexpr std::string_view k_no_stack_label = "[no stack]";
inline constexpr std::string_view k_frames_unavailable_label = "[unavailable]";

// Labels from the root (process) to the leaf
struct FoldedStack {
  std::vector<std::string> frames;
  uint64_t count{0};
};

// `;` becomes `_`, whitespace runs become one space, never empty
std::string sanitize_label(std::string_view label);

// Folded stacks keyed by their joined labels, ordered lexicographically
class FoldedProfile {
public:
  // frames are root first and already sanitized
  void add(std::span<const std::string> frames, uint64_t count);
  void add_folded(std::string_view key, uint64_t count);
  void merge(const FoldedProfile &other);
  void clear();

  [[nodiscard]] uint64_t total() const { return _total; }
  [[nodiscard]] size_t size() const { return _stacks.size(); }
  [[nodiscard]] bool empty() const { return _stacks.empty(); }
  [[nodiscard]] uint64_t count_of(std::string_view key) const;
  [[nodiscard]] const std::map<std::string, uint64_t, std::less<>> &
  entries() const {
    return _stacks;
  }
  [[nodiscard]] std::vector<FoldedStack> stacks() const;

private:
  std::map<std::string, uint64_t, std::less<>> _stacks;
  uint64_t _total{0};
};

// `label1;label2;...;labelN count`
std::string format_folded(const FoldedStack &stack);
void write_folded(const FoldedProfile &profile, std::ostream &out);

struct AggregatorOptions {
  // root label is comm-pid instead of comm
  bool show_pid{false};
  // sides not captured by the probe are omitted
  uint32_t stack_mode{BEEPROF_STACK_BOTH};
};

// Folds raw samples into a FoldedProfile.
// Stack layout: root, user frames outermost first, kernel frames outermost
// first. A missing side is replaced by a single [no stack] frame.
class Aggregator {
public:
  Aggregator(AggregatorOptions options, FrameLabeler &labeler);

  void add(const RawSample &sample);
  void add_batch(const SampleBatch &batch);

  // Labels of a sample, root first
  void stack_labels(const RawSample &sample, std::vector<std::string> &labels);

  [[nodiscard]] const FoldedProfile &profile() const { return _profile; }
  // Returns the folded content and starts a new profile
  FoldedProfile take();

private:
  void append_side(const RawFrames &frames, bool user, pid_t pid,
                   std::vector<std::string> &labels);

  AggregatorOptions _options;
  FrameLabeler &_labeler;
  FoldedProfile _profile;
  std::vector<std::string> _side_labels;
  std::vector<std::string> _labels;
};

} // namespace beeprof
