// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "aggregator.hpp"

#include "symbol.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <cctype>

namespace beeprof {

std::string sanitize_label(std::string_view label) {
  std::string out;
  out.reserve(label.size());
  bool pending_space = false;
  for (char const c : label) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c == ';' ? '_' : c);
  }
  if (out.empty()) {
    return std::string(k_unknown_label);
  }
  return out;
}

void FoldedProfile::add(std::span<const std::string> frames, uint64_t count) {
  add_folded(absl::StrJoin(frames, ";"), count);
}

void FoldedProfile::add_folded(std::string_view key, uint64_t count) {
  if (count == 0) {
    return;
  }
  auto it = _stacks.find(key);
  if (it == _stacks.end()) {
    _stacks.emplace(std::string(key), count);
  } else {
    it->second += count;
  }
  _total += count;
}

void FoldedProfile::merge(const FoldedProfile &other) {
  for (const auto &[key, count] : other._stacks) {
    add_folded(key, count);
  }
}

void FoldedProfile::clear() {
  _stacks.clear();
  _total = 0;
}

uint64_t FoldedProfile::count_of(std::string_view key) const {
  auto it = _stacks.find(key);
  return it == _stacks.end() ? 0 : it->second;
}

std::vector<FoldedStack> FoldedProfile::stacks() const {
  std::vector<FoldedStack> stacks;
  stacks.reserve(_stacks.size());
  for (const auto &[key, count] : _stacks) {
    std::vector<std::string> frames = absl::StrSplit(key, ';');
    stacks.push_back(FoldedStack{std::move(frames), count});
  }
  return stacks;
}

std::string format_folded(const FoldedStack &stack) {
  return absl::StrCat(absl::StrJoin(stack.frames, ";"), " ", stack.count);
}

void write_folded(const FoldedProfile &profile, std::ostream &out) {
  for (const auto &[key, count] : profile.entries()) {
    out << key << ' ' << count << '\n';
  }
}

Aggregator::Aggregator(AggregatorOptions options, FrameLabeler &labeler)
    : _options(options), _labeler(labeler) {}

void Aggregator::append_side(const RawFrames &frames, bool user, pid_t pid,
                             std::vector<std::string> &labels) {
  switch (frames.status) {
  case FramesStatus::kAbsent:
    labels.emplace_back(k_no_stack_label);
    return;
  case FramesStatus::kUnavailable:
    labels.emplace_back(k_frames_unavailable_label);
    return;
  case FramesStatus::kAvailable:
    break;
  }
  _side_labels.clear();
  if (user) {
    _labeler.user_labels(pid, frames.addresses, _side_labels);
  } else {
    _labeler.kernel_labels(frames.addresses, _side_labels);
  }
  if (_side_labels.empty()) {
    labels.emplace_back(k_no_stack_label);
    return;
  }
  // labeler output is innermost first
  for (auto it = _side_labels.rbegin(); it != _side_labels.rend(); ++it) {
    labels.push_back(sanitize_label(*it));
  }
}

void Aggregator::stack_labels(const RawSample &sample,
                              std::vector<std::string> &labels) {
  labels.clear();
  std::string root = sanitize_label(sample.key.comm_view());
  if (_options.show_pid) {
    absl::StrAppend(&root, "-", sample.key.pid);
  }
  labels.push_back(std::move(root));
  auto const pid = static_cast<pid_t>(sample.key.pid);
  if (_options.stack_mode & BEEPROF_STACK_USER) {
    append_side(sample.user, true, pid, labels);
  }
  if (_options.stack_mode & BEEPROF_STACK_KERNEL) {
    append_side(sample.kernel, false, pid, labels);
  }
}

void Aggregator::add(const RawSample &sample) {
  stack_labels(sample, _labels);
  _profile.add(_labels, sample.count);
}

void Aggregator::add_batch(const SampleBatch &batch) {
  for (const auto &sample : batch.samples) {
    add(sample);
  }
  _labeler.end_batch();
}

FoldedProfile Aggregator::take() {
  FoldedProfile profile = std::move(_profile);
  _profile.clear();
  return profile;
}

} // namespace beeprof
