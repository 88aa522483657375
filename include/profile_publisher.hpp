// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "aggregator.hpp"
#include "beeprof_defs.hpp"
#include "bounded_channel.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace beeprof {

// Immutable view of the profile at the end of a processing cycle
struct ProfileSnapshot {
  uint64_t sequence{0};
  std::chrono::system_clock::time_point timestamp;
  bool final{false};
  FoldedProfile profile;
};

using ProfileSnapshotPtr = std::shared_ptr<const ProfileSnapshot>;

// Queue of published snapshots. A slow subscriber loses its oldest snapshots.
class ProfileSubscription {
public:
  explicit ProfileSubscription(size_t capacity)
      : _channel(capacity, OverflowPolicy::kDropOldest) {}

  // Waits for the next snapshot. Empty once the publisher is closed.
  std::optional<ProfileSnapshotPtr> next() { return _channel.pop(); }
  std::optional<ProfileSnapshotPtr> next_for(std::chrono::milliseconds timeout) {
    return _channel.pop_for(timeout);
  }
  std::optional<ProfileSnapshotPtr> try_next() { return _channel.try_pop(); }

  [[nodiscard]] uint64_t nb_dropped() const { return _channel.nb_dropped(); }
  [[nodiscard]] bool closed() const { return _channel.closed(); }

private:
  friend class ProfilePublisher;
  BoundedChannel<ProfileSnapshotPtr> _channel;
};

// Live access to the latest profile. Publication copies the profile once,
// readers share the immutable result.
class ProfilePublisher {
public:
  explicit ProfilePublisher(
      size_t subscriber_capacity = kDefaultSubscriberCapacity);
  ~ProfilePublisher();

  ProfilePublisher(const ProfilePublisher &) = delete;
  ProfilePublisher &operator=(const ProfilePublisher &) = delete;

  void publish(const FoldedProfile &profile, bool final);

  // nullptr until the first publication
  [[nodiscard]] ProfileSnapshotPtr get_latest_snapshot() const;

  // The subscription stops receiving once released by the caller
  std::shared_ptr<ProfileSubscription> subscribe();

  // Ends every subscription
  void close();

  [[nodiscard]] size_t nb_subscribers() const;

private:
  const size_t _subscriber_capacity;
  mutable std::mutex _mutex;
  ProfileSnapshotPtr _latest;
  uint64_t _sequence{0};
  bool _closed{false};
  std::vector<std::weak_ptr<ProfileSubscription>> _subscribers;
};

} // namespace beeprof
