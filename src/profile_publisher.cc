// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profile_publisher.hpp"

#include "beeprof_stats.hpp"
#include "logger.hpp"

#include <algorithm>

namespace beeprof {

ProfilePublisher::ProfilePublisher(size_t subscriber_capacity)
    : _subscriber_capacity(subscriber_capacity ? subscriber_capacity : 1) {}

ProfilePublisher::~ProfilePublisher() { close(); }

void ProfilePublisher::publish(const FoldedProfile &profile, bool final) {
  auto snapshot = std::make_shared<ProfileSnapshot>();
  snapshot->timestamp = std::chrono::system_clock::now();
  snapshot->final = final;
  snapshot->profile = profile;

  std::vector<std::shared_ptr<ProfileSubscription>> subscribers;
  {
    std::lock_guard const lock{_mutex};
    if (_closed) {
      return;
    }
    snapshot->sequence = ++_sequence;
    _latest = snapshot;
    std::erase_if(_subscribers, [&subscribers](const auto &weak) {
      auto subscriber = weak.lock();
      if (!subscriber) {
        return true;
      }
      subscribers.push_back(std::move(subscriber));
      return false;
    });
  }
  // pushes never block: a full queue drops its oldest snapshot
  for (const auto &subscriber : subscribers) {
    if (subscriber->_channel.push(snapshot) == PushResult::kDroppedOldest) {
      beeprof_stats_add(STATS_SUBSCRIBER_DROPS, 1, nullptr);
    }
  }
}

ProfileSnapshotPtr ProfilePublisher::get_latest_snapshot() const {
  std::lock_guard const lock{_mutex};
  return _latest;
}

std::shared_ptr<ProfileSubscription> ProfilePublisher::subscribe() {
  auto subscription =
      std::make_shared<ProfileSubscription>(_subscriber_capacity);
  std::lock_guard const lock{_mutex};
  if (_closed) {
    subscription->_channel.close();
  } else {
    _subscribers.push_back(subscription);
  }
  return subscription;
}

void ProfilePublisher::close() {
  std::vector<std::weak_ptr<ProfileSubscription>> subscribers;
  uint64_t nb_published;
  {
    std::lock_guard const lock{_mutex};
    if (_closed) {
      return;
    }
    _closed = true;
    nb_published = _sequence;
    subscribers.swap(_subscribers);
  }
  for (const auto &weak : subscribers) {
    if (auto subscriber = weak.lock()) {
      subscriber->_channel.close();
    }
  }
  LG_DBG("Profile publisher closed after %lu snapshot(s)", nb_published);
}

size_t ProfilePublisher::nb_subscribers() const {
  std::lock_guard const lock{_mutex};
  return std::count_if(_subscribers.begin(), _subscribers.end(),
                       [](const auto &weak) { return !weak.expired(); });
}

} // namespace beeprof
