// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace beeprof {

enum class OverflowPolicy : uint8_t {
  kBlock,      // producer waits for room
  kDropOldest, // oldest queued element is discarded
};

enum class PushResult : uint8_t {
  kPushed,
  kDroppedOldest,
  kClosed,
};

// Multi-producer multi-consumer bounded queue
template <typename T> class BoundedChannel {
public:
  BoundedChannel(size_t capacity, OverflowPolicy policy)
      : _capacity(capacity ? capacity : 1), _policy(policy) {}

  BoundedChannel(const BoundedChannel &) = delete;
  BoundedChannel &operator=(const BoundedChannel &) = delete;

  // With kDropOldest, the discarded element is moved to `dropped` if provided
  PushResult push(T value, std::optional<T> *dropped = nullptr) {
    std::unique_lock lock{_mutex};
    if (_policy == OverflowPolicy::kBlock) {
      _not_full.wait(lock,
                     [this] { return _closed || _queue.size() < _capacity; });
    }
    if (_closed) {
      return PushResult::kClosed;
    }
    PushResult result = PushResult::kPushed;
    if (_queue.size() >= _capacity) {
      if (dropped) {
        *dropped = std::move(_queue.front());
      }
      _queue.pop_front();
      ++_nb_dropped;
      result = PushResult::kDroppedOldest;
    }
    _queue.push_back(std::move(value));
    lock.unlock();
    _not_empty.notify_one();
    return result;
  }

  // Waits for an element. Empty once the channel is closed and drained.
  std::optional<T> pop() {
    std::unique_lock lock{_mutex};
    _not_empty.wait(lock, [this] { return _closed || !_queue.empty(); });
    return pop_locked(lock);
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock{_mutex};
    _not_empty.wait_for(lock, timeout,
                        [this] { return _closed || !_queue.empty(); });
    return pop_locked(lock);
  }

  std::optional<T> try_pop() {
    std::unique_lock lock{_mutex};
    return pop_locked(lock);
  }

  // Wakes every waiter. Queued elements can still be popped.
  void close() {
    {
      std::lock_guard const lock{_mutex};
      _closed = true;
    }
    _not_empty.notify_all();
    _not_full.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard const lock{_mutex};
    return _closed;
  }
  [[nodiscard]] size_t size() const {
    std::lock_guard const lock{_mutex};
    return _queue.size();
  }
  [[nodiscard]] uint64_t nb_dropped() const {
    std::lock_guard const lock{_mutex};
    return _nb_dropped;
  }
  [[nodiscard]] size_t capacity() const { return _capacity; }

private:
  std::optional<T> pop_locked(std::unique_lock<std::mutex> &lock) {
    if (_queue.empty()) {
      return std::nullopt;
    }
    std::optional<T> value{std::move(_queue.front())};
    _queue.pop_front();
    lock.unlock();
    _not_full.notify_one();
    return value;
  }

  const size_t _capacity;
  const OverflowPolicy _policy;
  mutable std::mutex _mutex;
  std::condition_variable _not_empty;
  std::condition_variable _not_full;
  std::deque<T> _queue;
  uint64_t _nb_dropped{0};
  bool _closed{false};
};

} // namespace beeprof
