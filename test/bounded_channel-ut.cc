// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "bounded_channel.hpp"

#include <gtest/gtest.h>
#include <thread>

namespace beeprof {

TEST(BoundedChannel, fifo) {
  BoundedChannel<int> channel(4, OverflowPolicy::kBlock);
  EXPECT_EQ(channel.push(1), PushResult::kPushed);
  EXPECT_EQ(channel.push(2), PushResult::kPushed);
  EXPECT_EQ(channel.size(), 2);
  EXPECT_EQ(channel.pop(), 1);
  EXPECT_EQ(channel.pop(), 2);
  EXPECT_FALSE(channel.try_pop());
}

TEST(BoundedChannel, drop_oldest) {
  BoundedChannel<int> channel(2, OverflowPolicy::kDropOldest);
  std::optional<int> dropped;
  EXPECT_EQ(channel.push(1, &dropped), PushResult::kPushed);
  EXPECT_EQ(channel.push(2, &dropped), PushResult::kPushed);
  EXPECT_FALSE(dropped);
  EXPECT_EQ(channel.push(3, &dropped), PushResult::kDroppedOldest);
  EXPECT_EQ(dropped, 1);
  EXPECT_EQ(channel.push(4), PushResult::kDroppedOldest);
  // the queue never grows past its capacity
  EXPECT_EQ(channel.size(), 2);
  EXPECT_EQ(channel.nb_dropped(), 2);
  EXPECT_EQ(channel.pop(), 3);
  EXPECT_EQ(channel.pop(), 4);
}

TEST(BoundedChannel, block_until_room) {
  BoundedChannel<int> channel(1, OverflowPolicy::kBlock);
  EXPECT_EQ(channel.push(1), PushResult::kPushed);
  std::thread producer([&channel] {
    // waits for the consumer
    EXPECT_EQ(channel.push(2), PushResult::kPushed);
  });
  EXPECT_EQ(channel.pop(), 1);
  EXPECT_EQ(channel.pop(), 2);
  producer.join();
  EXPECT_EQ(channel.nb_dropped(), 0);
}

TEST(BoundedChannel, close) {
  BoundedChannel<int> channel(1, OverflowPolicy::kBlock);
  EXPECT_EQ(channel.push(1), PushResult::kPushed);
  std::thread producer(
      [&channel] { EXPECT_EQ(channel.push(2), PushResult::kClosed); });
  // let the producer block on the full queue
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.close();
  producer.join();
  EXPECT_TRUE(channel.closed());
  // queued elements survive the close
  EXPECT_EQ(channel.pop(), 1);
  EXPECT_FALSE(channel.pop());
  EXPECT_EQ(channel.push(3), PushResult::kClosed);
}

TEST(BoundedChannel, pop_timeout) {
  BoundedChannel<int> channel(1, OverflowPolicy::kDropOldest);
  EXPECT_FALSE(channel.pop_for(std::chrono::milliseconds(1)));
  channel.push(5);
  EXPECT_EQ(channel.pop_for(std::chrono::milliseconds(1)), 5);
}

} // namespace beeprof
