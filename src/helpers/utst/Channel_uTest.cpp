/**
 * @file Channel_uTest.cpp
 * @brief Unit tests for kiln::helpers::Channel.
 */

#include "src/helpers/inc/Channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using kiln::helpers::Channel;

using namespace std::chrono_literals;

/** @test Values come out in push order. */
TEST(ChannelTest, Fifo) {
  Channel<int> ch(8);
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(ch.push(i));
  }
  EXPECT_EQ(ch.size(), 5U);
  for (int i = 0; i < 5; ++i) {
    const auto V = ch.popFor(10ms);
    ASSERT_TRUE(V.has_value());
    EXPECT_EQ(*V, i);
  }
}

/** @test popFor times out on an empty channel. */
TEST(ChannelTest, PopTimesOut) {
  Channel<int> ch(1);
  const auto START = std::chrono::steady_clock::now();
  EXPECT_FALSE(ch.popFor(20ms).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - START, 15ms);
}

/** @test Closing rejects pushes but queued values still drain. */
TEST(ChannelTest, CloseDrains) {
  Channel<int> ch(4);
  ASSERT_TRUE(ch.push(1));
  ch.close();
  EXPECT_TRUE(ch.closed());
  EXPECT_FALSE(ch.push(2));
  const auto V = ch.popFor(10ms);
  ASSERT_TRUE(V.has_value());
  EXPECT_EQ(*V, 1);
  EXPECT_FALSE(ch.popFor(10ms).has_value());
}

/** @test A full channel blocks the producer until a slot frees. */
TEST(ChannelTest, FullBlocksProducer) {
  Channel<int> ch(1);
  ASSERT_TRUE(ch.push(1));

  std::atomic<bool> pushed{false};
  std::thread producer([&] {
    pushed = ch.push(2);
  });
  std::this_thread::sleep_for(30ms);
  EXPECT_FALSE(pushed.load());

  EXPECT_EQ(*ch.popFor(10ms), 1);
  producer.join();
  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(*ch.popFor(10ms), 2);
}

/** @test close() wakes a blocked producer. */
TEST(ChannelTest, CloseWakesProducer) {
  Channel<int> ch(1);
  ASSERT_TRUE(ch.push(1));
  std::atomic<int> result{-1};
  std::thread producer([&] { result = ch.push(2) ? 1 : 0; });
  std::this_thread::sleep_for(20ms);
  ch.close();
  producer.join();
  EXPECT_EQ(result.load(), 0);
}
