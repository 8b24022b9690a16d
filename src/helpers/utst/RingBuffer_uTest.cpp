/**
 * @file RingBuffer_uTest.cpp
 * @brief Unit tests for kiln::helpers::RingBuffer.
 */

#include "src/helpers/inc/RingBuffer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using kiln::helpers::RingBuffer;

/** @test Oldest entries are evicted once full; latest() is newest first. */
TEST(RingBufferTest, EvictsOldest) {
  RingBuffer<int> ring(3);
  for (int i = 1; i <= 5; ++i) {
    ring.push(i);
  }
  EXPECT_EQ(ring.size(), 3U);
  EXPECT_EQ(ring.capacity(), 3U);
  EXPECT_EQ(ring.latest(10), (std::vector<int>{5, 4, 3}));
  EXPECT_EQ(ring.latest(2), (std::vector<int>{5, 4}));
  EXPECT_TRUE(ring.latest(0).empty());
}

/** @test Zero capacity behaves as one. */
TEST(RingBufferTest, ZeroCapacityHoldsOne) {
  RingBuffer<int> ring(0);
  ring.push(1);
  ring.push(2);
  EXPECT_EQ(ring.capacity(), 1U);
  ASSERT_TRUE(ring.newest().has_value());
  EXPECT_EQ(*ring.newest(), 2);
}

/** @test findIf searches newest first; updateIf mutates in place. */
TEST(RingBufferTest, FindAndUpdate) {
  RingBuffer<std::string> ring(4);
  ring.push("alpha");
  ring.push("beta");
  ring.push("alps");

  const auto FOUND = ring.findIf([](const std::string& s) { return s.rfind("al", 0) == 0; });
  ASSERT_TRUE(FOUND.has_value());
  EXPECT_EQ(*FOUND, "alps");
  EXPECT_FALSE(ring.findIf([](const std::string& s) { return s == "gamma"; }).has_value());

  EXPECT_TRUE(ring.updateIf([](const std::string& s) { return s == "beta"; },
                            [](std::string& s) { s = "BETA"; }));
  EXPECT_EQ(ring.latest(3)[1], "BETA");
  EXPECT_FALSE(ring.updateIf([](const std::string&) { return false; }, [](std::string&) {}));
}

/** @test clear() empties the buffer. */
TEST(RingBufferTest, Clear) {
  RingBuffer<int> ring(2);
  ring.push(1);
  ring.clear();
  EXPECT_EQ(ring.size(), 0U);
  EXPECT_FALSE(ring.newest().has_value());
  ring.push(7);
  EXPECT_EQ(ring.latest(5), (std::vector<int>{7}));
}

/** @test Concurrent writers never exceed capacity. */
TEST(RingBufferTest, ConcurrentPush) {
  RingBuffer<int> ring(64);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&ring, t] {
      for (int i = 0; i < 500; ++i) {
        ring.push(t * 1000 + i);
      }
    });
  }
  for (auto& w : writers) {
    w.join();
  }
  EXPECT_EQ(ring.size(), 64U);
}
