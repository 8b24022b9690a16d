/**
 * @file ConversionStats_uTest.cpp
 * @brief Unit tests for kiln::coordinator::ConversionStats.
 */

#include "src/coordinator/inc/ConversionStats.hpp"

#include <gtest/gtest.h>

#include <string>

using kiln::coordinator::ConversionStats;

/** @test Empty stats yield zero rates. */
TEST(ConversionStatsTest, EmptyIsZero) {
  const ConversionStats STATS{};
  EXPECT_DOUBLE_EQ(STATS.successRate(), 0.0);
  EXPECT_DOUBLE_EQ(STATS.averageProcessingSeconds(), 0.0);
}

/** @test Rates count only finished jobs; rejections are excluded. */
TEST(ConversionStatsTest, Rates) {
  ConversionStats stats{};
  stats.submitted = 5;
  stats.completed = 3;
  stats.failed = 1;
  stats.cancelled = 1;
  stats.rejected = 4;
  stats.retried = 2;
  stats.totalProcessingSeconds = 90.0;

  EXPECT_DOUBLE_EQ(stats.successRate(), 0.6);
  EXPECT_DOUBLE_EQ(stats.averageProcessingSeconds(), 30.0);

  const std::string OUT = stats.toString();
  EXPECT_NE(OUT.find("5 submitted"), std::string::npos);
  EXPECT_NE(OUT.find("4 rejected"), std::string::npos);
  EXPECT_NE(OUT.find("2 retried"), std::string::npos);
  EXPECT_NE(OUT.find("60%"), std::string::npos);
  EXPECT_NE(OUT.find("30s"), std::string::npos);
}
