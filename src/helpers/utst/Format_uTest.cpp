/**
 * @file Format_uTest.cpp
 * @brief Unit tests for kiln::helpers::format.
 */

#include "src/helpers/inc/Format.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace kiln::helpers::format;

/** @test Byte counts pick the largest whole binary unit. */
TEST(FormatTest, BytesBinary) {
  EXPECT_EQ(bytesBinary(0), "0 B");
  EXPECT_EQ(bytesBinary(512), "512 B");
  EXPECT_EQ(bytesBinary(1536), "1.5 KiB");
  EXPECT_EQ(bytesBinary(500ULL * 1024 * 1024), "500.0 MiB");
  EXPECT_EQ(bytesBinary(3ULL * 1024 * 1024 * 1024), "3.0 GiB");
}

/** @test Durations round to whole seconds. */
TEST(FormatTest, Duration) {
  EXPECT_EQ(duration(-5.0), "0s");
  EXPECT_EQ(duration(6.4), "6s");
  EXPECT_EQ(duration(245.0), "4m 05s");
  EXPECT_EQ(duration(3723.0), "1h 02m 03s");
}

/** @test Epoch renders as UTC with milliseconds. */
TEST(FormatTest, IsoTime) {
  const std::chrono::system_clock::time_point TP{std::chrono::milliseconds(1234)};
  EXPECT_EQ(isoTime(TP), "1970-01-01T00:00:01.234Z");
}

/** @test JSON strings are quoted and escaped. */
TEST(FormatTest, JsonString) {
  EXPECT_EQ(jsonString(""), "\"\"");
  EXPECT_EQ(jsonString("plain"), "\"plain\"");
  EXPECT_EQ(jsonString("a\"b\\c"), "\"a\\\"b\\\\c\"");
  EXPECT_EQ(jsonString("line\nnext\ttab"), "\"line\\nnext\\ttab\"");
  EXPECT_EQ(jsonString(std::string("\x01", 1)), "\"\\u0001\"");
}
