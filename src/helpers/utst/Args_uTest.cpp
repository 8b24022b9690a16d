/**
 * @file Args_uTest.cpp
 * @brief Unit tests for kiln::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace args = kiln::helpers::args;

namespace {

enum Key : std::uint8_t { KEY_JSON = 0, KEY_INTERVAL = 1, KEY_INPUT = 2, KEY_FACTOR = 3 };

args::ArgMap testMap() {
  args::ArgMap map;
  map[KEY_JSON] = {"--json", {}, false, "JSON output"};
  map[KEY_INTERVAL] = {"--interval", "<ms>", false, "Poll interval"};
  map[KEY_INPUT] = {"--input", "<file>", true, "Source file"};
  map[KEY_FACTOR] = {"--safety-factor", "<x>", false, "Headroom"};
  return map;
}

std::optional<std::string> parse(std::vector<std::string_view> tokens, args::ParsedArgs& out) {
  return args::parseArgs(tokens, testMap(), out);
}

} // namespace

/** @test Switches and valued flags, in both spellings. */
TEST(ArgsTest, ParsesSwitchesAndValues) {
  args::ParsedArgs pargs;
  ASSERT_FALSE(parse({"--input", "a.mov", "--json", "--interval=750"}, pargs).has_value());
  EXPECT_TRUE(args::hasFlag(pargs, KEY_JSON));
  EXPECT_EQ(args::stringValue(pargs, KEY_INPUT, ""), "a.mov");
  EXPECT_EQ(args::intValue(pargs, KEY_INTERVAL, 0), 750);
  EXPECT_DOUBLE_EQ(args::doubleValue(pargs, KEY_FACTOR, 1.2), 1.2);
}

/** @test Unknown options, stray tokens and missing values are reported. */
TEST(ArgsTest, RejectsBadInput) {
  args::ParsedArgs pargs;
  EXPECT_EQ(parse({"--input", "a", "--verbose"}, pargs).value_or(""),
            "unknown option '--verbose'");
  EXPECT_EQ(parse({"--input", "a", "extra"}, pargs).value_or(""), "unexpected argument 'extra'");
  EXPECT_EQ(parse({"--input", "a", "--interval"}, pargs).value_or(""),
            "option '--interval' expects <ms>");
  EXPECT_EQ(parse({"--interval", "--input", "a"}, pargs).value_or(""),
            "option '--interval' expects <ms>");
  EXPECT_EQ(parse({"--input", "a", "--json=yes"}, pargs).value_or(""),
            "option '--json' takes no value");
}

/** @test A missing required option is an error; no arguments at all are not. */
TEST(ArgsTest, RequiredOptions) {
  args::ParsedArgs pargs;
  EXPECT_EQ(parse({"--json"}, pargs).value_or(""), "missing required option '--input'");

  args::ArgMap optional = testMap();
  optional[KEY_INPUT].required = false;
  args::ParsedArgs empty;
  EXPECT_FALSE(args::parseArgs({}, optional, empty).has_value());
  EXPECT_TRUE(empty.empty());
}

/** @test Malformed numbers fall back to the default. */
TEST(ArgsTest, MalformedNumbersUseDefault) {
  args::ParsedArgs pargs;
  ASSERT_FALSE(
      parse({"--input", "a", "--interval", "5s", "--safety-factor", "x"}, pargs).has_value());
  EXPECT_EQ(args::intValue(pargs, KEY_INTERVAL, 5000), 5000);
  EXPECT_DOUBLE_EQ(args::doubleValue(pargs, KEY_FACTOR, 1.2), 1.2);

  ASSERT_FALSE(parse({"--input", "a", "--interval", "-20"}, pargs).has_value());
  EXPECT_EQ(args::intValue(pargs, KEY_INTERVAL, 5000), -20);
}
