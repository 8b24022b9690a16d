#ifndef KILN_HELPERS_ARGS_HPP
#define KILN_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line option parsing for the kiln tools.
 *
 * Options are long flags, either switches ("--json") or flags taking exactly
 * one value ("--interval 500" or "--interval=500"). Unknown options and stray
 * positional tokens are errors.
 *
 * @note Cold-path: allocates.
 */

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include <fmt/core.h>

namespace kiln {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

struct ArgDef {
  std::string_view flag;    ///< e.g. "--interval"
  std::string_view value{}; ///< Value placeholder, e.g. "<ms>"; empty for a switch
  bool required{false};
  std::string_view desc{};

  [[nodiscard]] bool takesValue() const noexcept { return !value.empty(); }
};

/// Definitions by key; usage lists them in key order.
using ArgMap = std::map<std::uint8_t, ArgDef>;

/// Parsed options by key. Switches map to an empty view.
using ParsedArgs = std::unordered_map<std::uint8_t, std::string_view>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse @p args against @p map into @p pargs.
 * @param args Tokens after the program name; must outlive @p pargs.
 * @return Error message, or std::nullopt on success. A repeated option keeps
 *         its last value.
 */
[[nodiscard]] inline std::optional<std::string>
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, KEY);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view tok = args[i];
    std::optional<std::string_view> inlineValue;
    if (const std::size_t EQ = tok.find('='); tok.starts_with("--") && EQ != std::string_view::npos) {
      inlineValue = tok.substr(EQ + 1);
      tok = tok.substr(0, EQ);
    }

    const auto IT = byFlag.find(tok);
    if (IT == byFlag.end()) {
      if (tok.starts_with("-")) {
        return fmt::format("unknown option '{}'", tok);
      }
      return fmt::format("unexpected argument '{}'", tok);
    }

    const ArgDef& DEF = map.at(IT->second);
    if (!DEF.takesValue()) {
      if (inlineValue) {
        return fmt::format("option '{}' takes no value", DEF.flag);
      }
      pargs[IT->second] = std::string_view{};
      continue;
    }

    if (inlineValue) {
      pargs[IT->second] = *inlineValue;
      continue;
    }
    if (i + 1 >= args.size() || args[i + 1].starts_with("--")) {
      return fmt::format("option '{}' expects {}", DEF.flag, DEF.value);
    }
    pargs[IT->second] = args[++i];
  }

  for (const auto& [KEY, DEF] : map) {
    if (DEF.required && pargs.count(KEY) == 0) {
      return fmt::format("missing required option '{}'", DEF.flag);
    }
  }
  return std::nullopt;
}

/* ----------------------------- Typed Accessors ----------------------------- */

[[nodiscard]] inline bool hasFlag(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.count(key) != 0;
}

[[nodiscard]] inline std::string stringValue(const ParsedArgs& pargs, std::uint8_t key,
                                             std::string_view defaultVal) {
  const auto IT = pargs.find(key);
  return std::string(IT == pargs.end() ? defaultVal : IT->second);
}

/// Value of @p key as an integer; @p defaultVal when absent or malformed.
[[nodiscard]] inline long long intValue(const ParsedArgs& pargs, std::uint8_t key,
                                        long long defaultVal) noexcept {
  const auto IT = pargs.find(key);
  if (IT == pargs.end()) {
    return defaultVal;
  }
  const std::string_view TOKEN = IT->second;
  long long value = 0;
  const auto [PTR, EC] = std::from_chars(TOKEN.data(), TOKEN.data() + TOKEN.size(), value);
  if (EC != std::errc{} || PTR != TOKEN.data() + TOKEN.size()) {
    return defaultVal;
  }
  return value;
}

/// Value of @p key as a double; @p defaultVal when absent or malformed.
[[nodiscard]] inline double doubleValue(const ParsedArgs& pargs, std::uint8_t key,
                                        double defaultVal) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return defaultVal;
  }
  const std::string TOKEN(IT->second);
  char* end = nullptr;
  const double VAL = std::strtod(TOKEN.c_str(), &end);
  if (*end != '\0') {
    return defaultVal;
  }
  return VAL;
}

/* ----------------------------- Usage ----------------------------- */

/// Print "Usage: ...", @p description and one aligned line per option.
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  std::size_t width = 16;
  for (const auto& [KEY, DEF] : map) {
    const std::size_t W = DEF.flag.size() + (DEF.takesValue() ? DEF.value.size() + 1 : 0);
    width = (W > width) ? W : width;
  }

  fmt::print("Options:\n");
  for (const auto& [KEY, DEF] : map) {
    const std::string LEFT = DEF.takesValue() ? fmt::format("{} {}", DEF.flag, DEF.value)
                                              : std::string(DEF.flag);
    fmt::print("  {:<{}}  {}{}\n", LEFT, width, DEF.desc, DEF.required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_ARGS_HPP
