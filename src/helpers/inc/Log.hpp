#ifndef KILN_HELPERS_LOG_HPP
#define KILN_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief spdlog setup shared by the CLI tools.
 *
 * Library code logs through the spdlog default logger with a "[component]"
 * prefix; only executables decide sink and level.
 */

#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace kiln {
namespace helpers {
namespace log {

/**
 * @brief Map a level name ("trace".."off") to a spdlog level.
 * @param name Level name; unknown names map to info.
 */
[[nodiscard]] inline spdlog::level::level_enum parseLevel(std::string_view name) noexcept {
  const spdlog::level::level_enum LEVEL = spdlog::level::from_str(std::string(name));
  // from_str() answers "off" for names it does not know
  if (LEVEL == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return LEVEL;
}

/**
 * @brief Install a stderr color logger as the spdlog default.
 * @param level Level name accepted by parseLevel().
 *
 * Diagnostics go to stderr so --json output on stdout stays parseable.
 */
inline void init(std::string_view level) {
  auto logger = spdlog::stderr_color_mt("kiln");
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%-5l%$ %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(parseLevel(level));
}

} // namespace log
} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_LOG_HPP
