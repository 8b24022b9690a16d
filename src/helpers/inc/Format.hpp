#ifndef KILN_HELPERS_FORMAT_HPP
#define KILN_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for bytes, durations and timestamps.
 *
 * Shared by toString() implementations, the JSON history export and the
 * CLI tools. Uses fmt library for string formatting.
 *
 * @note All functions return std::string (heap allocation). Cold paths only.
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/format.h>

namespace kiln {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

/**
 * @brief Format a duration in seconds as "1h 02m 03s" / "4m 05s" / "6s".
 * @param seconds Duration; negative values render as "0s".
 */
[[nodiscard]] inline std::string duration(double seconds) {
  if (!(seconds > 0.0)) {
    return "0s";
  }
  const auto TOTAL = static_cast<std::uint64_t>(seconds + 0.5);
  const std::uint64_t H = TOTAL / 3600;
  const std::uint64_t M = (TOTAL % 3600) / 60;
  const std::uint64_t S = TOTAL % 60;

  if (H > 0) {
    return fmt::format("{}h {:02}m {:02}s", H, M, S);
  }
  if (M > 0) {
    return fmt::format("{}m {:02}s", M, S);
  }
  return fmt::format("{}s", S);
}

/**
 * @brief Format a wall-clock time point as UTC ISO-8601 with milliseconds.
 * @param tp Time point.
 * @return e.g. "2026-03-01T12:04:05.123Z".
 */
[[nodiscard]] inline std::string isoTime(std::chrono::system_clock::time_point tp) {
  const std::time_t T = std::chrono::system_clock::to_time_t(tp);
  const auto MS = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()) %
                  1000;
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(T),
                     static_cast<long long>(MS.count() < 0 ? MS.count() + 1000 : MS.count()));
}

/**
 * @brief Quote and escape @p text as a JSON string literal.
 * @param text UTF-8 input; control characters become \u00XX escapes.
 */
[[nodiscard]] inline std::string jsonString(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (const char C : text) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(C)));
      } else {
        out.push_back(C);
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace format
} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_FORMAT_HPP
