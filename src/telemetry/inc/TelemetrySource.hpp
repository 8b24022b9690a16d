#ifndef KILN_TELEMETRY_TELEMETRY_SOURCE_HPP
#define KILN_TELEMETRY_TELEMETRY_SOURCE_HPP
/**
 * @file TelemetrySource.hpp
 * @brief Abstract device telemetry backend polled by the Resource Monitor.
 */

#include "src/telemetry/inc/ResourceSnapshot.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace kiln {

namespace telemetry {

/* ----------------------------- TelemetryError ----------------------------- */

enum class TelemetryError : std::uint8_t {
  None = 0,
  Unavailable, ///< Backend has no data source at all
  ReadFailed,  ///< A required attribute could not be read
  Timeout,     ///< Poll exceeded its deadline
};

/// @brief Lowercase name, e.g. "read_failed".
[[nodiscard]] const char* toString(TelemetryError error) noexcept;

/* ----------------------------- TelemetryResult ----------------------------- */

/**
 * @brief Result of one poll: a reading or an error.
 */
struct TelemetryResult {
  bool ok{false};
  RawReading reading{};
  TelemetryError error{TelemetryError::None};
  std::string message{};

  explicit operator bool() const noexcept { return ok; }

  [[nodiscard]] static TelemetryResult success(const RawReading& reading) {
    TelemetryResult result{};
    result.ok = true;
    result.reading = reading;
    return result;
  }

  [[nodiscard]] static TelemetryResult failure(TelemetryError error, std::string message) {
    TelemetryResult result{};
    result.error = error;
    result.message = std::move(message);
    return result;
  }
};

/* ----------------------------- TelemetrySource ----------------------------- */

/**
 * @brief Device telemetry backend.
 *
 * poll() is called from the monitor thread each tick and from short-lived
 * helper threads for forced polls, so it must be safe to call concurrently.
 * It may block (faulty drivers); callers bound the wait themselves.
 */
class TelemetrySource {
public:
  virtual ~TelemetrySource() = default;

  [[nodiscard]] virtual TelemetryResult poll() = 0;
};

} // namespace telemetry

} // namespace kiln

#endif // KILN_TELEMETRY_TELEMETRY_SOURCE_HPP
