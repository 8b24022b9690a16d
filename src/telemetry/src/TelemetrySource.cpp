/**
 * @file TelemetrySource.cpp
 * @brief TelemetryError names.
 */

#include "src/telemetry/inc/TelemetrySource.hpp"

namespace kiln {

namespace telemetry {

const char* toString(TelemetryError error) noexcept {
  switch (error) {
  case TelemetryError::None:
    return "none";
  case TelemetryError::Unavailable:
    return "unavailable";
  case TelemetryError::ReadFailed:
    return "read_failed";
  case TelemetryError::Timeout:
    return "timeout";
  }
  return "unknown";
}

} // namespace telemetry

} // namespace kiln
