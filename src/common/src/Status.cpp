/**
 * @file Status.cpp
 * @brief ErrorCode names and Status rendering.
 */

#include "src/common/inc/Status.hpp"

#include <fmt/core.h>

namespace kiln {

const char* toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::ValidationError:
    return "validation_error";
  case ErrorCode::AlreadyRunning:
    return "already_running";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::EngineError:
    return "engine_error";
  case ErrorCode::TelemetryError:
    return "telemetry_error";
  case ErrorCode::TimeoutError:
    return "timeout_error";
  case ErrorCode::InvalidTransition:
    return "invalid_transition";
  }
  return "unknown";
}

std::string Status::toString() const {
  if (ok()) {
    return "ok";
  }
  return fmt::format("{}: {}", kiln::toString(code), message);
}

} // namespace kiln
