#ifndef KILN_COMMON_STATUS_HPP
#define KILN_COMMON_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Error taxonomy shared by every kiln public operation.
 * @note Public operations report failures through Status values; none throw.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace kiln {

/* ----------------------------- ErrorCode ----------------------------- */

/**
 * @brief Failure categories surfaced to callers.
 */
enum class ErrorCode : std::uint8_t {
  None = 0,
  ValidationError,   ///< Bad input path, unwritable output, insufficient space
  AlreadyRunning,    ///< Submit while a job is non-terminal
  NotFound,          ///< Job or alert id not known / not active
  EngineError,       ///< Codec engine failure (terminal for the job)
  TelemetryError,    ///< Telemetry read failure (transient)
  TimeoutError,      ///< Precheck, engine-stop or forced-poll timeout
  InvalidTransition, ///< State machine refused the transition
};

/// @brief Stable lowercase name, e.g. "already_running".
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Outcome of an operation: code plus human-readable message.
 */
struct Status {
  ErrorCode code{ErrorCode::None};
  std::string message{};

  [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::None; }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] static Status success() { return {}; }
  [[nodiscard]] static Status failure(ErrorCode code, std::string message) {
    return Status{code, std::move(message)};
  }

  /// @brief "ok" or "<code>: <message>".
  [[nodiscard]] std::string toString() const;
};

} // namespace kiln

#endif // KILN_COMMON_STATUS_HPP
