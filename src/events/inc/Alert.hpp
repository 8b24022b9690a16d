#ifndef KILN_EVENTS_ALERT_HPP
#define KILN_EVENTS_ALERT_HPP
/**
 * @file Alert.hpp
 * @brief Alert records and the bounded alert log.
 * @note AlertLog is thread-safe; the monitor thread and the coordinator
 *       dispatcher both append.
 */

#include "src/common/inc/Clock.hpp"
#include "src/common/inc/Status.hpp"
#include "src/helpers/inc/RingBuffer.hpp"

#include <atomic>   // std::atomic
#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint64_t, std::uint8_t
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace kiln {

namespace events {

/* ----------------------------- Enums ----------------------------- */

/// Ordered: Info < Warning < Error < Critical.
enum class AlertSeverity : std::uint8_t {
  Info = 0,
  Warning,
  Error,
  Critical,
};

/// Resource or subsystem an alert is about.
enum class AlertKind : std::uint8_t {
  Thermal = 0,
  Battery,
  Storage,
  Memory,
  Monitoring,
  Engine,
};

[[nodiscard]] const char* toString(AlertSeverity severity) noexcept;
[[nodiscard]] const char* toString(AlertKind kind) noexcept;

/* ----------------------------- Alert ----------------------------- */

using AlertId = std::uint64_t;

struct Alert {
  AlertId id{0};                              ///< Assigned by AlertLog::append
  AlertSeverity severity{AlertSeverity::Info};
  AlertKind kind{AlertKind::Monitoring};
  std::string message{};
  std::uint64_t snapshotSequence{0};          ///< Snapshot that triggered it, 0 if none
  WallTime createdAt{};
  std::optional<WallTime> acknowledgedAt{};   ///< Set at most once

  [[nodiscard]] bool acknowledged() const noexcept { return acknowledgedAt.has_value(); }

  /// @brief e.g. "[warning] battery: battery 12% below minimum 15%".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- AlertLog ----------------------------- */

/**
 * @brief Append-only alert history capped at a retention size.
 *
 * The oldest alert is evicted once the log is full. Acknowledgement is the
 * only mutation an alert ever sees.
 */
class AlertLog {
public:
  explicit AlertLog(std::size_t retention);

  /**
   * @brief Store an alert, assigning its id (and createdAt if unset).
   * @return The stored copy.
   */
  Alert append(Alert alert);

  /// @brief Newest @p limit alerts, newest first.
  [[nodiscard]] std::vector<Alert> latest(std::size_t limit) const;

  /// @brief Retained alerts not yet acknowledged, newest first.
  [[nodiscard]] std::vector<Alert> active() const;

  [[nodiscard]] std::optional<Alert> find(AlertId id) const;

  /**
   * @brief Mark an alert acknowledged.
   * @return NotFound if @p id is not retained. Acknowledging twice succeeds
   *         and keeps the first timestamp.
   */
  Status acknowledge(AlertId id, WallTime now);

  [[nodiscard]] std::size_t size() const { return ring_.size(); }
  [[nodiscard]] std::size_t retention() const noexcept { return ring_.capacity(); }

private:
  std::atomic<AlertId> nextId_{1};
  helpers::RingBuffer<Alert> ring_;
};

} // namespace events

} // namespace kiln

#endif // KILN_EVENTS_ALERT_HPP
