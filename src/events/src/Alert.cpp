/**
 * @file Alert.cpp
 * @brief Alert names and AlertLog.
 */

#include "src/events/inc/Alert.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace kiln {

namespace events {

/* ----------------------------- Names ----------------------------- */

const char* toString(AlertSeverity severity) noexcept {
  switch (severity) {
  case AlertSeverity::Info:
    return "info";
  case AlertSeverity::Warning:
    return "warning";
  case AlertSeverity::Error:
    return "error";
  case AlertSeverity::Critical:
    return "critical";
  }
  return "unknown";
}

const char* toString(AlertKind kind) noexcept {
  switch (kind) {
  case AlertKind::Thermal:
    return "thermal";
  case AlertKind::Battery:
    return "battery";
  case AlertKind::Storage:
    return "storage";
  case AlertKind::Memory:
    return "memory";
  case AlertKind::Monitoring:
    return "monitoring";
  case AlertKind::Engine:
    return "engine";
  }
  return "unknown";
}

std::string Alert::toString() const {
  return fmt::format("[{}] {}: {}{}", events::toString(severity), events::toString(kind), message,
                     acknowledged() ? " (ack)" : "");
}

/* ----------------------------- AlertLog ----------------------------- */

AlertLog::AlertLog(std::size_t retention) : ring_(retention) {}

Alert AlertLog::append(Alert alert) {
  alert.id = nextId_.fetch_add(1);
  if (alert.createdAt == WallTime{}) {
    alert.createdAt = WallClock::now();
  }
  alert.acknowledgedAt.reset();
  ring_.push(alert);
  return alert;
}

std::vector<Alert> AlertLog::latest(std::size_t limit) const { return ring_.latest(limit); }

std::vector<Alert> AlertLog::active() const {
  std::vector<Alert> out;
  for (Alert& alert : ring_.latest(ring_.capacity())) {
    if (!alert.acknowledged()) {
      out.push_back(std::move(alert));
    }
  }
  return out;
}

std::optional<Alert> AlertLog::find(AlertId id) const {
  return ring_.findIf([id](const Alert& alert) { return alert.id == id; });
}

Status AlertLog::acknowledge(AlertId id, WallTime now) {
  if (id == 0) {
    return Status::failure(ErrorCode::NotFound, "alert 0 does not exist");
  }
  const bool FOUND = ring_.updateIf([id](const Alert& alert) { return alert.id == id; },
                                    [now](Alert& alert) {
                                      if (!alert.acknowledgedAt) {
                                        alert.acknowledgedAt = now;
                                      }
                                    });
  if (!FOUND) {
    return Status::failure(ErrorCode::NotFound, fmt::format("alert {} not retained", id));
  }
  return Status::success();
}

} // namespace events

} // namespace kiln
