/**
 * @file DeviceHealth.cpp
 * @brief Snapshot health grading.
 */

#include "src/policy/inc/DeviceHealth.hpp"
#include "src/helpers/inc/Format.hpp"

#include <initializer_list> // std::initializer_list

#include <fmt/core.h>

namespace kiln {

namespace policy {

using kiln::helpers::format::bytesBinary;
using kiln::telemetry::ThermalState;

namespace {

constexpr int PENALTY_FAIR = 10;
constexpr int PENALTY_POOR = 25;
constexpr int PENALTY_CRITICAL = 50;

inline HealthGrade gradeAvailable(std::uint64_t available, std::uint64_t minimum) noexcept {
  if (available < minimum) {
    return HealthGrade::Critical;
  }
  if (available < minimum * 2) {
    return HealthGrade::Poor;
  }
  if (available < minimum * 4) {
    return HealthGrade::Fair;
  }
  return HealthGrade::Good;
}

inline int penalty(HealthGrade grade) noexcept {
  switch (grade) {
  case HealthGrade::Good:
    return 0;
  case HealthGrade::Fair:
    return PENALTY_FAIR;
  case HealthGrade::Poor:
    return PENALTY_POOR;
  case HealthGrade::Critical:
    return PENALTY_CRITICAL;
  }
  return 0;
}

} // namespace

const char* toString(HealthGrade grade) noexcept {
  switch (grade) {
  case HealthGrade::Good:
    return "good";
  case HealthGrade::Fair:
    return "fair";
  case HealthGrade::Poor:
    return "poor";
  case HealthGrade::Critical:
    return "critical";
  }
  return "unknown";
}

std::string DeviceHealth::toString() const {
  return fmt::format("{} (score {}) thermal={} battery={} memory={} storage={}",
                     policy::toString(overall), score, policy::toString(thermal),
                     policy::toString(battery), policy::toString(memory),
                     policy::toString(storage));
}

DeviceHealth assessHealth(const telemetry::ResourceSnapshot& snapshot,
                          const PolicyConfig& config) {
  DeviceHealth health{};

  // --- Thermal ---
  if (snapshot.thermalState >= ThermalState::Critical) {
    health.thermal = HealthGrade::Critical;
  } else if (snapshot.thermalState == ThermalState::Serious) {
    health.thermal = HealthGrade::Poor;
  } else if (snapshot.thermalState == ThermalState::Fair) {
    health.thermal = HealthGrade::Fair;
  }
  if (health.thermal != HealthGrade::Good) {
    health.issues.push_back(fmt::format("device is {} ({:.1f} C)",
                                        telemetry::toString(snapshot.thermalState),
                                        snapshot.maxTemperatureCelsius));
  }

  // --- Battery ---
  if (!snapshot.isCharging) {
    const double LEVEL = snapshot.batteryLevel;
    if (LEVEL < config.batteryMinimum) {
      health.battery = HealthGrade::Critical;
    } else if (LEVEL < config.batteryMinimum * 2.0) {
      health.battery = HealthGrade::Poor;
    } else if (LEVEL < 0.5) {
      health.battery = HealthGrade::Fair;
    }
    if (health.battery != HealthGrade::Good) {
      health.issues.push_back(fmt::format("battery at {:.0f}% and discharging", LEVEL * 100.0));
    }
  }

  // --- Memory / Storage ---
  health.memory = gradeAvailable(snapshot.availableMemoryBytes, config.memoryMinimumBytes);
  if (health.memory != HealthGrade::Good) {
    health.issues.push_back(
        fmt::format("{} memory available", bytesBinary(snapshot.availableMemoryBytes)));
  }
  health.storage = gradeAvailable(snapshot.availableStorageBytes, config.storageMinimumBytes);
  if (health.storage != HealthGrade::Good) {
    health.issues.push_back(
        fmt::format("{} storage free", bytesBinary(snapshot.availableStorageBytes)));
  }

  // --- Overall ---
  int score = 100;
  for (HealthGrade grade : {health.thermal, health.battery, health.memory, health.storage}) {
    if (grade > health.overall) {
      health.overall = grade;
    }
    score -= penalty(grade);
  }
  health.score = score < 0 ? 0 : score;
  return health;
}

} // namespace policy

} // namespace kiln
