/**
 * @file Threshold.cpp
 * @brief Threshold evaluation helpers and defaults.
 */

#include "src/policy/inc/Threshold.hpp"

#include <fmt/core.h>

namespace kiln {

namespace policy {

using kiln::events::AlertKind;
using kiln::events::AlertSeverity;
using kiln::telemetry::ResourceSnapshot;

/* ----------------------------- Names ----------------------------- */

const char* toString(DecisionKind kind) noexcept {
  switch (kind) {
  case DecisionKind::Continue:
    return "continue";
  case DecisionKind::Throttle:
    return "throttle";
  case DecisionKind::Pause:
    return "pause";
  case DecisionKind::Abort:
    return "abort";
  case DecisionKind::Alert:
    return "alert";
  }
  return "unknown";
}

const char* toString(ThresholdKind kind) noexcept {
  switch (kind) {
  case ThresholdKind::ThermalCeiling:
    return "thermal_ceiling";
  case ThresholdKind::ThermalWarning:
    return "thermal_warning";
  case ThresholdKind::BatteryMinimum:
    return "battery_minimum";
  case ThresholdKind::StorageMinimum:
    return "storage_minimum";
  case ThresholdKind::MemoryMinimum:
    return "memory_minimum";
  }
  return "unknown";
}

const char* toString(Comparator comparator) noexcept {
  switch (comparator) {
  case Comparator::Less:
    return "<";
  case Comparator::LessEqual:
    return "<=";
  case Comparator::Greater:
    return ">";
  case Comparator::GreaterEqual:
    return ">=";
  case Comparator::Equal:
    return "==";
  }
  return "?";
}

/* ----------------------------- Evaluation Helpers ----------------------------- */

bool compare(double value, Comparator comparator, double limit) noexcept {
  switch (comparator) {
  case Comparator::Less:
    return value < limit;
  case Comparator::LessEqual:
    return value <= limit;
  case Comparator::Greater:
    return value > limit;
  case Comparator::GreaterEqual:
    return value >= limit;
  case Comparator::Equal:
    return value == limit;
  }
  return false;
}

AlertKind alertKindFor(ThresholdKind kind) noexcept {
  switch (kind) {
  case ThresholdKind::ThermalCeiling:
  case ThresholdKind::ThermalWarning:
    return AlertKind::Thermal;
  case ThresholdKind::BatteryMinimum:
    return AlertKind::Battery;
  case ThresholdKind::StorageMinimum:
    return AlertKind::Storage;
  case ThresholdKind::MemoryMinimum:
    return AlertKind::Memory;
  }
  return AlertKind::Monitoring;
}

double metricFor(ThresholdKind kind, const ResourceSnapshot& snapshot) noexcept {
  switch (kind) {
  case ThresholdKind::ThermalCeiling:
  case ThresholdKind::ThermalWarning:
    return static_cast<double>(static_cast<std::uint8_t>(snapshot.thermalState));
  case ThresholdKind::BatteryMinimum:
    return snapshot.batteryLevel;
  case ThresholdKind::StorageMinimum:
    return static_cast<double>(snapshot.availableStorageBytes);
  case ThresholdKind::MemoryMinimum:
    return static_cast<double>(snapshot.availableMemoryBytes);
  }
  return 0.0;
}

/* ----------------------------- Threshold ----------------------------- */

bool Threshold::triggeredBy(const ResourceSnapshot& snapshot) const noexcept {
  if (kind == ThresholdKind::BatteryMinimum && snapshot.isCharging) {
    return false;
  }
  return compare(metricFor(kind, snapshot), comparator, limit);
}

std::string Threshold::toString() const {
  return fmt::format("{}: value {} {} -> {} ({})", policy::toString(kind),
                     policy::toString(comparator), limit, policy::toString(decision),
                     events::toString(severity));
}

std::vector<Threshold> defaultThresholds(const PolicyConfig& config) {
  const auto THERMAL = [](telemetry::ThermalState state) {
    return static_cast<double>(static_cast<std::uint8_t>(state));
  };

  return {
      Threshold{ThresholdKind::ThermalCeiling, Comparator::GreaterEqual,
                THERMAL(config.thermalCeiling), DecisionKind::Abort, AlertSeverity::Critical},
      Threshold{ThresholdKind::ThermalWarning, Comparator::Equal, THERMAL(config.thermalWarning),
                DecisionKind::Throttle, AlertSeverity::Warning},
      Threshold{ThresholdKind::BatteryMinimum, Comparator::Less, config.batteryMinimum,
                DecisionKind::Pause, AlertSeverity::Warning},
      Threshold{ThresholdKind::StorageMinimum, Comparator::Less,
                static_cast<double>(config.storageMinimumBytes), DecisionKind::Abort,
                AlertSeverity::Error},
      Threshold{ThresholdKind::MemoryMinimum, Comparator::Less,
                static_cast<double>(config.memoryMinimumBytes), DecisionKind::Alert,
                AlertSeverity::Warning},
  };
}

} // namespace policy

} // namespace kiln
