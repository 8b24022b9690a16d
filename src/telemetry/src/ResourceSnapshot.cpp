/**
 * @file ResourceSnapshot.cpp
 * @brief ThermalState names and snapshot rendering.
 */

#include "src/telemetry/inc/ResourceSnapshot.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace kiln {

namespace telemetry {

using kiln::helpers::format::bytesBinary;

/* ----------------------------- ThermalState ----------------------------- */

const char* toString(ThermalState state) noexcept {
  switch (state) {
  case ThermalState::Nominal:
    return "nominal";
  case ThermalState::Fair:
    return "fair";
  case ThermalState::Serious:
    return "serious";
  case ThermalState::Critical:
    return "critical";
  case ThermalState::Emergency:
    return "emergency";
  }
  return "unknown";
}

std::optional<ThermalState> parseThermalState(std::string_view name) noexcept {
  if (name == "nominal") {
    return ThermalState::Nominal;
  }
  if (name == "fair") {
    return ThermalState::Fair;
  }
  if (name == "serious") {
    return ThermalState::Serious;
  }
  if (name == "critical") {
    return ThermalState::Critical;
  }
  if (name == "emergency") {
    return ThermalState::Emergency;
  }
  return std::nullopt;
}

/* ----------------------------- ResourceSnapshot ----------------------------- */

ResourceSnapshot ResourceSnapshot::fromReading(const RawReading& reading, std::uint64_t sequence,
                                               SteadyTime timestamp,
                                               WallTime capturedAt) noexcept {
  ResourceSnapshot snap{};
  snap.sequence = sequence;
  snap.timestamp = timestamp;
  snap.capturedAt = capturedAt;
  snap.thermalState = reading.thermalState;
  snap.maxTemperatureCelsius = reading.maxTemperatureCelsius;
  snap.batteryLevel = reading.batteryLevel;
  snap.isCharging = reading.isCharging;
  snap.availableMemoryBytes = reading.availableMemoryBytes;
  snap.availableStorageBytes = reading.availableStorageBytes;
  return snap;
}

std::string ResourceSnapshot::toString() const {
  return fmt::format("#{} thermal={} ({:.1f} C) battery={:.0f}%{} mem={} storage={}{}", sequence,
                     telemetry::toString(thermalState), maxTemperatureCelsius,
                     batteryLevel * 100.0, isCharging ? " (charging)" : "",
                     bytesBinary(availableMemoryBytes), bytesBinary(availableStorageBytes),
                     stale ? " [stale]" : "");
}

} // namespace telemetry

} // namespace kiln
