#ifndef KILN_TELEMETRY_RESOURCE_SNAPSHOT_HPP
#define KILN_TELEMETRY_RESOURCE_SNAPSHOT_HPP
/**
 * @file ResourceSnapshot.hpp
 * @brief Point-in-time device resource reading (thermal, battery, memory, storage).
 * @note Snapshots are value types; the monitor hands out copies.
 */

#include "src/common/inc/Clock.hpp"

#include <cstdint>     // std::uint64_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace kiln {

namespace telemetry {

/* ----------------------------- ThermalState ----------------------------- */

/**
 * @brief Ordered device thermal state (Nominal < ... < Emergency).
 */
enum class ThermalState : std::uint8_t {
  Nominal = 0,
  Fair = 1,
  Serious = 2,
  Critical = 3,
  Emergency = 4,
};

/// @brief Lowercase name ("nominal" .. "emergency").
[[nodiscard]] const char* toString(ThermalState state) noexcept;

/// @brief Parse a lowercase name; std::nullopt if unknown.
[[nodiscard]] std::optional<ThermalState> parseThermalState(std::string_view name) noexcept;

/* ----------------------------- RawReading ----------------------------- */

/**
 * @brief Unsequenced reading as returned by a TelemetrySource.
 */
struct RawReading {
  ThermalState thermalState{ThermalState::Nominal}; ///< Classified thermal state
  double maxTemperatureCelsius{0.0};                ///< Hottest sensor, 0 if none
  double batteryLevel{1.0};                         ///< 0.0 - 1.0
  bool isCharging{false};                           ///< On external power
  std::uint64_t availableMemoryBytes{0};            ///< Allocatable RAM
  std::uint64_t availableStorageBytes{0};           ///< Free space on the output volume
};

/* ----------------------------- ResourceSnapshot ----------------------------- */

/**
 * @brief Sequenced, timestamped reading produced by the Resource Monitor.
 *
 * `timestamp` (steady clock) orders snapshots and is what policy decisions
 * carry; `capturedAt` is the wall-clock time for display.
 */
struct ResourceSnapshot {
  std::uint64_t sequence{0}; ///< Monotonic per monitor, 1-based
  SteadyTime timestamp{};    ///< Ordering key
  WallTime capturedAt{};     ///< Wall-clock capture time
  ThermalState thermalState{ThermalState::Nominal};
  double maxTemperatureCelsius{0.0};
  double batteryLevel{1.0};
  bool isCharging{false};
  std::uint64_t availableMemoryBytes{0};
  std::uint64_t availableStorageBytes{0};
  bool stale{false}; ///< Served from cache after a failed/timed-out forced poll

  /// @brief Stamp a raw reading.
  [[nodiscard]] static ResourceSnapshot fromReading(const RawReading& reading,
                                                    std::uint64_t sequence, SteadyTime timestamp,
                                                    WallTime capturedAt) noexcept;

  /// @brief One-line summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace telemetry

} // namespace kiln

#endif // KILN_TELEMETRY_RESOURCE_SNAPSHOT_HPP
