#ifndef KILN_POLICY_THRESHOLD_HPP
#define KILN_POLICY_THRESHOLD_HPP
/**
 * @file Threshold.hpp
 * @brief Threshold, Decision and policy configuration types.
 */

#include "src/events/inc/Alert.hpp"
#include "src/telemetry/inc/ResourceSnapshot.hpp"

#include <array>   // std::array
#include <chrono>  // std::chrono::seconds
#include <cstddef> // std::size_t
#include <cstdint> // std::uint8_t, std::uint64_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace kiln {

namespace policy {

/* ----------------------------- Enums ----------------------------- */

/// What the coordinator should do with the active job.
enum class DecisionKind : std::uint8_t {
  Continue = 0,
  Throttle,
  Pause,
  Abort,
  Alert, ///< Record an alert only; the job is untouched
};

/// Threshold identity. Declaration order is evaluation priority (highest first).
enum class ThresholdKind : std::uint8_t {
  ThermalCeiling = 0,
  ThermalWarning,
  BatteryMinimum,
  StorageMinimum,
  MemoryMinimum,
};

inline constexpr std::size_t THRESHOLD_KIND_COUNT = 5;

/// All kinds in priority order.
inline constexpr std::array<ThresholdKind, THRESHOLD_KIND_COUNT> THRESHOLD_PRIORITY = {
    ThresholdKind::ThermalCeiling, ThresholdKind::ThermalWarning, ThresholdKind::BatteryMinimum,
    ThresholdKind::StorageMinimum, ThresholdKind::MemoryMinimum};

enum class Comparator : std::uint8_t {
  Less = 0,
  LessEqual,
  Greater,
  GreaterEqual,
  Equal,
};

[[nodiscard]] const char* toString(DecisionKind kind) noexcept;
[[nodiscard]] const char* toString(ThresholdKind kind) noexcept;

/// @brief "<", "<=", ">", ">=" or "==".
[[nodiscard]] const char* toString(Comparator comparator) noexcept;

/// @brief `value <comparator> limit`.
[[nodiscard]] bool compare(double value, Comparator comparator, double limit) noexcept;

/// @brief Resource an alert from this threshold is about.
[[nodiscard]] events::AlertKind alertKindFor(ThresholdKind kind) noexcept;

/**
 * @brief Value a threshold of @p kind is compared against.
 *
 * Thermal kinds use the ThermalState ordinal (Nominal = 0 .. Emergency = 4),
 * battery the 0-1 level, storage and memory the available bytes.
 */
[[nodiscard]] double metricFor(ThresholdKind kind,
                               const telemetry::ResourceSnapshot& snapshot) noexcept;

/* ----------------------------- Threshold ----------------------------- */

/**
 * @brief One trigger condition. At most one per kind is installed.
 *
 * BatteryMinimum additionally requires the device not to be charging.
 */
struct Threshold {
  ThresholdKind kind{ThresholdKind::ThermalCeiling};
  Comparator comparator{Comparator::GreaterEqual};
  double limit{0.0};
  DecisionKind decision{DecisionKind::Alert};
  events::AlertSeverity severity{events::AlertSeverity::Warning};

  /// @brief True if @p snapshot meets the condition.
  [[nodiscard]] bool triggeredBy(const telemetry::ResourceSnapshot& snapshot) const noexcept;

  /// @brief e.g. "battery_minimum: value < 0.15 -> pause".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- PolicyConfig ----------------------------- */

struct PolicyConfig {
  double batteryMinimum{0.15};                                     ///< Fraction, 0-1
  std::uint64_t storageMinimumBytes{500ULL * 1024ULL * 1024ULL};   ///< Free bytes
  std::uint64_t memoryMinimumBytes{256ULL * 1024ULL * 1024ULL};    ///< Available bytes
  telemetry::ThermalState thermalCeiling{telemetry::ThermalState::Critical};
  telemetry::ThermalState thermalWarning{telemetry::ThermalState::Serious};
  std::chrono::seconds alertCooldown{60};                          ///< Re-emit window
};

/**
 * @brief The threshold set implied by @p config, in priority order.
 *
 *   thermal >= ceiling        -> Abort    (critical)
 *   thermal == warning        -> Throttle (warning)
 *   battery <  minimum        -> Pause    (warning, only when not charging)
 *   storage <  minimum        -> Abort    (error)
 *   memory  <  minimum        -> Alert    (warning)
 */
[[nodiscard]] std::vector<Threshold> defaultThresholds(const PolicyConfig& config);

/* ----------------------------- Decision ----------------------------- */

struct Decision {
  DecisionKind kind{DecisionKind::Continue};
  ThresholdKind source{ThresholdKind::ThermalCeiling}; ///< Meaningless for Continue
  events::AlertSeverity severity{events::AlertSeverity::Info};
  std::string reason{};
  bool downgraded{false}; ///< Job-directed decision turned into Alert (no active job)

  /// @brief True for Throttle, Pause and Abort.
  [[nodiscard]] bool affectsJob() const noexcept {
    return kind == DecisionKind::Throttle || kind == DecisionKind::Pause ||
           kind == DecisionKind::Abort;
  }
};

} // namespace policy

} // namespace kiln

#endif // KILN_POLICY_THRESHOLD_HPP
