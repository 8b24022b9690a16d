#ifndef KILN_POLICY_DEVICE_HEALTH_HPP
#define KILN_POLICY_DEVICE_HEALTH_HPP
/**
 * @file DeviceHealth.hpp
 * @brief Per-resource health grading of a snapshot against policy limits.
 */

#include "src/policy/inc/Threshold.hpp"
#include "src/telemetry/inc/ResourceSnapshot.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kiln {

namespace policy {

/// Ordered: Good < Fair < Poor < Critical.
enum class HealthGrade : std::uint8_t {
  Good = 0,
  Fair,
  Poor,
  Critical,
};

[[nodiscard]] const char* toString(HealthGrade grade) noexcept;

struct DeviceHealth {
  HealthGrade thermal{HealthGrade::Good};
  HealthGrade battery{HealthGrade::Good};
  HealthGrade memory{HealthGrade::Good};
  HealthGrade storage{HealthGrade::Good};
  HealthGrade overall{HealthGrade::Good}; ///< Worst of the four
  int score{100};                         ///< 0-100
  std::vector<std::string> issues{};      ///< One line per non-Good resource

  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Grade @p snapshot.
 *
 * Battery, storage and memory are Critical below their minimum, Poor below
 * twice it, Fair below four times it (battery: below 50%), Good otherwise.
 * A charging battery is always Good. Thermal follows the ThermalState
 * (Nominal Good, Fair Fair, Serious Poor, Critical and above Critical).
 * The score starts at 100 and loses 10 / 25 / 50 per Fair / Poor / Critical
 * resource, floored at 0.
 */
[[nodiscard]] DeviceHealth assessHealth(const telemetry::ResourceSnapshot& snapshot,
                                        const PolicyConfig& config);

} // namespace policy

} // namespace kiln

#endif // KILN_POLICY_DEVICE_HEALTH_HPP
