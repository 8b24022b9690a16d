#ifndef KILN_TELEMETRY_LINUX_TELEMETRY_HPP
#define KILN_TELEMETRY_LINUX_TELEMETRY_HPP
/**
 * @file LinuxTelemetry.hpp
 * @brief TelemetrySource backed by sysfs, procfs and statvfs.
 * @note Linux-only. Reads /sys/class/thermal, /sys/class/hwmon,
 *       /sys/class/power_supply, /proc/meminfo and statvfs(storagePath).
 * @note Thread-safe: poll() keeps no state between calls.
 *
 * Every root is configurable so tests can point the backend at a fake tree.
 */

#include "src/telemetry/inc/TelemetrySource.hpp"

#include <cstdint>
#include <string>

namespace kiln {

namespace telemetry {

/* ----------------------------- ThermalBands ----------------------------- */

/**
 * @brief Celsius lower bounds for each non-nominal ThermalState.
 *
 * A temperature at or above `emergency` is Emergency, at or above
 * `critical` is Critical, and so on; below `fair` is Nominal.
 */
struct ThermalBands {
  double fair{60.0};
  double serious{75.0};
  double critical{90.0};
  double emergency{100.0};
};

/* ----------------------------- LinuxTelemetryConfig ----------------------------- */

struct LinuxTelemetryConfig {
  std::string storagePath{"/"}; ///< Volume whose free space is reported
  std::string thermalRoot{"/sys/class/thermal"};
  std::string hwmonRoot{"/sys/class/hwmon"};
  std::string powerSupplyRoot{"/sys/class/power_supply"};
  std::string meminfoPath{"/proc/meminfo"};
  ThermalBands bands{};
};

/* ----------------------------- Parsing API ----------------------------- */

/**
 * @brief Map a temperature onto a ThermalState.
 * @param celsius Hottest sensor reading.
 * @param bands Band lower bounds.
 */
[[nodiscard]] ThermalState classifyTemperature(double celsius,
                                               const ThermalBands& bands) noexcept;

/**
 * @brief Extract allocatable memory from /proc/meminfo text.
 * @param meminfo Null-terminated file contents.
 * @return MemAvailable in bytes, or MemFree + Cached on kernels without
 *         MemAvailable; 0 if neither is present.
 */
[[nodiscard]] std::uint64_t parseMemAvailable(const char* meminfo) noexcept;

/* ----------------------------- LinuxTelemetry ----------------------------- */

class LinuxTelemetry final : public TelemetrySource {
public:
  explicit LinuxTelemetry(LinuxTelemetryConfig config = {});

  /**
   * @brief Read all four resources.
   * @return ReadFailed if memory or storage cannot be read. Missing thermal
   *         sensors read as Nominal; a missing battery reads as a full,
   *         charging supply (mains-powered host).
   */
  [[nodiscard]] TelemetryResult poll() override;

  [[nodiscard]] const LinuxTelemetryConfig& config() const noexcept { return config_; }

private:
  [[nodiscard]] double readMaxTemperature() const;
  void readPowerSupply(RawReading& reading) const;

  LinuxTelemetryConfig config_;
};

} // namespace telemetry

} // namespace kiln

#endif // KILN_TELEMETRY_LINUX_TELEMETRY_HPP
