/**
 * @file LinuxTelemetry.cpp
 * @brief Thermal, battery, memory and storage collection from sysfs/procfs.
 * @note Thermal zones and hwmon are both scanned; the hottest sensor wins.
 */

#include "src/telemetry/inc/LinuxTelemetry.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <sys/statvfs.h> // statvfs

#include <array>      // std::array
#include <cstdlib>    // std::strtoull
#include <cstring>    // std::strchr
#include <filesystem> // std::filesystem
#include <system_error> // std::error_code
#include <utility>    // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace kiln {

namespace telemetry {

namespace {
using kiln::helpers::files::pathExists;
using kiln::helpers::files::readFileInt64;
using kiln::helpers::files::readFileLine;
using kiln::helpers::files::readFileToBuffer;
using kiln::helpers::strings::skipWhitespace;
using kiln::helpers::strings::startsWith;

/// Largest /proc/meminfo we parse; the fields we need are near the top.
constexpr std::size_t MEMINFO_BUFFER_SIZE = 4096;

/// hwmon exposes temp1..tempN; 32 covers every driver seen in practice.
constexpr int MAX_HWMON_TEMPS = 32;

/// Read millidegrees Celsius; convert to degrees. 0 on failure.
inline double readMilliCelsius(const fs::path& path) noexcept {
  const std::int64_t MILLI = readFileInt64(path.c_str(), 0);
  return static_cast<double>(MILLI) / 1000.0;
}

/// Parse "FieldName:    12345 kB" format, return bytes.
inline std::uint64_t parseMemInfoKb(const char* line) noexcept {
  const char* colon = std::strchr(line, ':');
  if (colon == nullptr) {
    return 0;
  }

  const char* ptr = skipWhitespace(colon + 1);
  char* end = nullptr;
  const unsigned long long KB = std::strtoull(ptr, &end, 10);
  if (end == ptr) {
    return 0;
  }

  return static_cast<std::uint64_t>(KB) * 1024ULL;
}

/// Iterate directory entries without throwing; missing roots yield nothing.
template <typename Fn> inline void forEachEntry(const std::string& root, Fn fn) {
  std::error_code ec;
  fs::directory_iterator it(root, ec);
  const fs::directory_iterator END{};
  for (; !ec && it != END; it.increment(ec)) {
    fn(it->path());
  }
}

} // namespace

/* ----------------------------- Parsing API ----------------------------- */

ThermalState classifyTemperature(double celsius, const ThermalBands& bands) noexcept {
  if (celsius >= bands.emergency) {
    return ThermalState::Emergency;
  }
  if (celsius >= bands.critical) {
    return ThermalState::Critical;
  }
  if (celsius >= bands.serious) {
    return ThermalState::Serious;
  }
  if (celsius >= bands.fair) {
    return ThermalState::Fair;
  }
  return ThermalState::Nominal;
}

std::uint64_t parseMemAvailable(const char* meminfo) noexcept {
  if (meminfo == nullptr) {
    return 0;
  }

  std::uint64_t available = 0;
  std::uint64_t freeBytes = 0;
  std::uint64_t cached = 0;
  bool haveAvailable = false;

  const char* ptr = meminfo;
  while (*ptr != '\0') {
    const char* eol = ptr;
    while (*eol != '\0' && *eol != '\n') {
      ++eol;
    }

    if (startsWith(ptr, "MemAvailable:")) {
      available = parseMemInfoKb(ptr);
      haveAvailable = true;
    } else if (startsWith(ptr, "MemFree:")) {
      freeBytes = parseMemInfoKb(ptr);
    } else if (startsWith(ptr, "Cached:")) {
      cached = parseMemInfoKb(ptr);
    }

    ptr = (*eol == '\0') ? eol : eol + 1;
  }

  return haveAvailable ? available : freeBytes + cached;
}

/* ----------------------------- LinuxTelemetry ----------------------------- */

LinuxTelemetry::LinuxTelemetry(LinuxTelemetryConfig config) : config_(std::move(config)) {}

double LinuxTelemetry::readMaxTemperature() const {
  double hottest = 0.0;

  // --- Thermal zones (generic interface) ---
  forEachEntry(config_.thermalRoot, [&hottest](const fs::path& zone) {
    if (zone.filename().string().rfind("thermal_zone", 0) != 0) {
      return;
    }
    const double TEMP = readMilliCelsius(zone / "temp");
    if (TEMP > hottest) {
      hottest = TEMP;
    }
  });

  // --- hwmon sensors ---
  forEachEntry(config_.hwmonRoot, [&hottest](const fs::path& dev) {
    for (int idx = 1; idx <= MAX_HWMON_TEMPS; ++idx) {
      const fs::path INPUT = dev / fmt::format("temp{}_input", idx);
      if (!pathExists(INPUT.c_str())) {
        continue;
      }
      const double TEMP = readMilliCelsius(INPUT);
      if (TEMP > hottest) {
        hottest = TEMP;
      }
    }
  });

  return hottest;
}

void LinuxTelemetry::readPowerSupply(RawReading& reading) const {
  double capacitySum = 0.0;
  int batteries = 0;
  bool charging = false;
  bool externalPower = false;

  forEachEntry(config_.powerSupplyRoot, [&](const fs::path& supply) {
    const std::string TYPE = readFileLine((supply / "type").string());

    if (TYPE == "Battery") {
      const std::int64_t CAPACITY = readFileInt64((supply / "capacity").c_str(), -1);
      if (CAPACITY >= 0) {
        capacitySum += static_cast<double>(CAPACITY > 100 ? 100 : CAPACITY);
        ++batteries;
      }
      const std::string STATUS = readFileLine((supply / "status").string());
      if (STATUS == "Charging" || STATUS == "Full") {
        charging = true;
      }
    } else if (TYPE == "Mains" || TYPE == "USB" || TYPE == "Wireless") {
      if (readFileInt64((supply / "online").c_str(), 0) == 1) {
        externalPower = true;
      }
    }
  });

  if (batteries == 0) {
    reading.batteryLevel = 1.0;
    reading.isCharging = true;
    return;
  }

  reading.batteryLevel = capacitySum / (100.0 * static_cast<double>(batteries));
  reading.isCharging = charging || externalPower;
}

TelemetryResult LinuxTelemetry::poll() {
  RawReading reading{};

  // --- Memory (required) ---
  std::array<char, MEMINFO_BUFFER_SIZE> buf{};
  if (readFileToBuffer(config_.meminfoPath.c_str(), buf.data(), buf.size()) == 0) {
    return TelemetryResult::failure(TelemetryError::ReadFailed,
                                    fmt::format("cannot read {}", config_.meminfoPath));
  }
  reading.availableMemoryBytes = parseMemAvailable(buf.data());

  // --- Storage (required) ---
  struct statvfs vfs{};
  if (::statvfs(config_.storagePath.c_str(), &vfs) != 0) {
    return TelemetryResult::failure(TelemetryError::ReadFailed,
                                    fmt::format("statvfs({}) failed", config_.storagePath));
  }
  reading.availableStorageBytes =
      static_cast<std::uint64_t>(vfs.f_bavail) * static_cast<std::uint64_t>(vfs.f_frsize);

  // --- Thermal and battery (optional hardware) ---
  reading.maxTemperatureCelsius = readMaxTemperature();
  reading.thermalState = classifyTemperature(reading.maxTemperatureCelsius, config_.bands);
  readPowerSupply(reading);

  spdlog::trace("[telemetry] {:.1f} C battery {:.2f} mem {} storage {}",
                reading.maxTemperatureCelsius, reading.batteryLevel,
                reading.availableMemoryBytes, reading.availableStorageBytes);

  return TelemetryResult::success(reading);
}

} // namespace telemetry

} // namespace kiln
