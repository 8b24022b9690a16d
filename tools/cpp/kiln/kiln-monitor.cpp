/**
 * @file kiln-monitor.cpp
 * @brief Device telemetry, health grade and policy decisions for this host.
 *
 * Reads thermal, battery, memory and storage state the same way the
 * coordinator's monitor does and shows what the policy engine would decide
 * for a running conversion. Supports continuous watch mode.
 */

#include "src/common/inc/Clock.hpp"
#include "src/events/inc/Alert.hpp"
#include "src/events/inc/EventBus.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/job/inc/JobState.hpp"
#include "src/monitor/inc/ResourceMonitor.hpp"
#include "src/policy/inc/DeviceHealth.hpp"
#include "src/policy/inc/PolicyEngine.hpp"
#include "src/telemetry/inc/LinuxTelemetry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chrono>
#include <thread>

#include <fmt/core.h>

namespace args = kiln::helpers::args;
namespace format = kiln::helpers::format;
namespace policy = kiln::policy;
namespace telemetry = kiln::telemetry;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_WATCH = 2,
  ARG_INTERVAL = 3,
  ARG_STORAGE_PATH = 4,
  ARG_BATTERY_MIN = 5,
  ARG_STORAGE_MIN = 6,
  ARG_MEMORY_MIN = 7,
  ARG_LOG_LEVEL = 8,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Device resource monitor for conversion jobs.\n"
    "Shows thermal, battery, memory and storage state, a health grade, and the\n"
    "decision the policy engine would apply to a running job.";

constexpr std::uint64_t MIB = 1024ULL * 1024ULL;

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", {}, false, "Show this help message"};
  map[ARG_JSON] = {"--json", {}, false, "Output in JSON format"};
  map[ARG_WATCH] = {"--watch", {}, false, "Continuous monitoring mode"};
  map[ARG_INTERVAL] = {"--interval", "<ms>", false, "Watch interval (default: 5000, min: 500)"};
  map[ARG_STORAGE_PATH] = {"--storage-path", "<dir>", false,
                           "Output volume to check (default: /)"};
  map[ARG_BATTERY_MIN] = {"--battery-min", "<0-1>", false,
                          "Battery level that pauses a job (default: 0.15)"};
  map[ARG_STORAGE_MIN] = {"--storage-min-mib", "<MiB>", false,
                          "Free storage that aborts a job (default: 500)"};
  map[ARG_MEMORY_MIN] = {"--memory-min-mib", "<MiB>", false,
                         "Free memory that raises an alert (default: 256)"};
  map[ARG_LOG_LEVEL] = {"--log-level", "<level>", false,
                        "trace|debug|info|warn|error|off (default: warn)"};
  return map;
}

/// Parse a MiB count into bytes; negative or absent keeps @p defaultBytes.
std::uint64_t mibValue(const args::ParsedArgs& pargs, ArgKey key, std::uint64_t defaultBytes) {
  const long long MIBS = args::intValue(pargs, key, -1);
  if (MIBS < 0) {
    return defaultBytes;
  }
  return static_cast<std::uint64_t>(MIBS) * MIB;
}

/* ----------------------------- Human Output ----------------------------- */

const char* gradeColor(policy::HealthGrade grade) {
  switch (grade) {
  case policy::HealthGrade::Good:
    return "\033[32m";
  case policy::HealthGrade::Fair:
    return "\033[0m";
  case policy::HealthGrade::Poor:
    return "\033[33m";
  case policy::HealthGrade::Critical:
    return "\033[31m";
  }
  return "\033[0m";
}

void printHumanOutput(const telemetry::ResourceSnapshot& snap, const policy::DeviceHealth& health,
                      const policy::Evaluation& eval, bool showHeader) {
  if (showHeader) {
    fmt::print("Device Resources\n");
    fmt::print("================\n\n");
  }

  // Decision first: it is what a running job would experience
  const policy::Decision PRIMARY = eval.primary();
  fmt::print("=== Decision (running job) ===\n");
  const char* color = PRIMARY.kind == policy::DecisionKind::Continue ? "\033[32m" : "\033[33m";
  if (PRIMARY.kind == policy::DecisionKind::Abort) {
    color = "\033[31m";
  }
  fmt::print("  {}{}\033[0m  {}\n", color, policy::toString(PRIMARY.kind), PRIMARY.reason);
  for (std::size_t i = 1; i < eval.decisions.size(); ++i) {
    fmt::print("  (also) {:<10} {}\n", policy::toString(eval.decisions[i].kind),
               eval.decisions[i].reason);
  }

  fmt::print("\n=== Resources ===\n");
  fmt::print("  {:<12} {}{}\033[0m ({:.1f} C)\n", "Thermal", gradeColor(health.thermal),
             telemetry::toString(snap.thermalState), snap.maxTemperatureCelsius);
  fmt::print("  {:<12} {}{:.0f}%\033[0m {}\n", "Battery", gradeColor(health.battery),
             snap.batteryLevel * 100.0, snap.isCharging ? "(charging)" : "(discharging)");
  fmt::print("  {:<12} {}{}\033[0m available\n", "Memory", gradeColor(health.memory),
             format::bytesBinary(snap.availableMemoryBytes));
  fmt::print("  {:<12} {}{}\033[0m free\n", "Storage", gradeColor(health.storage),
             format::bytesBinary(snap.availableStorageBytes));
  if (snap.stale) {
    fmt::print("  \033[33m(stale: live poll failed, showing cached values)\033[0m\n");
  }

  fmt::print("\n=== Health ===\n");
  fmt::print("  Overall: {}{}\033[0m  score {}/100\n", gradeColor(health.overall),
             policy::toString(health.overall), health.score);
  for (const auto& ISSUE : health.issues) {
    fmt::print("  - {}\n", ISSUE);
  }

  fmt::print("\n");
}

void printJsonOutput(const telemetry::ResourceSnapshot& snap, const policy::DeviceHealth& health,
                     const policy::Evaluation& eval) {
  fmt::print("{{\n");

  fmt::print("  \"snapshot\": {{\n");
  fmt::print("    \"sequence\": {},\n", snap.sequence);
  fmt::print("    \"capturedAt\": {},\n", format::jsonString(format::isoTime(snap.capturedAt)));
  fmt::print("    \"thermalState\": \"{}\",\n", telemetry::toString(snap.thermalState));
  fmt::print("    \"maxTemperatureCelsius\": {:.1f},\n", snap.maxTemperatureCelsius);
  fmt::print("    \"batteryLevel\": {:.3f},\n", snap.batteryLevel);
  fmt::print("    \"isCharging\": {},\n", snap.isCharging);
  fmt::print("    \"availableMemoryBytes\": {},\n", snap.availableMemoryBytes);
  fmt::print("    \"availableStorageBytes\": {},\n", snap.availableStorageBytes);
  fmt::print("    \"stale\": {}\n", snap.stale);
  fmt::print("  }},\n");

  fmt::print("  \"health\": {{\"overall\": \"{}\", \"score\": {}, \"issues\": [",
             policy::toString(health.overall), health.score);
  for (std::size_t i = 0; i < health.issues.size(); ++i) {
    fmt::print("{}{}", i == 0 ? "" : ", ", format::jsonString(health.issues[i]));
  }
  fmt::print("]}},\n");

  fmt::print("  \"decisions\": [\n");
  for (std::size_t i = 0; i < eval.decisions.size(); ++i) {
    const policy::Decision& D = eval.decisions[i];
    fmt::print("    {{\"kind\": \"{}\", \"source\": \"{}\", \"severity\": \"{}\", \"reason\": {}}}",
               policy::toString(D.kind), policy::toString(D.source),
               kiln::events::toString(D.severity), format::jsonString(D.reason));
    if (i + 1 < eval.decisions.size()) {
      fmt::print(",");
    }
    fmt::print("\n");
  }
  fmt::print("  ]\n");

  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  if (const std::optional<std::string> PARSE_ERROR = args::parseArgs(argList, ARG_MAP, pargs)) {
    fmt::print(stderr, "Error: {}\n\n", *PARSE_ERROR);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  if (args::hasFlag(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const bool JSON_OUTPUT = args::hasFlag(pargs, ARG_JSON);
  const bool WATCH_MODE = args::hasFlag(pargs, ARG_WATCH);
  long long intervalMs = args::intValue(pargs, ARG_INTERVAL, 5000);
  const std::string LOG_LEVEL = args::stringValue(pargs, ARG_LOG_LEVEL, "warn");

  telemetry::LinuxTelemetryConfig sourceConfig{};
  sourceConfig.storagePath = args::stringValue(pargs, ARG_STORAGE_PATH, "/");

  policy::PolicyConfig policyConfig{};
  policyConfig.batteryMinimum =
      args::doubleValue(pargs, ARG_BATTERY_MIN, policyConfig.batteryMinimum);
  policyConfig.storageMinimumBytes =
      mibValue(pargs, ARG_STORAGE_MIN, policyConfig.storageMinimumBytes);
  policyConfig.memoryMinimumBytes =
      mibValue(pargs, ARG_MEMORY_MIN, policyConfig.memoryMinimumBytes);

  kiln::helpers::log::init(LOG_LEVEL);

  // Clamp interval
  if (intervalMs < 500) {
    intervalMs = 500;
  }
  if (intervalMs > 60000) {
    intervalMs = 60000;
  }

  kiln::events::EventBus bus{};
  kiln::events::AlertLog alerts(16);
  kiln::monitor::ResourceMonitor monitor(std::make_shared<telemetry::LinuxTelemetry>(sourceConfig),
                                         bus, alerts);
  policy::PolicyEngine engine(policyConfig);

  bool firstIteration = true;
  while (true) {
    const std::optional<telemetry::ResourceSnapshot> SNAP = monitor.snapshotNow();
    if (!SNAP) {
      fmt::print(stderr, "Error: telemetry unavailable (see log output)\n");
      if (!WATCH_MODE) {
        return 1;
      }
    } else {
      const policy::DeviceHealth HEALTH = policy::assessHealth(*SNAP, policyConfig);
      const policy::Evaluation EVAL =
          engine.evaluate(*SNAP, kiln::job::JobState::Running, kiln::SteadyClock::now());

      if (JSON_OUTPUT) {
        printJsonOutput(*SNAP, HEALTH, EVAL);
      } else {
        // Clear screen for watch mode (ANSI escape)
        if (WATCH_MODE && !firstIteration) {
          fmt::print("\033[2J\033[H");
        }
        printHumanOutput(*SNAP, HEALTH, EVAL, true);
        if (WATCH_MODE) {
          fmt::print("(refreshing every {}ms, Ctrl+C to exit)\n", intervalMs);
        }
      }
    }

    if (!WATCH_MODE) {
      break;
    }
    firstIteration = false;
    std::this_thread::sleep_for(std::chrono::milliseconds(intervalMs));
  }

  return 0;
}
