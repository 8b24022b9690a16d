/**
 * @file PolicyEngine.cpp
 * @brief Threshold evaluation and alert de-duplication.
 */

#include "src/policy/inc/PolicyEngine.hpp"
#include "src/helpers/inc/Format.hpp"

#include <string>  // std::string
#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace kiln {

namespace policy {

using kiln::events::Alert;
using kiln::events::AlertKind;
using kiln::events::AlertSeverity;
using kiln::helpers::format::bytesBinary;
using kiln::telemetry::ResourceSnapshot;

namespace {

inline std::size_t slot(ThresholdKind kind) noexcept { return static_cast<std::size_t>(kind); }
inline std::size_t slot(AlertKind kind) noexcept { return static_cast<std::size_t>(kind); }

inline telemetry::ThermalState thermalFromLimit(double limit) noexcept {
  if (limit <= 0.0) {
    return telemetry::ThermalState::Nominal;
  }
  if (limit >= 4.0) {
    return telemetry::ThermalState::Emergency;
  }
  return static_cast<telemetry::ThermalState>(static_cast<std::uint8_t>(limit));
}

} // namespace

/* ----------------------------- Evaluation ----------------------------- */

Decision Evaluation::primary() const {
  if (decisions.empty()) {
    Decision cont{};
    cont.reason = "all resources within limits";
    return cont;
  }
  return decisions.front();
}

/* ----------------------------- Descriptions ----------------------------- */

std::string describeTrigger(const Threshold& threshold, const ResourceSnapshot& snapshot) {
  switch (threshold.kind) {
  case ThresholdKind::ThermalCeiling:
  case ThresholdKind::ThermalWarning:
    return fmt::format("thermal state {} ({:.1f} C), limit {} {}",
                       telemetry::toString(snapshot.thermalState), snapshot.maxTemperatureCelsius,
                       toString(threshold.comparator),
                       telemetry::toString(thermalFromLimit(threshold.limit)));
  case ThresholdKind::BatteryMinimum:
    return fmt::format("battery {:.0f}% {} {:.0f}% and not charging",
                       snapshot.batteryLevel * 100.0, toString(threshold.comparator),
                       threshold.limit * 100.0);
  case ThresholdKind::StorageMinimum:
    return fmt::format("storage {} free, limit {} {}",
                       bytesBinary(snapshot.availableStorageBytes),
                       toString(threshold.comparator),
                       bytesBinary(static_cast<std::uint64_t>(threshold.limit)));
  case ThresholdKind::MemoryMinimum:
    return fmt::format("memory {} available, limit {} {}",
                       bytesBinary(snapshot.availableMemoryBytes),
                       toString(threshold.comparator),
                       bytesBinary(static_cast<std::uint64_t>(threshold.limit)));
  }
  return toString(threshold.kind);
}

/* ----------------------------- PolicyEngine ----------------------------- */

PolicyEngine::PolicyEngine(PolicyConfig config) : config_(config) {
  for (const Threshold& THRESHOLD : defaultThresholds(config_)) {
    thresholds_[slot(THRESHOLD.kind)] = THRESHOLD;
  }
}

void PolicyEngine::setThreshold(const Threshold& threshold) {
  thresholds_[slot(threshold.kind)] = threshold;
  spdlog::info("[policy] threshold set: {}", threshold.toString());
}

bool PolicyEngine::clearThreshold(ThresholdKind kind) {
  std::optional<Threshold>& entry = thresholds_[slot(kind)];
  if (!entry) {
    return false;
  }
  entry.reset();
  spdlog::info("[policy] threshold cleared: {}", toString(kind));
  return true;
}

std::optional<Threshold> PolicyEngine::threshold(ThresholdKind kind) const {
  return thresholds_[slot(kind)];
}

std::vector<Threshold> PolicyEngine::thresholds() const {
  std::vector<Threshold> out;
  for (ThresholdKind kind : THRESHOLD_PRIORITY) {
    if (thresholds_[slot(kind)]) {
      out.push_back(*thresholds_[slot(kind)]);
    }
  }
  return out;
}

void PolicyEngine::resetAlertWindow() noexcept {
  for (std::optional<WindowEntry>& entry : window_) {
    entry.reset();
  }
}

Evaluation PolicyEngine::evaluate(const ResourceSnapshot& snapshot,
                                  std::optional<job::JobState> jobState, SteadyTime now) {
  Evaluation eval{};
  eval.snapshotTimestamp = snapshot.timestamp;
  eval.snapshotSequence = snapshot.sequence;

  const bool JOB_ACTIVE = jobState.has_value() && !job::isTerminal(*jobState);
  std::array<bool, ALERT_KIND_COUNT> seen{};

  for (ThresholdKind kind : THRESHOLD_PRIORITY) {
    const std::optional<Threshold>& THRESHOLD = thresholds_[slot(kind)];
    if (!THRESHOLD || !THRESHOLD->triggeredBy(snapshot)) {
      continue;
    }

    Decision decision{};
    decision.kind = THRESHOLD->decision;
    decision.source = kind;
    decision.severity = THRESHOLD->severity;
    decision.reason = describeTrigger(*THRESHOLD, snapshot);
    if (!JOB_ACTIVE && decision.affectsJob()) {
      decision.kind = DecisionKind::Alert;
      decision.downgraded = true;
    }

    // --- Alert de-duplication, one record per resource ---
    const AlertKind ALERT_KIND = alertKindFor(kind);
    const std::size_t IDX = slot(ALERT_KIND);
    if (!seen[IDX]) {
      seen[IDX] = true;
      std::optional<WindowEntry>& entry = window_[IDX];
      const bool EMIT = !entry || decision.severity > entry->severity ||
                        (now - entry->lastEmitted) >= config_.alertCooldown;
      if (EMIT) {
        entry = WindowEntry{decision.severity, now};
        Alert alert{};
        alert.severity = decision.severity;
        alert.kind = ALERT_KIND;
        alert.message = decision.reason;
        alert.snapshotSequence = snapshot.sequence;
        eval.alerts.push_back(std::move(alert));
      } else {
        entry->severity = decision.severity;
      }
    }

    eval.decisions.push_back(std::move(decision));
  }

  for (std::size_t i = 0; i < ALERT_KIND_COUNT; ++i) {
    if (!seen[i]) {
      window_[i].reset();
    }
  }

  if (!eval.decisions.empty()) {
    spdlog::debug("[policy] snapshot #{}: {} ({} triggered, {} alerts)", snapshot.sequence,
                  toString(eval.decisions.front().kind), eval.decisions.size(),
                  eval.alerts.size());
  }
  return eval;
}

} // namespace policy

} // namespace kiln
