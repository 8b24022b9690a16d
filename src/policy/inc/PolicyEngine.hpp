#ifndef KILN_POLICY_POLICY_ENGINE_HPP
#define KILN_POLICY_POLICY_ENGINE_HPP
/**
 * @file PolicyEngine.hpp
 * @brief Maps a resource snapshot onto ordered job decisions and alerts.
 * @note Not thread-safe. The coordinator serializes every call under its lock.
 *
 * Evaluation is a pure function of (snapshot, thresholds, job state) except
 * for the alert de-duplication window: per resource, an alert is emitted
 * when the condition first triggers, when its severity escalates, or once
 * the cooldown has elapsed. The window entry is dropped when the condition
 * clears.
 */

#include "src/common/inc/Clock.hpp"
#include "src/events/inc/Alert.hpp"
#include "src/job/inc/JobState.hpp"
#include "src/policy/inc/Threshold.hpp"
#include "src/telemetry/inc/ResourceSnapshot.hpp"

#include <array>    // std::array
#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <vector>   // std::vector

namespace kiln {

namespace policy {

/* ----------------------------- Evaluation ----------------------------- */

/**
 * @brief Result of one evaluation.
 *
 * `decisions` holds one entry per triggered threshold, highest priority
 * first. `alerts` holds the de-duplicated alert records still to be logged
 * (ids unassigned).
 */
struct Evaluation {
  SteadyTime snapshotTimestamp{};
  std::uint64_t snapshotSequence{0};
  std::vector<Decision> decisions{};
  std::vector<events::Alert> alerts{};

  /// @brief First decision, or Continue when nothing triggered.
  [[nodiscard]] Decision primary() const;
};

/* ----------------------------- PolicyEngine ----------------------------- */

class PolicyEngine {
public:
  /// Installs defaultThresholds(config).
  explicit PolicyEngine(PolicyConfig config = {});

  /// @brief Install or replace the threshold for `threshold.kind`.
  void setThreshold(const Threshold& threshold);

  /// @return false if no threshold of @p kind was installed.
  bool clearThreshold(ThresholdKind kind);

  [[nodiscard]] std::optional<Threshold> threshold(ThresholdKind kind) const;

  /// @brief Installed thresholds in priority order.
  [[nodiscard]] std::vector<Threshold> thresholds() const;

  /**
   * @brief Evaluate @p snapshot.
   * @param snapshot Snapshot to judge.
   * @param jobState Active job state; std::nullopt or terminal means no job,
   *                 in which case job-directed decisions become Alert.
   * @param now Clock for the de-duplication window.
   */
  [[nodiscard]] Evaluation evaluate(const telemetry::ResourceSnapshot& snapshot,
                                    std::optional<job::JobState> jobState, SteadyTime now);

  /// @brief Forget every de-duplication entry.
  void resetAlertWindow() noexcept;

  [[nodiscard]] const PolicyConfig& config() const noexcept { return config_; }

private:
  struct WindowEntry {
    events::AlertSeverity severity{events::AlertSeverity::Info};
    SteadyTime lastEmitted{};
  };

  static constexpr std::size_t ALERT_KIND_COUNT = 6;

  PolicyConfig config_;
  std::array<std::optional<Threshold>, THRESHOLD_KIND_COUNT> thresholds_{};
  std::array<std::optional<WindowEntry>, ALERT_KIND_COUNT> window_{};
};

/**
 * @brief Human-readable description of why @p threshold triggered.
 * @note Exposed for the CLI and tests.
 */
[[nodiscard]] std::string describeTrigger(const Threshold& threshold,
                                          const telemetry::ResourceSnapshot& snapshot);

} // namespace policy

} // namespace kiln

#endif // KILN_POLICY_POLICY_ENGINE_HPP
