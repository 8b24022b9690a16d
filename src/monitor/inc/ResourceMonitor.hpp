#ifndef KILN_MONITOR_RESOURCE_MONITOR_HPP
#define KILN_MONITOR_RESOURCE_MONITOR_HPP
/**
 * @file ResourceMonitor.hpp
 * @brief Background polling of a TelemetrySource into a bounded snapshot history.
 * @note Thread-safe. At most one polling thread exists per monitor.
 *
 * Each poll (loop or forced) is bounded by MonitorConfig::snapshotTimeout.
 * At most one source poll is in flight. While one is still running, loop
 * polls fail immediately and forced polls wait up to snapshotTimeout for it,
 * without calling the source again.
 * Failed polls are logged and skipped; after degradedAfterFailures
 * consecutive loop failures a single Monitoring alert is raised, re-armed
 * by the next successful poll.
 */

#include "src/common/inc/Clock.hpp"
#include "src/events/inc/Alert.hpp"
#include "src/events/inc/EventBus.hpp"
#include "src/helpers/inc/RingBuffer.hpp"
#include "src/telemetry/inc/ResourceSnapshot.hpp"
#include "src/telemetry/inc/TelemetrySource.hpp"

#include <atomic>             // std::atomic
#include <chrono>             // std::chrono::milliseconds
#include <condition_variable> // std::condition_variable
#include <cstddef>            // std::size_t
#include <cstdint>            // std::uint64_t
#include <functional>         // std::function
#include <memory>             // std::shared_ptr
#include <mutex>              // std::mutex
#include <optional>           // std::optional
#include <string>             // std::string
#include <thread>             // std::thread
#include <vector>             // std::vector

namespace kiln {

namespace monitor {

/* ----------------------------- MonitorConfig ----------------------------- */

struct MonitorConfig {
  std::chrono::milliseconds pollInterval{5000};    ///< Loop period
  std::chrono::milliseconds snapshotTimeout{2000}; ///< Per-poll deadline
  std::size_t historyCapacity{120};                ///< Retained snapshots
  unsigned degradedAfterFailures{3};               ///< Consecutive failures before alerting
  std::size_t retainedSessions{16};                ///< Ended sessions kept for diagnostics
};

/* ----------------------------- MonitoringSession ----------------------------- */

struct MonitoringSession {
  std::uint64_t id{0};
  WallTime startedAt{};
  std::optional<WallTime> endedAt{};
  std::chrono::milliseconds pollInterval{0};
  std::uint64_t samplesTaken{0};
  std::uint64_t failedPolls{0};

  [[nodiscard]] bool active() const noexcept { return !endedAt.has_value(); }

  /// @brief e.g. "session #2 every 5000 ms, 14 samples, 1 failed (active)".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ResourceMonitor ----------------------------- */

class ResourceMonitor {
public:
  /// Called on the polling thread after each successful loop poll.
  using Listener = std::function<void(const telemetry::ResourceSnapshot&)>;

  ResourceMonitor(std::shared_ptr<telemetry::TelemetrySource> source, events::EventBus& bus,
                  events::AlertLog& alerts, MonitorConfig config = {});

  /// Stops the loop if running.
  ~ResourceMonitor();

  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;

  /**
   * @brief Start polling every @p interval.
   * @return The new session, or the running one unchanged if already started.
   */
  MonitoringSession start(std::chrono::milliseconds interval);

  /// @brief start() with MonitorConfig::pollInterval.
  MonitoringSession start();

  /// @brief End the loop after its in-flight poll and join it. No-op when stopped.
  void stop();

  /**
   * @brief Poll now, outside the loop.
   * @return Fresh snapshot; on failure or timeout the latest cached one
   *         tagged stale; std::nullopt if nothing was ever captured.
   */
  [[nodiscard]] std::optional<telemetry::ResourceSnapshot> snapshotNow();

  /// @brief Newest @p limit snapshots, newest first.
  [[nodiscard]] std::vector<telemetry::ResourceSnapshot> history(std::size_t limit) const;

  [[nodiscard]] std::optional<telemetry::ResourceSnapshot> latest() const;

  /// @brief The running session, if any.
  [[nodiscard]] std::optional<MonitoringSession> session() const;

  /// @brief Ended sessions, newest first.
  [[nodiscard]] std::vector<MonitoringSession> pastSessions(std::size_t limit) const;

  [[nodiscard]] bool isRunning() const;

  /// @brief Polling threads currently alive (0 or 1).
  [[nodiscard]] int activeLoops() const noexcept { return activeLoops_.load(); }

  /// @brief Replace the per-tick listener. Safe while running.
  void setListener(Listener listener);

  [[nodiscard]] const MonitorConfig& config() const noexcept { return config_; }

private:
  void loop(std::chrono::milliseconds interval);

  /// Poll with deadline; record on success. Waits up to @p idleWait for an
  /// in-flight poll to finish before giving up.
  std::optional<telemetry::ResourceSnapshot> capture(std::string& error,
                                                     std::chrono::milliseconds idleWait);

  void noteLoopFailure(const std::string& error);
  void noteLoopSuccess();

  std::shared_ptr<telemetry::TelemetrySource> source_;
  events::EventBus& bus_;
  events::AlertLog& alerts_;
  const MonitorConfig config_;

  helpers::RingBuffer<telemetry::ResourceSnapshot> history_;
  helpers::RingBuffer<MonitoringSession> past_;
  std::atomic<std::uint64_t> nextSequence_{1};

  // Set while a source poll runs; cleared by the poll thread when it returns.
  std::shared_ptr<std::atomic<bool>> pollBusy_{std::make_shared<std::atomic<bool>>(false)};

  // Lifecycle: serializes start()/stop().
  std::mutex lifecycleMtx_;
  std::thread worker_;

  // Loop wake-up and the current session.
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool stopRequested_{false};
  std::optional<MonitoringSession> current_{};
  std::uint64_t nextSessionId_{1};
  unsigned consecutiveFailures_{0};
  bool degradedRaised_{false};

  std::mutex listenerMtx_;
  Listener listener_{};

  std::atomic<int> activeLoops_{0};
};

} // namespace monitor

} // namespace kiln

#endif // KILN_MONITOR_RESOURCE_MONITOR_HPP
