/**
 * @file ResourceMonitor.cpp
 * @brief Polling loop, forced polls and session bookkeeping.
 */

#include "src/monitor/inc/ResourceMonitor.hpp"
#include "src/helpers/inc/Timeout.hpp"

#include <atomic>  // std::atomic
#include <memory>  // std::make_shared
#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace kiln {

namespace monitor {

using kiln::helpers::timeout::runWithTimeout;
using kiln::telemetry::ResourceSnapshot;
using kiln::telemetry::TelemetryResult;

namespace {

/// Clears the in-flight flag once: when the poll returns, or when the last
/// copy of the poll callable is destroyed without having run it to completion.
class PollRelease {
public:
  explicit PollRelease(std::shared_ptr<std::atomic<bool>> busy) : busy_(std::move(busy)) {}
  ~PollRelease() { release(); }

  PollRelease(const PollRelease&) = delete;
  PollRelease& operator=(const PollRelease&) = delete;

  void release() noexcept {
    if (!released_.exchange(true)) {
      busy_->store(false);
    }
  }

private:
  std::shared_ptr<std::atomic<bool>> busy_;
  std::atomic<bool> released_{false};
};

/// Re-check interval while a forced poll waits for an in-flight one.
constexpr std::chrono::milliseconds IDLE_POLL{1};

} // namespace

/* ----------------------------- MonitoringSession ----------------------------- */

std::string MonitoringSession::toString() const {
  return fmt::format("session #{} every {} ms, {} samples, {} failed{}", id,
                     pollInterval.count(), samplesTaken, failedPolls,
                     active() ? " (active)" : "");
}

/* ----------------------------- Lifecycle ----------------------------- */

ResourceMonitor::ResourceMonitor(std::shared_ptr<telemetry::TelemetrySource> source,
                                 events::EventBus& bus, events::AlertLog& alerts,
                                 MonitorConfig config)
    : source_(std::move(source)), bus_(bus), alerts_(alerts), config_(config),
      history_(config.historyCapacity), past_(config.retainedSessions) {}

ResourceMonitor::~ResourceMonitor() { stop(); }

MonitoringSession ResourceMonitor::start() { return start(config_.pollInterval); }

MonitoringSession ResourceMonitor::start(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> life(lifecycleMtx_);

  MonitoringSession session{};
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (current_) {
      return *current_;
    }
    if (interval.count() <= 0) {
      interval = config_.pollInterval;
    }
    session.id = nextSessionId_++;
    session.startedAt = WallClock::now();
    session.pollInterval = interval;
    current_ = session;
    stopRequested_ = false;
    consecutiveFailures_ = 0;
    degradedRaised_ = false;
  }

  worker_ = std::thread([this, interval] { loop(interval); });
  spdlog::info("[monitor] started session {} ({} ms)", session.id, interval.count());
  return session;
}

void ResourceMonitor::stop() {
  std::lock_guard<std::mutex> life(lifecycleMtx_);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!current_) {
      return;
    }
    stopRequested_ = true;
  }
  cv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }

  MonitoringSession ended{};
  {
    std::lock_guard<std::mutex> lock(mtx_);
    current_->endedAt = WallClock::now();
    ended = *current_;
    current_.reset();
  }
  past_.push(ended);
  spdlog::info("[monitor] stopped {}", ended.toString());
}

bool ResourceMonitor::isRunning() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return current_.has_value();
}

std::optional<MonitoringSession> ResourceMonitor::session() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return current_;
}

std::vector<MonitoringSession> ResourceMonitor::pastSessions(std::size_t limit) const {
  return past_.latest(limit);
}

void ResourceMonitor::setListener(Listener listener) {
  std::lock_guard<std::mutex> lock(listenerMtx_);
  listener_ = std::move(listener);
}

/* ----------------------------- Polling ----------------------------- */

void ResourceMonitor::loop(std::chrono::milliseconds interval) {
  ++activeLoops_;

  while (true) {
    std::string error;
    const std::optional<ResourceSnapshot> SNAP = capture(error, std::chrono::milliseconds{0});
    if (SNAP) {
      noteLoopSuccess();
      Listener listener;
      {
        std::lock_guard<std::mutex> lock(listenerMtx_);
        listener = listener_;
      }
      if (listener) {
        listener(*SNAP);
      }
    } else {
      noteLoopFailure(error);
    }

    std::unique_lock<std::mutex> lock(mtx_);
    if (cv_.wait_for(lock, interval, [this] { return stopRequested_; })) {
      break;
    }
  }

  --activeLoops_;
}

std::optional<ResourceSnapshot> ResourceMonitor::capture(std::string& error,
                                                         std::chrono::milliseconds idleWait) {
  const SteadyTime IDLE_DEADLINE = SteadyClock::now() + idleWait;
  bool idle = false;
  while (!pollBusy_->compare_exchange_strong(idle, true)) {
    idle = false;
    if (SteadyClock::now() >= IDLE_DEADLINE) {
      error = "previous telemetry poll still in flight";
      return std::nullopt;
    }
    std::this_thread::sleep_for(IDLE_POLL);
  }

  std::shared_ptr<telemetry::TelemetrySource> source = source_;
  auto release = std::make_shared<PollRelease>(pollBusy_);
  const std::optional<TelemetryResult> RESULT = runWithTimeout<TelemetryResult>(
      [source, release] {
        TelemetryResult out = source->poll();
        release->release();
        return out;
      },
      config_.snapshotTimeout);
  release.reset();

  if (!RESULT) {
    error = fmt::format("telemetry poll did not finish within {} ms",
                        config_.snapshotTimeout.count());
    return std::nullopt;
  }
  if (!RESULT->ok) {
    error = fmt::format("{}: {}", telemetry::toString(RESULT->error), RESULT->message);
    return std::nullopt;
  }

  const ResourceSnapshot SNAP = ResourceSnapshot::fromReading(
      RESULT->reading, nextSequence_.fetch_add(1), SteadyClock::now(), WallClock::now());
  history_.push(SNAP);
  spdlog::debug("[monitor] {}", SNAP.toString());
  return SNAP;
}

void ResourceMonitor::noteLoopSuccess() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (current_) {
    ++current_->samplesTaken;
  }
  if (degradedRaised_) {
    spdlog::info("[monitor] telemetry recovered after {} failed polls", consecutiveFailures_);
  }
  consecutiveFailures_ = 0;
  degradedRaised_ = false;
}

void ResourceMonitor::noteLoopFailure(const std::string& error) {
  spdlog::warn("[monitor] poll failed: {}", error);

  unsigned failures = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (current_) {
      ++current_->failedPolls;
    }
    failures = ++consecutiveFailures_;
    if (degradedRaised_ || failures < config_.degradedAfterFailures) {
      return;
    }
    degradedRaised_ = true;
  }

  events::Alert alert{};
  alert.severity = events::AlertSeverity::Warning;
  alert.kind = events::AlertKind::Monitoring;
  alert.message = fmt::format("monitoring degraded: {} consecutive failed polls ({})", failures,
                              error);
  const std::optional<ResourceSnapshot> LAST = history_.newest();
  alert.snapshotSequence = LAST ? LAST->sequence : 0;

  const events::Alert STORED = alerts_.append(std::move(alert));
  bus_.publish(events::AlertRaised{STORED});
}

/* ----------------------------- Queries ----------------------------- */

std::optional<ResourceSnapshot> ResourceMonitor::snapshotNow() {
  std::string error;
  std::optional<ResourceSnapshot> fresh = capture(error, config_.snapshotTimeout);
  if (fresh) {
    return fresh;
  }

  std::optional<ResourceSnapshot> cached = history_.newest();
  if (!cached) {
    spdlog::warn("[monitor] forced poll failed with no cached snapshot: {}", error);
    return std::nullopt;
  }
  spdlog::warn("[monitor] forced poll failed, serving snapshot #{} as stale: {}",
               cached->sequence, error);
  cached->stale = true;
  return cached;
}

std::vector<ResourceSnapshot> ResourceMonitor::history(std::size_t limit) const {
  return history_.latest(limit);
}

std::optional<ResourceSnapshot> ResourceMonitor::latest() const { return history_.newest(); }

} // namespace monitor

} // namespace kiln
