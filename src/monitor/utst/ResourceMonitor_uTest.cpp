/**
 * @file ResourceMonitor_uTest.cpp
 * @brief Unit tests for kiln::monitor::ResourceMonitor.
 *
 * Notes:
 *  - A scripted TelemetrySource replaces sysfs.
 *  - Poll intervals are a few milliseconds; waits use generous deadlines.
 */

#include "src/monitor/inc/ResourceMonitor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

using kiln::events::AlertKind;
using kiln::events::AlertLog;
using kiln::events::AlertRaised;
using kiln::events::EventBus;
using kiln::events::EventFilter;
using kiln::monitor::MonitorConfig;
using kiln::monitor::MonitoringSession;
using kiln::monitor::ResourceMonitor;
using kiln::telemetry::RawReading;
using kiln::telemetry::ResourceSnapshot;
using kiln::telemetry::TelemetryError;
using kiln::telemetry::TelemetryResult;

namespace {

using namespace std::chrono_literals;

class FakeTelemetry final : public kiln::telemetry::TelemetrySource {
public:
  TelemetryResult poll() override {
    ++polls;
    std::chrono::milliseconds delay{0};
    bool failing = false;
    RawReading reading{};
    {
      std::lock_guard<std::mutex> lock(mtx);
      delay = pollDelay;
      failing = fail;
      reading = next;
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    if (failing) {
      return TelemetryResult::failure(TelemetryError::ReadFailed, "sensor gone");
    }
    return TelemetryResult::success(reading);
  }

  void setFail(bool value) {
    std::lock_guard<std::mutex> lock(mtx);
    fail = value;
  }

  void setDelay(std::chrono::milliseconds value) {
    std::lock_guard<std::mutex> lock(mtx);
    pollDelay = value;
  }

  std::atomic<int> polls{0};

private:
  std::mutex mtx;
  bool fail{false};
  std::chrono::milliseconds pollDelay{0};
  RawReading next{};
};

template <typename Pred> bool waitFor(Pred pred, std::chrono::milliseconds limit = 2000ms) {
  const auto DEADLINE = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < DEADLINE) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

/// Thread count from /proc/self/status, or -1 if unreadable.
int processThreads() {
  std::ifstream status("/proc/self/status");
  std::string line;
  while (std::getline(status, line)) {
    if (line.rfind("Threads:", 0) == 0) {
      return std::stoi(line.substr(8));
    }
  }
  return -1;
}

MonitorConfig fastConfig() {
  MonitorConfig config{};
  config.pollInterval = 5ms;
  config.snapshotTimeout = 100ms;
  config.historyCapacity = 8;
  config.degradedAfterFailures = 3;
  config.retainedSessions = 4;
  return config;
}

} // namespace

class ResourceMonitorTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeTelemetry> source_{std::make_shared<FakeTelemetry>()};
  EventBus bus_{};
  AlertLog alerts_{32};
  ResourceMonitor monitor_{source_, bus_, alerts_, fastConfig()};
};

/* ----------------------------- Lifecycle ----------------------------- */

/** @test A second start returns the same session and spawns no second loop. */
TEST_F(ResourceMonitorTest, StartIdempotent) {
  const MonitoringSession FIRST = monitor_.start();
  const MonitoringSession SECOND = monitor_.start(50ms);
  EXPECT_EQ(FIRST.id, SECOND.id);
  EXPECT_EQ(SECOND.pollInterval, 5ms);
  ASSERT_TRUE(waitFor([this] { return monitor_.activeLoops() == 1; }));
  EXPECT_EQ(monitor_.activeLoops(), 1);
  EXPECT_TRUE(monitor_.isRunning());
}

/** @test stop joins the loop; a second stop is a no-op. */
TEST_F(ResourceMonitorTest, StopIdempotent) {
  (void)monitor_.start();
  ASSERT_TRUE(waitFor([this] { return source_->polls.load() >= 2; }));
  monitor_.stop();
  EXPECT_EQ(monitor_.activeLoops(), 0);
  EXPECT_FALSE(monitor_.isRunning());
  monitor_.stop();

  const auto PAST = monitor_.pastSessions(4);
  ASSERT_EQ(PAST.size(), 1U);
  EXPECT_TRUE(PAST[0].endedAt.has_value());
  EXPECT_GE(PAST[0].samplesTaken, 1U);

  const int POLLS = source_->polls.load();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(source_->polls.load(), POLLS);
}

/** @test Restart after stop opens a new session. */
TEST_F(ResourceMonitorTest, RestartNewSession) {
  const auto FIRST = monitor_.start();
  monitor_.stop();
  const auto SECOND = monitor_.start();
  EXPECT_NE(FIRST.id, SECOND.id);
  monitor_.stop();
  EXPECT_EQ(monitor_.pastSessions(4).size(), 2U);
}

/* ----------------------------- History ----------------------------- */

/** @test History is bounded and newest first with increasing sequence. */
TEST_F(ResourceMonitorTest, HistoryBoundedNewestFirst) {
  (void)monitor_.start();
  ASSERT_TRUE(waitFor([this] { return source_->polls.load() >= 12; }));
  monitor_.stop();

  const auto HIST = monitor_.history(100);
  ASSERT_EQ(HIST.size(), 8U);
  for (std::size_t i = 1; i < HIST.size(); ++i) {
    EXPECT_GT(HIST[i - 1].sequence, HIST[i].sequence);
    EXPECT_GE(HIST[i - 1].timestamp, HIST[i].timestamp);
  }
  EXPECT_EQ(monitor_.history(3).size(), 3U);
}

/** @test Listener sees every loop snapshot. */
TEST_F(ResourceMonitorTest, ListenerCalled) {
  std::atomic<int> ticks{0};
  monitor_.setListener([&ticks](const ResourceSnapshot&) { ++ticks; });
  (void)monitor_.start();
  ASSERT_TRUE(waitFor([&ticks] { return ticks.load() >= 3; }));
  monitor_.stop();
}

/* ----------------------------- Forced Polls ----------------------------- */

/** @test snapshotNow with nothing cached and a failing source yields nothing. */
TEST_F(ResourceMonitorTest, SnapshotNowNothingCached) {
  source_->setFail(true);
  EXPECT_FALSE(monitor_.snapshotNow().has_value());
}

/** @test snapshotNow falls back to the cached snapshot tagged stale on timeout. */
TEST_F(ResourceMonitorTest, SnapshotNowStaleOnTimeout) {
  const auto FRESH = monitor_.snapshotNow();
  ASSERT_TRUE(FRESH.has_value());
  EXPECT_FALSE(FRESH->stale);

  source_->setDelay(300ms);
  const auto START = std::chrono::steady_clock::now();
  const auto STALE = monitor_.snapshotNow();
  EXPECT_LT(std::chrono::steady_clock::now() - START, 250ms);
  ASSERT_TRUE(STALE.has_value());
  EXPECT_TRUE(STALE->stale);
  EXPECT_EQ(STALE->sequence, FRESH->sequence);
}

/* ----------------------------- Failures ----------------------------- */

/** @test Consecutive failures raise one Monitoring alert; the loop keeps running. */
TEST_F(ResourceMonitorTest, DegradedAlertOnce) {
  auto sub = bus_.subscribe(EventFilter::alertsOnly());
  source_->setFail(true);
  (void)monitor_.start();
  ASSERT_TRUE(waitFor([this] { return source_->polls.load() >= 8; }));
  EXPECT_TRUE(monitor_.isRunning());

  const auto EV = sub.next(500ms);
  ASSERT_TRUE(EV.has_value());
  EXPECT_EQ(std::get<AlertRaised>(*EV).alert.kind, AlertKind::Monitoring);
  EXPECT_FALSE(sub.tryNext().has_value());
  EXPECT_EQ(alerts_.size(), 1U);

  const auto SESSION = monitor_.session();
  ASSERT_TRUE(SESSION.has_value());
  EXPECT_GE(SESSION->failedPolls, 3U);
  monitor_.stop();
}

/** @test Recovery re-arms the degraded alert. */
TEST_F(ResourceMonitorTest, DegradedReArms) {
  source_->setFail(true);
  (void)monitor_.start();
  ASSERT_TRUE(waitFor([this] { return alerts_.size() == 1; }));
  source_->setFail(false);
  ASSERT_TRUE(waitFor([this] { return monitor_.latest().has_value(); }));
  source_->setFail(true);
  ASSERT_TRUE(waitFor([this] { return alerts_.size() == 2; }));
  monitor_.stop();
}

/** @test A hung source is polled once; later ticks fail fast and spawn no threads. */
TEST_F(ResourceMonitorTest, HungSourceBoundedThreads) {
  MonitorConfig config = fastConfig();
  config.pollInterval = 10ms;
  config.snapshotTimeout = 10ms;
  ResourceMonitor hung(source_, bus_, alerts_, config);
  source_->setDelay(2000ms);

  const int BEFORE = processThreads();
  (void)hung.start();
  ASSERT_TRUE(waitFor([&hung] {
    const auto SESSION = hung.session();
    return SESSION && SESSION->failedPolls >= 15;
  }));

  EXPECT_EQ(source_->polls.load(), 1);
  if (BEFORE > 0) {
    // Loop thread plus the one poll still blocked in the source.
    EXPECT_LE(processThreads(), BEFORE + 2);
  }
  EXPECT_EQ(alerts_.size(), 1U);
  hung.stop();
}

/** @test A forced snapshot waits for an in-flight poll, then polls fresh. */
TEST_F(ResourceMonitorTest, ForcedSnapshotWaitsForInFlightPoll) {
  MonitorConfig config = fastConfig();
  config.snapshotTimeout = 500ms;
  ResourceMonitor monitor(source_, bus_, alerts_, config);
  source_->setDelay(50ms);

  std::thread first([&monitor] { (void)monitor.snapshotNow(); });
  ASSERT_TRUE(waitFor([this] { return source_->polls.load() == 1; }));

  const auto SECOND = monitor.snapshotNow();
  first.join();
  ASSERT_TRUE(SECOND.has_value());
  EXPECT_FALSE(SECOND->stale);
  EXPECT_EQ(source_->polls.load(), 2);
}
