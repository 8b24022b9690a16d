/**
 * @file PolicyEngine_uTest.cpp
 * @brief Unit tests for kiln::policy::PolicyEngine.
 */

#include "src/policy/inc/PolicyEngine.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>

using kiln::SteadyClock;
using kiln::SteadyTime;
using kiln::events::AlertKind;
using kiln::events::AlertSeverity;
using kiln::job::JobState;
using kiln::policy::Comparator;
using kiln::policy::Decision;
using kiln::policy::DecisionKind;
using kiln::policy::Evaluation;
using kiln::policy::PolicyConfig;
using kiln::policy::PolicyEngine;
using kiln::policy::Threshold;
using kiln::policy::ThresholdKind;
using kiln::telemetry::ResourceSnapshot;
using kiln::telemetry::ThermalState;

namespace {

constexpr std::uint64_t GIB = 1024ULL * 1024ULL * 1024ULL;

ResourceSnapshot healthySnapshot() {
  ResourceSnapshot snap{};
  snap.sequence = 1;
  snap.timestamp = SteadyClock::now();
  snap.thermalState = ThermalState::Nominal;
  snap.batteryLevel = 0.9;
  snap.isCharging = false;
  snap.availableMemoryBytes = 4 * GIB;
  snap.availableStorageBytes = 64 * GIB;
  return snap;
}

} // namespace

class PolicyEngineTest : public ::testing::Test {
protected:
  PolicyEngine engine_{};
  ResourceSnapshot snap_{healthySnapshot()};
  SteadyTime now_{SteadyClock::now()};
  std::optional<JobState> running_{JobState::Running};

  Evaluation eval() { return engine_.evaluate(snap_, running_, now_); }
};

/* ----------------------------- Decisions ----------------------------- */

/** @test Healthy device yields Continue and no alerts. */
TEST_F(PolicyEngineTest, HealthyContinues) {
  const Evaluation E = eval();
  EXPECT_TRUE(E.decisions.empty());
  EXPECT_TRUE(E.alerts.empty());
  EXPECT_EQ(E.primary().kind, DecisionKind::Continue);
}

/** @test Thermal critical plus 5% battery gives Abort first, Pause second. */
TEST_F(PolicyEngineTest, PriorityThermalOverBattery) {
  snap_.thermalState = ThermalState::Critical;
  snap_.batteryLevel = 0.05;
  const Evaluation E = eval();
  ASSERT_EQ(E.decisions.size(), 2U);
  EXPECT_EQ(E.primary().kind, DecisionKind::Abort);
  EXPECT_EQ(E.primary().source, ThresholdKind::ThermalCeiling);
  EXPECT_EQ(E.decisions[1].kind, DecisionKind::Pause);
  EXPECT_EQ(E.alerts.size(), 2U);
}

/** @test Serious thermal throttles; Emergency aborts. */
TEST_F(PolicyEngineTest, ThermalBands) {
  snap_.thermalState = ThermalState::Serious;
  EXPECT_EQ(eval().primary().kind, DecisionKind::Throttle);
  snap_.thermalState = ThermalState::Emergency;
  EXPECT_EQ(eval().primary().kind, DecisionKind::Abort);
  snap_.thermalState = ThermalState::Fair;
  EXPECT_EQ(eval().primary().kind, DecisionKind::Continue);
}

/** @test Low battery pauses only when not charging. */
TEST_F(PolicyEngineTest, BatteryRequiresDischarging) {
  snap_.batteryLevel = 0.10;
  EXPECT_EQ(eval().primary().kind, DecisionKind::Pause);
  snap_.isCharging = true;
  EXPECT_EQ(eval().primary().kind, DecisionKind::Continue);
}

/** @test Battery pause outranks storage abort (fixed kind order). */
TEST_F(PolicyEngineTest, BatteryBeforeStorage) {
  snap_.batteryLevel = 0.10;
  snap_.availableStorageBytes = 100ULL * 1024ULL * 1024ULL;
  const Evaluation E = eval();
  ASSERT_EQ(E.decisions.size(), 2U);
  EXPECT_EQ(E.primary().kind, DecisionKind::Pause);
  EXPECT_EQ(E.decisions[1].kind, DecisionKind::Abort);
}

/** @test Low memory only alerts. */
TEST_F(PolicyEngineTest, MemoryAlertOnly) {
  snap_.availableMemoryBytes = 64ULL * 1024ULL * 1024ULL;
  const Evaluation E = eval();
  EXPECT_EQ(E.primary().kind, DecisionKind::Alert);
  ASSERT_EQ(E.alerts.size(), 1U);
  EXPECT_EQ(E.alerts[0].kind, AlertKind::Memory);
}

/** @test Without an active job, job decisions are downgraded to Alert. */
TEST_F(PolicyEngineTest, NoJobDowngrades) {
  snap_.thermalState = ThermalState::Critical;
  running_ = std::nullopt;
  Evaluation e = eval();
  EXPECT_EQ(e.primary().kind, DecisionKind::Alert);
  EXPECT_TRUE(e.primary().downgraded);
  EXPECT_EQ(e.alerts.size(), 1U);

  engine_.resetAlertWindow();
  running_ = JobState::Completed;
  e = eval();
  EXPECT_EQ(e.primary().kind, DecisionKind::Alert);
}

/* ----------------------------- De-duplication ----------------------------- */

/** @test Repeated condition alerts once per cooldown. */
TEST_F(PolicyEngineTest, DedupWithinCooldown) {
  snap_.batteryLevel = 0.10;
  EXPECT_EQ(eval().alerts.size(), 1U);
  now_ += std::chrono::seconds(10);
  const Evaluation SECOND = eval();
  EXPECT_EQ(SECOND.alerts.size(), 0U);
  EXPECT_EQ(SECOND.primary().kind, DecisionKind::Pause);
  now_ += std::chrono::seconds(60);
  EXPECT_EQ(eval().alerts.size(), 1U);
}

/** @test Escalation re-emits inside the cooldown. */
TEST_F(PolicyEngineTest, EscalationReemits) {
  snap_.thermalState = ThermalState::Serious;
  ASSERT_EQ(eval().alerts.size(), 1U);
  now_ += std::chrono::seconds(1);
  snap_.thermalState = ThermalState::Critical;
  const Evaluation E = eval();
  ASSERT_EQ(E.alerts.size(), 1U);
  EXPECT_EQ(E.alerts[0].severity, AlertSeverity::Critical);
}

/** @test Clearing the condition resets the window. */
TEST_F(PolicyEngineTest, ClearResetsWindow) {
  snap_.availableMemoryBytes = 1024;
  ASSERT_EQ(eval().alerts.size(), 1U);
  snap_.availableMemoryBytes = 4 * GIB;
  EXPECT_TRUE(eval().alerts.empty());
  snap_.availableMemoryBytes = 1024;
  EXPECT_EQ(eval().alerts.size(), 1U);
}

/* ----------------------------- Thresholds ----------------------------- */

/** @test set/clear take effect on the next evaluation. */
TEST_F(PolicyEngineTest, SetAndClearThreshold) {
  snap_.batteryLevel = 0.30;
  EXPECT_EQ(eval().primary().kind, DecisionKind::Continue);

  engine_.setThreshold(Threshold{ThresholdKind::BatteryMinimum, Comparator::LessEqual, 0.30,
                                 DecisionKind::Pause, AlertSeverity::Warning});
  EXPECT_EQ(eval().primary().kind, DecisionKind::Pause);

  EXPECT_TRUE(engine_.clearThreshold(ThresholdKind::BatteryMinimum));
  EXPECT_FALSE(engine_.clearThreshold(ThresholdKind::BatteryMinimum));
  EXPECT_FALSE(engine_.threshold(ThresholdKind::BatteryMinimum).has_value());
  EXPECT_EQ(eval().primary().kind, DecisionKind::Continue);
  EXPECT_EQ(engine_.thresholds().size(), 4U);
}

/** @test Thresholds are listed in priority order and reflect the config. */
TEST(PolicyConfigTest, DefaultsFromConfig) {
  PolicyConfig config{};
  config.batteryMinimum = 0.25;
  PolicyEngine engine{config};
  const auto LIST = engine.thresholds();
  ASSERT_EQ(LIST.size(), 5U);
  EXPECT_EQ(LIST[0].kind, ThresholdKind::ThermalCeiling);
  EXPECT_EQ(LIST[4].kind, ThresholdKind::MemoryMinimum);
  EXPECT_DOUBLE_EQ(LIST[2].limit, 0.25);
  EXPECT_EQ(LIST[3].decision, DecisionKind::Abort);
}

/** @test Every comparator behaves as its symbol. */
TEST(ComparatorTest, Semantics) {
  using kiln::policy::compare;
  EXPECT_TRUE(compare(1.0, Comparator::Less, 2.0));
  EXPECT_FALSE(compare(2.0, Comparator::Less, 2.0));
  EXPECT_TRUE(compare(2.0, Comparator::LessEqual, 2.0));
  EXPECT_TRUE(compare(3.0, Comparator::Greater, 2.0));
  EXPECT_TRUE(compare(2.0, Comparator::GreaterEqual, 2.0));
  EXPECT_TRUE(compare(2.0, Comparator::Equal, 2.0));
  EXPECT_FALSE(compare(2.5, Comparator::Equal, 2.0));
}
