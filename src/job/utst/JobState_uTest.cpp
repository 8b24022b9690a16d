/**
 * @file JobState_uTest.cpp
 * @brief Unit tests for the kiln::job transition table.
 */

#include "src/job/inc/JobState.hpp"

#include <gtest/gtest.h>

#include <cstring>

using kiln::job::isTerminal;
using kiln::job::JobEvent;
using kiln::job::JobState;
using kiln::job::nextState;

namespace {

constexpr JobState ALL_STATES[] = {JobState::Pending,    JobState::Preparing, JobState::Running,
                                   JobState::Paused,     JobState::Cancelling, JobState::Completed,
                                   JobState::Failed,     JobState::Cancelled};

constexpr JobEvent ALL_EVENTS[] = {
    JobEvent::Start,         JobEvent::EngineReady,   JobEvent::PauseDecision,
    JobEvent::ResumeDecision, JobEvent::Progress100,  JobEvent::AbortDecision,
    JobEvent::CancelRequest, JobEvent::EngineStopped, JobEvent::EngineError,
    JobEvent::StopTimeout,   JobEvent::PauseRequest,  JobEvent::ResumeRequest};

} // namespace

/* ----------------------------- Table Tests ----------------------------- */

/** @test Listed transitions reach their target. */
TEST(JobStateTest, ListedTransitions) {
  EXPECT_EQ(nextState(JobState::Pending, JobEvent::Start), JobState::Preparing);
  EXPECT_EQ(nextState(JobState::Preparing, JobEvent::EngineReady), JobState::Running);
  EXPECT_EQ(nextState(JobState::Preparing, JobEvent::EngineError), JobState::Failed);
  EXPECT_EQ(nextState(JobState::Running, JobEvent::PauseDecision), JobState::Paused);
  EXPECT_EQ(nextState(JobState::Paused, JobEvent::ResumeDecision), JobState::Running);
  EXPECT_EQ(nextState(JobState::Running, JobEvent::Progress100), JobState::Completed);
  EXPECT_EQ(nextState(JobState::Running, JobEvent::AbortDecision), JobState::Cancelling);
  EXPECT_EQ(nextState(JobState::Running, JobEvent::CancelRequest), JobState::Cancelling);
  EXPECT_EQ(nextState(JobState::Running, JobEvent::EngineError), JobState::Failed);
  EXPECT_EQ(nextState(JobState::Paused, JobEvent::CancelRequest), JobState::Cancelling);
  EXPECT_EQ(nextState(JobState::Paused, JobEvent::AbortDecision), JobState::Cancelling);
  EXPECT_EQ(nextState(JobState::Cancelling, JobEvent::EngineStopped), JobState::Cancelled);
  EXPECT_EQ(nextState(JobState::Cancelling, JobEvent::StopTimeout), JobState::Cancelled);
}

/** @test Caller pause and resume only move between Running and Paused. */
TEST(JobStateTest, CallerPauseResume) {
  EXPECT_EQ(nextState(JobState::Running, JobEvent::PauseRequest), JobState::Paused);
  EXPECT_EQ(nextState(JobState::Paused, JobEvent::ResumeRequest), JobState::Running);
  EXPECT_FALSE(nextState(JobState::Preparing, JobEvent::PauseRequest).has_value());
  EXPECT_FALSE(nextState(JobState::Paused, JobEvent::PauseRequest).has_value());
  EXPECT_FALSE(nextState(JobState::Running, JobEvent::ResumeRequest).has_value());
  EXPECT_FALSE(nextState(JobState::Cancelling, JobEvent::ResumeRequest).has_value());
  EXPECT_STREQ(kiln::job::toString(JobEvent::PauseRequest), "pause_request");
}

/** @test Nothing leaves a terminal state. */
TEST(JobStateTest, TerminalStatesAbsorb) {
  for (JobState state : ALL_STATES) {
    if (!isTerminal(state)) {
      continue;
    }
    for (JobEvent event : ALL_EVENTS) {
      EXPECT_FALSE(nextState(state, event).has_value())
          << kiln::job::toString(state) << " + " << kiln::job::toString(event);
    }
  }
}

/** @test Unlisted transitions are refused. */
TEST(JobStateTest, UnlistedRefused) {
  EXPECT_FALSE(nextState(JobState::Pending, JobEvent::EngineReady).has_value());
  EXPECT_FALSE(nextState(JobState::Preparing, JobEvent::PauseDecision).has_value());
  EXPECT_FALSE(nextState(JobState::Running, JobEvent::ResumeDecision).has_value());
  EXPECT_FALSE(nextState(JobState::Cancelling, JobEvent::ResumeDecision).has_value());
  EXPECT_FALSE(nextState(JobState::Cancelling, JobEvent::Progress100).has_value());
}

/** @test Exactly three states are terminal. */
TEST(JobStateTest, TerminalSet) {
  int terminal = 0;
  for (JobState state : ALL_STATES) {
    terminal += isTerminal(state) ? 1 : 0;
  }
  EXPECT_EQ(terminal, 3);
  EXPECT_TRUE(isTerminal(JobState::Completed));
  EXPECT_TRUE(isTerminal(JobState::Failed));
  EXPECT_TRUE(isTerminal(JobState::Cancelled));
}

/** @test Every state and event has a non-empty name. */
TEST(JobStateTest, Names) {
  for (JobState state : ALL_STATES) {
    EXPECT_GT(std::strlen(kiln::job::toString(state)), 0U);
  }
  EXPECT_STREQ(kiln::job::toString(JobEvent::Progress100), "progress_100");
}
