/**
 * @file Job_uTest.cpp
 * @brief Unit tests for kiln::job::Job.
 */

#include "src/job/inc/Job.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using kiln::ErrorCode;
using kiln::WallClock;
using kiln::WallTime;
using kiln::job::ConversionRequest;
using kiln::job::Job;
using kiln::job::JobEvent;
using kiln::job::JobProgress;
using kiln::job::JobState;
using kiln::job::TransitionResult;

namespace {

ConversionRequest makeRequest() {
  ConversionRequest req{};
  req.input.path = "/media/in.mov";
  req.input.sizeBytes = 1000;
  req.output.path = "/media/out.mp4";
  return req;
}

JobProgress pct(double percent) {
  JobProgress p{};
  p.percent = percent;
  p.phase = "encoding";
  return p;
}

} // namespace

class JobTest : public ::testing::Test {
protected:
  WallTime t0_{WallClock::now()};
  Job job_{1, makeRequest(), t0_};

  void runJob() {
    ASSERT_TRUE(job_.apply(JobEvent::Start, t0_ + std::chrono::seconds(1)).ok());
    ASSERT_TRUE(job_.apply(JobEvent::EngineReady, t0_ + std::chrono::seconds(2)).ok());
  }
};

/* ----------------------------- Lifecycle ----------------------------- */

/** @test New job is Pending with only createdAt set. */
TEST_F(JobTest, InitialState) {
  EXPECT_EQ(job_.id(), 1U);
  EXPECT_EQ(job_.state(), JobState::Pending);
  EXPECT_EQ(job_.createdAt(), t0_);
  EXPECT_FALSE(job_.startedAt().has_value());
  EXPECT_FALSE(job_.endedAt().has_value());
  EXPECT_FALSE(job_.failureReason().has_value());
}

/** @test startedAt is stamped on entering Preparing. */
TEST_F(JobTest, StartStampsStartedAt) {
  runJob();
  ASSERT_TRUE(job_.startedAt().has_value());
  EXPECT_EQ(*job_.startedAt(), t0_ + std::chrono::seconds(1));
  EXPECT_EQ(job_.state(), JobState::Running);
}

/** @test Failure records reason and endedAt. */
TEST_F(JobTest, FailureRecordsReason) {
  runJob();
  const TransitionResult R =
      job_.apply(JobEvent::EngineError, t0_ + std::chrono::seconds(5), "codec crashed");
  ASSERT_TRUE(R.ok());
  EXPECT_EQ(R.from, JobState::Running);
  EXPECT_EQ(R.to, JobState::Failed);
  EXPECT_EQ(job_.failureReason().value_or(""), "codec crashed");
  ASSERT_TRUE(job_.endedAt().has_value());
  EXPECT_DOUBLE_EQ(job_.processingSeconds(), 4.0);
}

/** @test Terminal jobs refuse every further transition and keep their timestamps. */
TEST_F(JobTest, TerminalImmutability) {
  runJob();
  ASSERT_TRUE(job_.apply(JobEvent::Progress100, t0_ + std::chrono::seconds(3)).ok());
  const WallTime ENDED = *job_.endedAt();

  const TransitionResult R = job_.apply(JobEvent::CancelRequest, t0_ + std::chrono::seconds(9));
  EXPECT_FALSE(R.ok());
  EXPECT_EQ(R.status.code, ErrorCode::InvalidTransition);
  EXPECT_EQ(R.to, JobState::Completed);
  EXPECT_EQ(job_.state(), JobState::Completed);
  EXPECT_EQ(*job_.endedAt(), ENDED);
  EXPECT_FALSE(job_.updateProgress(pct(10.0)));
  EXPECT_DOUBLE_EQ(job_.progress().percent, 100.0);
}

/** @test Cancel path keeps the first reason; stop timeout marks the cancel forced. */
TEST_F(JobTest, ForcedCancel) {
  runJob();
  ASSERT_TRUE(job_.apply(JobEvent::CancelRequest, t0_, "cancelled by caller").ok());
  EXPECT_EQ(job_.cancelReason().value_or(""), "cancelled by caller");
  ASSERT_TRUE(job_.apply(JobEvent::StopTimeout, t0_ + std::chrono::seconds(10)).ok());
  EXPECT_EQ(job_.state(), JobState::Cancelled);
  EXPECT_TRUE(job_.forcedCancel());
  EXPECT_FALSE(job_.failureReason().has_value());
}

/* ----------------------------- Progress ----------------------------- */

/** @test Percent never decreases and is clamped to [0, 100]. */
TEST_F(JobTest, ProgressMonotonicAndClamped) {
  runJob();
  EXPECT_TRUE(job_.updateProgress(pct(40.0)));
  EXPECT_TRUE(job_.updateProgress(pct(25.0)));
  EXPECT_DOUBLE_EQ(job_.progress().percent, 40.0);
  EXPECT_TRUE(job_.updateProgress(pct(250.0)));
  EXPECT_DOUBLE_EQ(job_.progress().percent, 100.0);
  EXPECT_TRUE(job_.updateProgress(pct(-5.0)));
  EXPECT_DOUBLE_EQ(job_.progress().percent, 100.0);
  EXPECT_EQ(job_.progress().phase, "encoding");
}

/** @test Throttle flag clears on reaching a terminal state. */
TEST_F(JobTest, ThrottleClearedWhenTerminal) {
  runJob();
  job_.setThrottled(true);
  EXPECT_TRUE(job_.throttled());
  EXPECT_NE(job_.toString().find("[throttled]"), std::string::npos);
  ASSERT_TRUE(job_.apply(JobEvent::Progress100, t0_).ok());
  EXPECT_FALSE(job_.throttled());
}

/* ----------------------------- Caller Hold ----------------------------- */

/** @test A caller pause holds the job until it runs again. */
TEST_F(JobTest, CallerHold) {
  runJob();
  EXPECT_FALSE(job_.holdForCaller());

  ASSERT_TRUE(job_.apply(JobEvent::PauseRequest, t0_).ok());
  EXPECT_EQ(job_.state(), JobState::Paused);
  EXPECT_TRUE(job_.heldByCaller());

  ASSERT_TRUE(job_.apply(JobEvent::ResumeRequest, t0_).ok());
  EXPECT_EQ(job_.state(), JobState::Running);
  EXPECT_FALSE(job_.heldByCaller());

  // A policy pause is not a hold until the caller claims it.
  ASSERT_TRUE(job_.apply(JobEvent::PauseDecision, t0_).ok());
  EXPECT_FALSE(job_.heldByCaller());
  EXPECT_TRUE(job_.holdForCaller());
  EXPECT_TRUE(job_.heldByCaller());
  ASSERT_TRUE(job_.apply(JobEvent::CancelRequest, t0_, "cancelled by caller").ok());
  EXPECT_FALSE(job_.heldByCaller());
}
