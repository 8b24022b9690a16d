/**
 * @file JobState.cpp
 * @brief Job state names and transition table.
 */

#include "src/job/inc/JobState.hpp"

namespace kiln {

namespace job {

const char* toString(JobState state) noexcept {
  switch (state) {
  case JobState::Pending:
    return "pending";
  case JobState::Preparing:
    return "preparing";
  case JobState::Running:
    return "running";
  case JobState::Paused:
    return "paused";
  case JobState::Cancelling:
    return "cancelling";
  case JobState::Completed:
    return "completed";
  case JobState::Failed:
    return "failed";
  case JobState::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

const char* toString(JobEvent event) noexcept {
  switch (event) {
  case JobEvent::Start:
    return "start";
  case JobEvent::EngineReady:
    return "engine_ready";
  case JobEvent::PauseDecision:
    return "pause_decision";
  case JobEvent::ResumeDecision:
    return "resume_decision";
  case JobEvent::Progress100:
    return "progress_100";
  case JobEvent::AbortDecision:
    return "abort_decision";
  case JobEvent::CancelRequest:
    return "cancel_request";
  case JobEvent::EngineStopped:
    return "engine_stopped";
  case JobEvent::EngineError:
    return "engine_error";
  case JobEvent::StopTimeout:
    return "stop_timeout";
  case JobEvent::PauseRequest:
    return "pause_request";
  case JobEvent::ResumeRequest:
    return "resume_request";
  }
  return "unknown";
}

std::optional<JobState> nextState(JobState from, JobEvent event) noexcept {
  switch (from) {
  case JobState::Pending:
    if (event == JobEvent::Start) {
      return JobState::Preparing;
    }
    break;

  case JobState::Preparing:
    if (event == JobEvent::EngineReady) {
      return JobState::Running;
    }
    if (event == JobEvent::EngineError) {
      return JobState::Failed;
    }
    break;

  case JobState::Running:
    switch (event) {
    case JobEvent::PauseDecision:
    case JobEvent::PauseRequest:
      return JobState::Paused;
    case JobEvent::Progress100:
      return JobState::Completed;
    case JobEvent::AbortDecision:
    case JobEvent::CancelRequest:
      return JobState::Cancelling;
    case JobEvent::EngineError:
      return JobState::Failed;
    default:
      break;
    }
    break;

  case JobState::Paused:
    switch (event) {
    case JobEvent::ResumeDecision:
    case JobEvent::ResumeRequest:
      return JobState::Running;
    case JobEvent::AbortDecision:
    case JobEvent::CancelRequest:
      return JobState::Cancelling;
    case JobEvent::EngineError:
      return JobState::Failed;
    case JobEvent::Progress100:
      return JobState::Completed;
    default:
      break;
    }
    break;

  case JobState::Cancelling:
    if (event == JobEvent::EngineStopped || event == JobEvent::StopTimeout) {
      return JobState::Cancelled;
    }
    break;

  case JobState::Completed:
  case JobState::Failed:
  case JobState::Cancelled:
    break;
  }
  return std::nullopt;
}

} // namespace job

} // namespace kiln
