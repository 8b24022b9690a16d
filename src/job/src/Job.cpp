/**
 * @file Job.cpp
 * @brief Job state machine application and progress merging.
 */

#include "src/job/inc/Job.hpp"

#include <chrono>  // std::chrono::duration
#include <utility> // std::move

#include <fmt/core.h>

namespace kiln {

namespace job {

Job::Job(JobId id, ConversionRequest request, WallTime createdAt)
    : id_(id), request_(std::move(request)), createdAt_(createdAt) {}

TransitionResult Job::apply(JobEvent event, WallTime now, const std::string& reason) {
  TransitionResult result{};
  result.from = state_;
  result.to = state_;

  const std::optional<JobState> NEXT = nextState(state_, event);
  if (!NEXT) {
    result.status = Status::failure(
        ErrorCode::InvalidTransition,
        fmt::format("job {}: {} not allowed in state {}", id_, job::toString(event),
                    job::toString(state_)));
    return result;
  }

  state_ = *NEXT;
  result.to = state_;

  if (event == JobEvent::PauseRequest) {
    heldByCaller_ = true;
  } else if (state_ != JobState::Paused) {
    heldByCaller_ = false;
  }

  switch (state_) {
  case JobState::Preparing:
    if (!startedAt_) {
      startedAt_ = now;
    }
    break;
  case JobState::Cancelling:
    if (!cancelReason_) {
      cancelReason_ = reason;
    }
    break;
  case JobState::Failed:
    failureReason_ = reason;
    break;
  case JobState::Completed:
    progress_.percent = 100.0;
    progress_.etaSeconds = 0.0;
    break;
  case JobState::Cancelled:
    forcedCancel_ = (event == JobEvent::StopTimeout);
    break;
  default:
    break;
  }

  if (isTerminal(state_)) {
    if (!endedAt_) {
      endedAt_ = now;
    }
    throttled_ = false;
  }

  return result;
}

bool Job::updateProgress(const JobProgress& update) {
  if (terminal()) {
    return false;
  }

  double pct = update.percent;
  if (!(pct >= 0.0)) {
    pct = 0.0;
  } else if (pct > 100.0) {
    pct = 100.0;
  }
  if (pct > progress_.percent) {
    progress_.percent = pct;
  }

  if (!update.phase.empty()) {
    progress_.phase = update.phase;
  }
  if (update.processedUnits > progress_.processedUnits) {
    progress_.processedUnits = update.processedUnits;
  }
  if (update.totalUnits != 0) {
    progress_.totalUnits = update.totalUnits;
  }
  progress_.etaSeconds = update.etaSeconds;
  return true;
}

bool Job::holdForCaller() noexcept {
  if (state_ != JobState::Paused) {
    return false;
  }
  heldByCaller_ = true;
  return true;
}

void Job::setThrottled(bool throttled) noexcept {
  if (!terminal()) {
    throttled_ = throttled;
  }
}

double Job::processingSeconds() const noexcept {
  if (!startedAt_ || !endedAt_) {
    return 0.0;
  }
  const std::chrono::duration<double> ELAPSED = *endedAt_ - *startedAt_;
  return ELAPSED.count() < 0.0 ? 0.0 : ELAPSED.count();
}

std::string Job::toString() const {
  std::string out = fmt::format("job #{} {} {:.1f}% {} -> {}", id_, job::toString(state_),
                                progress_.percent, request_.input.path, request_.output.path);
  if (throttled_) {
    out += " [throttled]";
  }
  if (failureReason_) {
    out += fmt::format(" ({})", *failureReason_);
  } else if (cancelReason_) {
    out += fmt::format(" ({}{})", *cancelReason_, forcedCancel_ ? ", forced" : "");
  }
  return out;
}

} // namespace job

} // namespace kiln
