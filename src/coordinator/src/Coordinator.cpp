/**
 * @file Coordinator.cpp
 * @brief Job lifecycle, policy application and engine callback dispatch.
 */

#include "src/coordinator/inc/Coordinator.hpp"
#include "src/coordinator/inc/HistoryExport.hpp"
#include "src/helpers/inc/Timeout.hpp"
#include "src/job/inc/Precheck.hpp"

#include <chrono>    // std::chrono::milliseconds
#include <exception> // std::exception
#include <utility>   // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace kiln {

namespace coordinator {

using kiln::events::Alert;
using kiln::events::AlertKind;
using kiln::events::AlertSeverity;
using kiln::job::EngineResult;
using kiln::job::Job;
using kiln::job::JobEvent;
using kiln::job::JobId;
using kiln::job::JobState;
using kiln::policy::DecisionKind;

namespace {

/// Longest the dispatcher sleeps before re-checking the stop deadline.
constexpr std::chrono::milliseconds DISPATCH_WAIT{25};

} // namespace

/* ----------------------------- Lifecycle ----------------------------- */

Coordinator::Coordinator(job::CodecEngine& engine,
                         std::shared_ptr<telemetry::TelemetrySource> telemetry,
                         std::shared_ptr<storage::FileStore> store, CoordinatorConfig config)
    : engine_(engine), store_(std::move(store)), config_(std::move(config)),
      bus_(config_.mailboxCapacity), alerts_(config_.alertRetention),
      monitor_(std::move(telemetry), bus_, alerts_, config_.monitor), policy_(config_.policy),
      history_(config_.jobHistoryCapacity), channel_(config_.eventChannelCapacity) {
  monitor_.setListener([this](const telemetry::ResourceSnapshot& snapshot) {
    if (!channel_.push(TickMsg{snapshot})) {
      spdlog::debug("[coordinator] tick #{} dropped, dispatcher closed", snapshot.sequence);
    }
  });
  dispatcher_ = std::thread([this] { dispatchLoop(); });
}

Coordinator::~Coordinator() {
  monitor_.stop();
  channel_.close();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }

  std::shared_ptr<job::EngineHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (active_ && !active_->terminal()) {
      spdlog::warn("[coordinator] shutting down with {}", active_->toString());
      handle = handle_;
    }
  }
  if (handle) {
    handle->stop();
  }
}

/* ----------------------------- Commit ----------------------------- */

void Coordinator::commit(std::unique_lock<std::mutex>& lock, const Commands& cmds) {
  std::vector<events::Event> staged;
  staged.swap(outbox_);

  // Taking the publish lock before releasing mtx_ keeps batches in staging order.
  std::unique_lock<std::mutex> publish(publishMtx_);
  lock.unlock();
  for (const events::Event& EVENT : staged) {
    bus_.publish(EVENT);
  }
  publish.unlock();

  for (const EngineCommand& CMD : cmds) {
    if (!CMD.handle) {
      continue;
    }
    try {
      switch (CMD.op) {
      case EngineCommand::Op::Stop:
        CMD.handle->stop();
        break;
      case EngineCommand::Op::Pause:
        CMD.handle->pause();
        break;
      case EngineCommand::Op::Resume:
        CMD.handle->resume();
        break;
      case EngineCommand::Op::Throttle:
        CMD.handle->setThrottle(true);
        break;
      case EngineCommand::Op::Unthrottle:
        CMD.handle->setThrottle(false);
        break;
      }
    } catch (const std::exception& e) {
      spdlog::error("[coordinator] engine command failed: {}", e.what());
    }
  }
}

/* ----------------------------- Locked helpers ----------------------------- */

std::optional<JobState> Coordinator::activeStateLocked() const {
  if (!active_) {
    return std::nullopt;
  }
  return active_->state();
}

bool Coordinator::transitionLocked(JobEvent event, const std::string& reason) {
  const job::TransitionResult RESULT = active_->apply(event, WallClock::now(), reason);
  if (!RESULT.ok()) {
    spdlog::warn("[coordinator] {}", RESULT.status.message);
    return false;
  }

  events::JobStateChanged changed{};
  changed.jobId = active_->id();
  changed.from = RESULT.from;
  changed.to = RESULT.to;
  changed.reason = reason;
  changed.at = WallClock::now();
  outbox_.emplace_back(std::move(changed));

  spdlog::info("[coordinator] job {} {} -> {}{}{}", active_->id(), job::toString(RESULT.from),
               job::toString(RESULT.to), reason.empty() ? "" : ": ", reason);

  if (active_->terminal()) {
    finalizeLocked();
  }
  return true;
}

void Coordinator::raiseAlertLocked(Alert alert) {
  const Alert STORED = alerts_.append(std::move(alert));
  spdlog::log(STORED.severity >= AlertSeverity::Error ? spdlog::level::warn : spdlog::level::info,
              "[coordinator] alert #{} {}", STORED.id, STORED.toString());
  outbox_.emplace_back(events::AlertRaised{STORED});
}

void Coordinator::beginStopLocked(Commands& cmds) {
  stopDeadline_ = SteadyClock::now() + config_.engineStopTimeout;
  cmds.push_back(EngineCommand{handle_, EngineCommand::Op::Stop});
}

void Coordinator::finalizeLocked() {
  switch (active_->state()) {
  case JobState::Completed:
    ++stats_.completed;
    stats_.totalProcessingSeconds += active_->processingSeconds();
    break;
  case JobState::Failed:
    ++stats_.failed;
    break;
  case JobState::Cancelled:
    ++stats_.cancelled;
    if (active_->forcedCancel()) {
      ++stats_.forcedCancels;
      ++leakedHandles_;
    }
    break;
  default:
    return;
  }

  history_.push(*active_);
  active_.reset();
  handle_.reset();
  stopDeadline_.reset();
  deferred_.clear();
}

/* ----------------------------- Job control ----------------------------- */

SubmitResult Coordinator::submit(const job::ConversionRequest& request) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (active_ && !active_->terminal()) {
    ++stats_.rejected;
    return SubmitResult{job::NO_JOB,
                        Status::failure(ErrorCode::AlreadyRunning,
                                        fmt::format("job {} is {}", active_->id(),
                                                    job::toString(active_->state())))};
  }

  const JobId ID = nextJobId_++;
  ++stats_.submitted;
  active_.emplace(ID, request, WallClock::now());
  spdlog::info("[coordinator] job {} submitted: {} -> {}", ID, request.input.path,
               request.output.path);
  transitionLocked(JobEvent::Start, {});
  commit(lock);

  (void)monitor_.start();

  // --- Prechecks (bounded) ---
  std::shared_ptr<storage::FileStore> store = store_;
  const double FACTOR = config_.storageSafetyFactor;
  const std::optional<Status> CHECK = helpers::timeout::runWithTimeout<Status>(
      [store, request, FACTOR] { return job::runPrechecks(request, *store, FACTOR); },
      config_.precheckTimeout);

  if (!CHECK || !CHECK->ok()) {
    const Status FAILURE =
        CHECK ? *CHECK
              : Status::failure(ErrorCode::TimeoutError,
                                fmt::format("precheck did not finish within {} ms",
                                            config_.precheckTimeout.count()));
    lock.lock();
    if (active_ && active_->id() == ID) {
      transitionLocked(JobEvent::EngineError, FAILURE.message);
    }
    commit(lock);
    return SubmitResult{ID, FAILURE};
  }

  // --- Engine start ---
  job::EngineRequest engineRequest{};
  engineRequest.jobId = ID;
  engineRequest.input = request.input;
  engineRequest.output = request.output;

  job::EngineStart start{};
  try {
    start = engine_.begin(engineRequest, *this);
  } catch (const std::exception& e) {
    start.status = Status::failure(ErrorCode::EngineError, e.what());
  }
  if (!start && start.status.ok()) {
    start.status = Status::failure(ErrorCode::EngineError, "engine returned no handle");
  }

  lock.lock();
  if (!active_ || active_->id() != ID) {
    commit(lock);
    return SubmitResult{ID, Status::failure(ErrorCode::InvalidTransition,
                                            fmt::format("job {} left Preparing", ID))};
  }

  if (!start) {
    const Status FAILURE = Status::failure(ErrorCode::EngineError, start.status.message);
    transitionLocked(JobEvent::EngineError,
                     fmt::format("engine failed to start: {}", FAILURE.message));
    commit(lock);
    return SubmitResult{ID, FAILURE};
  }

  handle_ = start.handle;
  transitionLocked(JobEvent::EngineReady, {});
  replayDeferredLocked();
  commit(lock);

  // Apply current conditions right away rather than waiting a poll interval.
  if (const std::optional<telemetry::ResourceSnapshot> LATEST = monitor_.latest()) {
    lock.lock();
    const policy::Evaluation EVAL =
        policy_.evaluate(*LATEST, activeStateLocked(), SteadyClock::now());
    lock.unlock();
    (void)applyEvaluation(EVAL);
  }

  return SubmitResult{ID, Status::success()};
}

Status Coordinator::cancel(JobId id) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!active_ || active_->id() != id || active_->terminal()) {
    return Status::failure(ErrorCode::NotFound, fmt::format("job {} is not active", id));
  }
  if (active_->state() == JobState::Cancelling) {
    return Status::success();
  }

  if (!job::nextState(active_->state(), JobEvent::CancelRequest)) {
    return Status::failure(ErrorCode::InvalidTransition,
                           fmt::format("job {} cannot be cancelled while {}", id,
                                       job::toString(active_->state())));
  }

  Commands cmds;
  transitionLocked(JobEvent::CancelRequest, "cancelled by caller");
  beginStopLocked(cmds);
  commit(lock, cmds);
  return Status::success();
}

Status Coordinator::pause(JobId id) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!active_ || active_->id() != id || active_->terminal()) {
    return Status::failure(ErrorCode::NotFound, fmt::format("job {} is not active", id));
  }
  if (active_->state() == JobState::Paused) {
    if (active_->holdForCaller()) {
      spdlog::info("[coordinator] job {} held paused by caller", id);
    }
    return Status::success();
  }
  if (!job::nextState(active_->state(), JobEvent::PauseRequest)) {
    return Status::failure(ErrorCode::InvalidTransition,
                           fmt::format("job {} cannot be paused while {}", id,
                                       job::toString(active_->state())));
  }

  Commands cmds;
  transitionLocked(JobEvent::PauseRequest, "paused by caller");
  cmds.push_back(EngineCommand{handle_, EngineCommand::Op::Pause});
  commit(lock, cmds);
  return Status::success();
}

Status Coordinator::resume(JobId id) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!active_ || active_->id() != id || active_->terminal()) {
    return Status::failure(ErrorCode::NotFound, fmt::format("job {} is not active", id));
  }
  if (!job::nextState(active_->state(), JobEvent::ResumeRequest)) {
    return Status::failure(ErrorCode::InvalidTransition,
                           fmt::format("job {} cannot be resumed while {}", id,
                                       job::toString(active_->state())));
  }

  Commands cmds;
  transitionLocked(JobEvent::ResumeRequest, "resumed by caller");
  cmds.push_back(EngineCommand{handle_, EngineCommand::Op::Resume});
  commit(lock, cmds);
  return Status::success();
}

SubmitResult Coordinator::retry(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (active_ && active_->id() == id) {
      return SubmitResult{job::NO_JOB,
                          Status::failure(ErrorCode::InvalidTransition,
                                          fmt::format("job {} is still {}", id,
                                                      job::toString(active_->state())))};
    }
  }

  const std::optional<Job> PREVIOUS =
      history_.findIf([id](const Job& entry) { return entry.id() == id; });
  if (!PREVIOUS) {
    return SubmitResult{job::NO_JOB, Status::failure(ErrorCode::NotFound,
                                                     fmt::format("job {} is not in history", id))};
  }
  if (PREVIOUS->state() == JobState::Completed) {
    return SubmitResult{job::NO_JOB,
                        Status::failure(ErrorCode::InvalidTransition,
                                        fmt::format("job {} completed; only failed or cancelled "
                                                    "jobs can be retried",
                                                    id))};
  }

  spdlog::info("[coordinator] retrying {} job {}", job::toString(PREVIOUS->state()), id);
  const SubmitResult RESULT = submit(PREVIOUS->request());
  if (RESULT.id != job::NO_JOB) {
    std::lock_guard<std::mutex> lock(mtx_);
    ++stats_.retried;
  }
  return RESULT;
}

/* ----------------------------- Engine callbacks ----------------------------- */

void Coordinator::onProgressEvent(JobId id, const job::ProgressEvent& event) {
  if (!channel_.push(ProgressMsg{id, event})) {
    spdlog::debug("[coordinator] progress for job {} dropped, dispatcher closed", id);
  }
}

void Coordinator::onEngineResult(JobId id, const EngineResult& result) {
  if (!channel_.push(ResultMsg{id, result})) {
    spdlog::warn("[coordinator] {} result for job {} dropped, dispatcher closed",
                 job::toString(result.kind), id);
  }
}

/* ----------------------------- Dispatcher ----------------------------- */

void Coordinator::dispatchLoop() {
  while (true) {
    std::optional<Message> msg = channel_.popFor(DISPATCH_WAIT);
    if (msg) {
      if (const auto* PROGRESS = std::get_if<ProgressMsg>(&*msg)) {
        handleProgress(*PROGRESS);
      } else if (const auto* RESULT = std::get_if<ResultMsg>(&*msg)) {
        handleResult(*RESULT);
      } else {
        handleTick(std::get<TickMsg>(*msg));
      }
    } else if (channel_.closed()) {
      break;
    }
    checkStopDeadline();
  }
}

void Coordinator::handleProgress(const ProgressMsg& msg) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (active_ && active_->id() == msg.id && active_->state() == JobState::Preparing) {
    deferred_.emplace_back(msg);
    return;
  }
  progressLocked(msg);
  commit(lock);
}

void Coordinator::handleResult(const ResultMsg& msg) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (active_ && active_->id() == msg.id && active_->state() == JobState::Preparing) {
    spdlog::debug("[coordinator] {} result for job {} held until it is running",
                  job::toString(msg.result.kind), msg.id);
    deferred_.emplace_back(msg);
    return;
  }
  resultLocked(msg);
  commit(lock);
}

void Coordinator::replayDeferredLocked() {
  std::vector<Message> pending;
  pending.swap(deferred_);
  for (const Message& MSG : pending) {
    if (const auto* PROGRESS = std::get_if<ProgressMsg>(&MSG)) {
      progressLocked(*PROGRESS);
    } else if (const auto* RESULT = std::get_if<ResultMsg>(&MSG)) {
      resultLocked(*RESULT);
    }
  }
}

void Coordinator::progressLocked(const ProgressMsg& msg) {
  if (!active_ || active_->id() != msg.id || !active_->updateProgress(msg.event)) {
    return;
  }

  events::ProgressUpdated update{};
  update.jobId = msg.id;
  update.progress = active_->progress();
  outbox_.emplace_back(std::move(update));

  const JobState STATE = active_->state();
  if (active_->progress().percent >= 100.0 &&
      (STATE == JobState::Running || STATE == JobState::Paused)) {
    transitionLocked(JobEvent::Progress100, {});
  }
}

void Coordinator::resultLocked(const ResultMsg& msg) {
  if (!active_ || active_->id() != msg.id) {
    spdlog::debug("[coordinator] {} result for inactive job {} ignored",
                  job::toString(msg.result.kind), msg.id);
    return;
  }

  const JobState STATE = active_->state();
  const EngineResult& RESULT = msg.result;

  if (STATE == JobState::Cancelling) {
    // Any terminal engine outcome acknowledges the stop request.
    transitionLocked(JobEvent::EngineStopped, {});
    return;
  }

  switch (RESULT.kind) {
  case EngineResult::Kind::Success:
    transitionLocked(JobEvent::Progress100, {});
    break;

  case EngineResult::Kind::Error:
  case EngineResult::Kind::Stopped: {
    const std::string REASON =
        (RESULT.kind == EngineResult::Kind::Error)
            ? fmt::format("engine error {}: {}", RESULT.code, RESULT.message)
            : std::string("engine stopped unexpectedly");
    if (transitionLocked(JobEvent::EngineError, REASON)) {
      Alert alert{};
      alert.severity = AlertSeverity::Error;
      alert.kind = AlertKind::Engine;
      alert.message = fmt::format("job {} failed: {}", msg.id, REASON);
      raiseAlertLocked(std::move(alert));
    }
    break;
  }
  }
}

void Coordinator::checkStopDeadline() {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!stopDeadline_ || SteadyClock::now() < *stopDeadline_) {
    return;
  }
  if (!active_ || active_->state() != JobState::Cancelling) {
    stopDeadline_.reset();
    return;
  }

  const JobId ID = active_->id();
  const std::string REASON = fmt::format("engine did not acknowledge stop within {} ms",
                                         config_.engineStopTimeout.count());
  spdlog::error("[coordinator] job {}: {}, forcing cancel and abandoning its engine handle", ID,
                REASON);
  transitionLocked(JobEvent::StopTimeout, REASON);

  Alert alert{};
  alert.severity = AlertSeverity::Error;
  alert.kind = AlertKind::Engine;
  alert.message = fmt::format("job {}: {}; engine handle leaked", ID, REASON);
  raiseAlertLocked(std::move(alert));
  commit(lock);
}

/* ----------------------------- Policy ----------------------------- */

void Coordinator::handleTick(const TickMsg& msg) {
  std::unique_lock<std::mutex> lock(mtx_);
  const policy::Evaluation EVAL =
      policy_.evaluate(msg.snapshot, activeStateLocked(), SteadyClock::now());
  lock.unlock();
  (void)applyEvaluation(EVAL);
}

bool Coordinator::onPolicyTick(const policy::Evaluation& evaluation) {
  return applyEvaluation(evaluation);
}

bool Coordinator::applyEvaluation(const policy::Evaluation& evaluation) {
  std::unique_lock<std::mutex> lock(mtx_);
  Commands cmds;
  const TickOutcome OUTCOME = applyLocked(evaluation, false, cmds);
  const JobId ACTIVE = active_ ? active_->id() : job::NO_JOB;
  commit(lock, cmds);

  if (OUTCOME == TickOutcome::ResumeCandidate) {
    revalidateResume(ACTIVE);
  }
  return OUTCOME != TickOutcome::Discarded;
}

Coordinator::TickOutcome Coordinator::applyLocked(const policy::Evaluation& evaluation,
                                                  bool revalidated, Commands& cmds) {
  if (lastAppliedSnapshot_ && evaluation.snapshotTimestamp < *lastAppliedSnapshot_) {
    spdlog::debug("[coordinator] decisions from snapshot #{} discarded (stale)",
                  evaluation.snapshotSequence);
    return TickOutcome::Discarded;
  }
  lastAppliedSnapshot_ = evaluation.snapshotTimestamp;

  for (const Alert& ALERT : evaluation.alerts) {
    raiseAlertLocked(ALERT);
  }

  if (!active_ || active_->terminal()) {
    return TickOutcome::Applied;
  }

  const policy::Decision DECISION = evaluation.primary();
  const JobState STATE = active_->state();
  if (STATE != JobState::Running && STATE != JobState::Paused) {
    return TickOutcome::Applied;
  }

  switch (DECISION.kind) {
  case DecisionKind::Abort:
    if (transitionLocked(JobEvent::AbortDecision,
                         fmt::format("aborted by policy: {}", DECISION.reason))) {
      beginStopLocked(cmds);
    }
    return TickOutcome::Applied;

  case DecisionKind::Pause:
    if (STATE == JobState::Running && transitionLocked(JobEvent::PauseDecision, DECISION.reason)) {
      cmds.push_back(EngineCommand{handle_, EngineCommand::Op::Pause});
    }
    return TickOutcome::Applied;

  case DecisionKind::Throttle:
  case DecisionKind::Continue:
  case DecisionKind::Alert:
    break;
  }

  if (STATE == JobState::Paused) {
    if (active_->heldByCaller()) {
      return TickOutcome::Applied;
    }
    if (!revalidated) {
      return TickOutcome::ResumeCandidate;
    }
    if (!transitionLocked(JobEvent::ResumeDecision, "resources recovered")) {
      return TickOutcome::Applied;
    }
    cmds.push_back(EngineCommand{handle_, EngineCommand::Op::Resume});
  }

  const bool WANT_THROTTLE = (DECISION.kind == DecisionKind::Throttle);
  if (WANT_THROTTLE != active_->throttled()) {
    active_->setThrottled(WANT_THROTTLE);
    cmds.push_back(EngineCommand{handle_, WANT_THROTTLE ? EngineCommand::Op::Throttle
                                                        : EngineCommand::Op::Unthrottle});
    spdlog::info("[coordinator] job {} {}{}", active_->id(),
                 WANT_THROTTLE ? "throttled: " : "unthrottled",
                 WANT_THROTTLE ? DECISION.reason : std::string());
  }
  return TickOutcome::Applied;
}

void Coordinator::revalidateResume(JobId id) {
  const std::optional<telemetry::ResourceSnapshot> FRESH = monitor_.snapshotNow();

  std::unique_lock<std::mutex> lock(mtx_);
  if (!active_ || active_->id() != id || active_->state() != JobState::Paused) {
    return;
  }
  if (!FRESH || FRESH->stale) {
    spdlog::warn("[coordinator] job {} stays paused: no fresh snapshot to revalidate", id);
    return;
  }

  const policy::Evaluation EVAL =
      policy_.evaluate(*FRESH, JobState::Paused, SteadyClock::now());
  Commands cmds;
  (void)applyLocked(EVAL, true, cmds);
  commit(lock, cmds);
}

/* ----------------------------- Queries ----------------------------- */

std::optional<Job> Coordinator::getActiveJob() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return active_;
}

std::vector<Job> Coordinator::getHistory(std::size_t limit) const {
  return history_.latest(limit);
}

std::optional<Job> Coordinator::getJob(JobId id) const {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (active_ && active_->id() == id) {
      return active_;
    }
  }
  return history_.findIf([id](const Job& entry) { return entry.id() == id; });
}

ConversionStats Coordinator::stats() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return stats_;
}

void Coordinator::resetStats() {
  std::lock_guard<std::mutex> lock(mtx_);
  stats_ = ConversionStats{};
  spdlog::info("[coordinator] statistics reset");
}

std::string Coordinator::exportHistoryJson() const {
  return jobsToJson(history_.latest(history_.capacity()));
}

void Coordinator::clearHistory() {
  history_.clear();
  spdlog::info("[coordinator] job history cleared");
}

std::uint64_t Coordinator::leakedHandles() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return leakedHandles_;
}

/* ----------------------------- Alerts & thresholds ----------------------------- */

std::vector<Alert> Coordinator::alerts(std::size_t limit) const { return alerts_.latest(limit); }

std::vector<Alert> Coordinator::activeAlerts() const { return alerts_.active(); }

Status Coordinator::acknowledgeAlert(events::AlertId id) {
  return alerts_.acknowledge(id, WallClock::now());
}

void Coordinator::setThreshold(const policy::Threshold& threshold) {
  std::lock_guard<std::mutex> lock(mtx_);
  policy_.setThreshold(threshold);
}

Status Coordinator::clearThreshold(policy::ThresholdKind kind) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!policy_.clearThreshold(kind)) {
    return Status::failure(ErrorCode::NotFound,
                           fmt::format("no {} threshold installed", policy::toString(kind)));
  }
  return Status::success();
}

std::vector<policy::Threshold> Coordinator::thresholds() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return policy_.thresholds();
}

} // namespace coordinator

} // namespace kiln
