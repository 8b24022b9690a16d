#ifndef KILN_COORDINATOR_COORDINATOR_HPP
#define KILN_COORDINATOR_COORDINATOR_HPP
/**
 * @file Coordinator.hpp
 * @brief Runs at most one conversion job and keeps it within device limits.
 *
 * The coordinator owns the event bus, alert log, resource monitor and
 * policy engine. Engine callbacks and monitor ticks are queued on a bounded
 * channel and applied, in arrival order, by a single dispatcher thread.
 *
 * Engine callbacks that arrive while the job is still Preparing are held
 * and applied, in order, right after it enters Running.
 *
 * Locking:
 *  - One mutex guards the active job, its engine handle, the policy engine
 *    and the last-applied snapshot time.
 *  - Events are staged while that mutex is held and published afterwards,
 *    in staging order, under a separate publish mutex.
 *  - Engine handle commands run with no coordinator lock held.
 *
 * @note Push handlers on eventBus() run while the publish mutex is held and
 *       must not call mutating coordinator operations.
 * @note Destroy only once the engine has stopped calling back.
 */

#include "src/common/inc/Clock.hpp"
#include "src/common/inc/Status.hpp"
#include "src/coordinator/inc/ConversionStats.hpp"
#include "src/coordinator/inc/CoordinatorConfig.hpp"
#include "src/events/inc/Alert.hpp"
#include "src/events/inc/EventBus.hpp"
#include "src/helpers/inc/Channel.hpp"
#include "src/helpers/inc/RingBuffer.hpp"
#include "src/job/inc/CodecEngine.hpp"
#include "src/job/inc/Job.hpp"
#include "src/monitor/inc/ResourceMonitor.hpp"
#include "src/policy/inc/PolicyEngine.hpp"
#include "src/storage/inc/FileStore.hpp"
#include "src/telemetry/inc/TelemetrySource.hpp"

#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint64_t
#include <memory>   // std::shared_ptr
#include <mutex>    // std::mutex, std::unique_lock
#include <optional> // std::optional
#include <string>   // std::string
#include <thread>   // std::thread
#include <variant>  // std::variant
#include <vector>   // std::vector

namespace kiln {

namespace coordinator {

/* ----------------------------- SubmitResult ----------------------------- */

struct SubmitResult {
  job::JobId id{job::NO_JOB}; ///< Set whenever a job was created, even if it then failed
  Status status{};

  [[nodiscard]] bool ok() const noexcept { return status.ok(); }
};

/* ----------------------------- Coordinator ----------------------------- */

class Coordinator final : public job::EngineSink {
public:
  Coordinator(job::CodecEngine& engine, std::shared_ptr<telemetry::TelemetrySource> telemetry,
              std::shared_ptr<storage::FileStore> store, CoordinatorConfig config = {});
  ~Coordinator() override;

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  /* --------------------------- Job control --------------------------- */

  /**
   * @brief Create a job, validate it and start the engine.
   * @return AlreadyRunning (no job created) while another job is non-terminal;
   *         ValidationError, TimeoutError or EngineError with the id of the
   *         job now Failed; success with the id of the Running job.
   *
   * Blocks for at most the precheck timeout plus the engine's begin().
   * Starts the resource monitor if it is not already running.
   */
  SubmitResult submit(const job::ConversionRequest& request);

  /**
   * @brief Ask the engine to stop the active job.
   * @return NotFound unless @p id is the active job; InvalidTransition while
   *         it is still Preparing. Cancelling an already Cancelling job succeeds.
   */
  Status cancel(job::JobId id);

  /**
   * @brief Pause the active job on the caller's behalf.
   * @return NotFound unless @p id is the active job; InvalidTransition unless
   *         it is Running or Paused.
   *
   * A caller-paused job stays Paused through policy ticks until resume() or
   * cancel(). Pausing a job the policy already paused only adds that hold.
   */
  Status pause(job::JobId id);

  /**
   * @brief Resume a Paused job, whoever paused it.
   * @return NotFound unless @p id is the active job; InvalidTransition unless Paused.
   *
   * The next policy tick may pause it again if conditions still call for it.
   */
  Status resume(job::JobId id);

  /**
   * @brief Submit the request of a Failed or Cancelled job again as a new job.
   * @return NotFound if @p id is not retained in history; InvalidTransition
   *         for a job that is still active or Completed; otherwise whatever
   *         submit() returns.
   */
  SubmitResult retry(job::JobId id);

  /// @brief Engine callback; queued for the dispatcher. Safe from any thread.
  void onProgressEvent(job::JobId id, const job::ProgressEvent& event) override;

  /// @brief Engine callback; queued for the dispatcher. Safe from any thread.
  void onEngineResult(job::JobId id, const job::EngineResult& result) override;

  /**
   * @brief Apply a policy evaluation to the active job.
   * @return false if discarded because a newer snapshot was already applied.
   *
   * Logs the evaluation's alerts whether or not a job is active. Leaving
   * Paused first revalidates with a forced snapshot.
   */
  bool onPolicyTick(const policy::Evaluation& evaluation);

  /* --------------------------- Queries --------------------------- */

  /// @brief Copy of the non-terminal job, if any.
  [[nodiscard]] std::optional<job::Job> getActiveJob() const;

  /// @brief Newest @p limit terminal jobs, newest first.
  [[nodiscard]] std::vector<job::Job> getHistory(std::size_t limit) const;

  /// @brief Active or retained job by id.
  [[nodiscard]] std::optional<job::Job> getJob(job::JobId id) const;

  [[nodiscard]] ConversionStats stats() const;

  /// @brief Zero the statistics. History and leakedHandles() are kept.
  void resetStats();

  /// @brief Retained history as a JSON array, newest first.
  [[nodiscard]] std::string exportHistoryJson() const;

  /// @brief Drop retained history. Statistics are kept.
  void clearHistory();

  /// @brief Engine handles abandoned by forced cancels.
  [[nodiscard]] std::uint64_t leakedHandles() const;

  /* --------------------------- Alerts & thresholds --------------------------- */

  [[nodiscard]] std::vector<events::Alert> alerts(std::size_t limit) const;
  [[nodiscard]] std::vector<events::Alert> activeAlerts() const;
  Status acknowledgeAlert(events::AlertId id);

  /// @brief Takes effect on the next evaluation.
  void setThreshold(const policy::Threshold& threshold);

  /// @return NotFound if no threshold of @p kind is installed.
  Status clearThreshold(policy::ThresholdKind kind);

  [[nodiscard]] std::vector<policy::Threshold> thresholds() const;

  /* --------------------------- Components --------------------------- */

  [[nodiscard]] events::EventBus& eventBus() noexcept { return bus_; }
  [[nodiscard]] monitor::ResourceMonitor& monitor() noexcept { return monitor_; }
  [[nodiscard]] const CoordinatorConfig& config() const noexcept { return config_; }

private:
  /* --------------------------- Dispatch messages --------------------------- */

  struct ProgressMsg {
    job::JobId id{job::NO_JOB};
    job::ProgressEvent event{};
  };
  struct ResultMsg {
    job::JobId id{job::NO_JOB};
    job::EngineResult result{};
  };
  struct TickMsg {
    telemetry::ResourceSnapshot snapshot{};
  };
  using Message = std::variant<ProgressMsg, ResultMsg, TickMsg>;

  /// Engine handle command issued after the lock is released.
  struct EngineCommand {
    enum class Op : std::uint8_t { Stop, Pause, Resume, Throttle, Unthrottle };
    std::shared_ptr<job::EngineHandle> handle{};
    Op op{Op::Stop};
  };
  using Commands = std::vector<EngineCommand>;

  enum class TickOutcome : std::uint8_t { Applied, Discarded, ResumeCandidate };

  void dispatchLoop();
  void handleProgress(const ProgressMsg& msg);
  void handleResult(const ResultMsg& msg);
  void handleTick(const TickMsg& msg);
  void checkStopDeadline();
  void revalidateResume(job::JobId id);
  bool applyEvaluation(const policy::Evaluation& evaluation);

  // Helpers below require mtx_ held.
  [[nodiscard]] std::optional<job::JobState> activeStateLocked() const;
  TickOutcome applyLocked(const policy::Evaluation& evaluation, bool revalidated,
                          Commands& cmds);
  bool transitionLocked(job::JobEvent event, const std::string& reason);
  void progressLocked(const ProgressMsg& msg);
  void resultLocked(const ResultMsg& msg);
  void replayDeferredLocked();
  void raiseAlertLocked(events::Alert alert);
  void beginStopLocked(Commands& cmds);
  void finalizeLocked();

  /// Release @p lock, publish staged events in order, then run @p cmds.
  void commit(std::unique_lock<std::mutex>& lock, const Commands& cmds = {});

  job::CodecEngine& engine_;
  std::shared_ptr<storage::FileStore> store_;
  const CoordinatorConfig config_;

  events::EventBus bus_;
  events::AlertLog alerts_;
  monitor::ResourceMonitor monitor_;

  // Guarded by mtx_.
  mutable std::mutex mtx_;
  policy::PolicyEngine policy_;
  std::optional<job::Job> active_{};
  std::shared_ptr<job::EngineHandle> handle_{};
  std::optional<SteadyTime> lastAppliedSnapshot_{};
  std::optional<SteadyTime> stopDeadline_{};
  job::JobId nextJobId_{1};
  ConversionStats stats_{};
  std::uint64_t leakedHandles_{0};
  std::vector<events::Event> outbox_{};
  // Callbacks for the active job that arrived while it was still Preparing.
  std::vector<Message> deferred_{};

  std::mutex publishMtx_;

  helpers::RingBuffer<job::Job> history_;
  helpers::Channel<Message> channel_;
  std::thread dispatcher_;
};

} // namespace coordinator

} // namespace kiln

#endif // KILN_COORDINATOR_COORDINATOR_HPP
