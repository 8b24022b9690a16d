#ifndef KILN_JOB_JOB_HPP
#define KILN_JOB_JOB_HPP
/**
 * @file Job.hpp
 * @brief Conversion request types and the Job record.
 * @note Not thread-safe. The coordinator mutates the active Job under its
 *       lock; terminal Jobs are copied into history and never touched again.
 */

#include "src/common/inc/Clock.hpp"
#include "src/common/inc/Status.hpp"
#include "src/job/inc/JobState.hpp"

#include <cstdint>  // std::uint64_t, std::uint32_t
#include <optional> // std::optional
#include <string>   // std::string

namespace kiln {

namespace job {

/* ----------------------------- Identifiers ----------------------------- */

using JobId = std::uint64_t;

/// Never assigned to a real job.
inline constexpr JobId NO_JOB = 0;

/* ----------------------------- Request Types ----------------------------- */

/**
 * @brief Source media as known at submit time.
 */
struct MediaDescriptor {
  std::string path{};
  std::uint64_t sizeBytes{0}; ///< 0 = unknown; prechecks then ask the file store
  double durationSeconds{0.0};
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string codec{};
};

/**
 * @brief Encoder settings. Zero dimensions / bitrate mean "keep source".
 */
struct EncodeParams {
  std::string container{"mp4"};
  std::string videoCodec{"h264"};
  std::string audioCodec{"aac"};
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::uint32_t bitrateKbps{0};
  double frameRate{0.0};
  int crf{23};
  std::string preset{"medium"};
};

struct OutputTarget {
  std::string path{};
  EncodeParams params{};
};

struct ConversionRequest {
  MediaDescriptor input{};
  OutputTarget output{};
};

/* ----------------------------- JobProgress ----------------------------- */

struct JobProgress {
  double percent{0.0};                  ///< 0 - 100, never decreases
  std::string phase{};                  ///< Engine-defined, e.g. "encoding"
  std::uint64_t processedUnits{0};      ///< Frames or bytes, engine-defined
  std::uint64_t totalUnits{0};          ///< 0 if unknown
  std::optional<double> etaSeconds{};   ///< Estimated time remaining
};

/* ----------------------------- TransitionResult ----------------------------- */

struct TransitionResult {
  Status status{};
  JobState from{JobState::Pending};
  JobState to{JobState::Pending}; ///< Equals `from` when refused

  [[nodiscard]] bool ok() const noexcept { return status.ok(); }
};

/* ----------------------------- Job ----------------------------- */

/**
 * @brief One conversion job and its lifecycle timestamps.
 *
 * Timestamps are set once: startedAt on entering Preparing, endedAt on
 * entering a terminal state. failureReason is set only on entering Failed,
 * cancelReason only on entering Cancelling.
 */
class Job {
public:
  Job() = default;
  Job(JobId id, ConversionRequest request, WallTime createdAt);

  [[nodiscard]] JobId id() const noexcept { return id_; }
  [[nodiscard]] JobState state() const noexcept { return state_; }
  [[nodiscard]] bool terminal() const noexcept { return isTerminal(state_); }
  [[nodiscard]] const ConversionRequest& request() const noexcept { return request_; }
  [[nodiscard]] const MediaDescriptor& input() const noexcept { return request_.input; }
  [[nodiscard]] const OutputTarget& output() const noexcept { return request_.output; }
  [[nodiscard]] const JobProgress& progress() const noexcept { return progress_; }
  [[nodiscard]] WallTime createdAt() const noexcept { return createdAt_; }
  [[nodiscard]] const std::optional<WallTime>& startedAt() const noexcept { return startedAt_; }
  [[nodiscard]] const std::optional<WallTime>& endedAt() const noexcept { return endedAt_; }
  [[nodiscard]] const std::optional<std::string>& failureReason() const noexcept {
    return failureReason_;
  }
  [[nodiscard]] const std::optional<std::string>& cancelReason() const noexcept {
    return cancelReason_;
  }
  [[nodiscard]] bool throttled() const noexcept { return throttled_; }
  [[nodiscard]] bool forcedCancel() const noexcept { return forcedCancel_; }

  /// @brief Paused by the caller; only a caller resume brings it back to Running.
  [[nodiscard]] bool heldByCaller() const noexcept { return heldByCaller_; }

  /**
   * @brief Drive the state machine.
   * @param event Trigger.
   * @param now Timestamp recorded for startedAt / endedAt.
   * @param reason Failure or cancel reason, recorded when the target state takes one.
   * @return InvalidTransition (state unchanged) if the table has no entry.
   */
  TransitionResult apply(JobEvent event, WallTime now, const std::string& reason = {});

  /**
   * @brief Merge an engine progress report.
   * @return false (ignored) once the job is terminal.
   *
   * Percent is clamped to [0, 100] and never decreases.
   */
  bool updateProgress(const JobProgress& update);

  /**
   * @brief Mark an already Paused job as held by the caller.
   * @return false unless the job is Paused.
   */
  bool holdForCaller() noexcept;

  /// @brief Record whether the engine is currently throttled. Ignored once terminal.
  void setThrottled(bool throttled) noexcept;

  /// @brief Seconds from startedAt to endedAt; 0 unless both are set.
  [[nodiscard]] double processingSeconds() const noexcept;

  /// @brief One-line summary, e.g. "job #3 running 40.0% a.mov -> a.mp4".
  [[nodiscard]] std::string toString() const;

private:
  JobId id_{NO_JOB};
  JobState state_{JobState::Pending};
  ConversionRequest request_{};
  JobProgress progress_{};
  WallTime createdAt_{};
  std::optional<WallTime> startedAt_{};
  std::optional<WallTime> endedAt_{};
  std::optional<std::string> failureReason_{};
  std::optional<std::string> cancelReason_{};
  bool throttled_{false};
  bool forcedCancel_{false};
  bool heldByCaller_{false};
};

} // namespace job

} // namespace kiln

#endif // KILN_JOB_JOB_HPP
