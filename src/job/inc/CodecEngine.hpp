#ifndef KILN_JOB_CODEC_ENGINE_HPP
#define KILN_JOB_CODEC_ENGINE_HPP
/**
 * @file CodecEngine.hpp
 * @brief Contract between the coordinator and a transcoding backend.
 *
 * begin() starts one conversion and returns a handle for flow control.
 * The engine then reports through the EngineSink from any thread it likes:
 * zero or more progress events followed by exactly one EngineResult.
 * A Stopped result acknowledges a stop() request.
 */

#include "src/common/inc/Status.hpp"
#include "src/job/inc/Job.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace kiln {

namespace job {

/* ----------------------------- Callback Types ----------------------------- */

/// Engine progress reports carry the same fields the Job records.
using ProgressEvent = JobProgress;

/**
 * @brief Terminal engine outcome.
 */
struct EngineResult {
  enum class Kind : std::uint8_t {
    Success = 0,
    Error,
    Stopped, ///< Acknowledges stop()
  };

  Kind kind{Kind::Success};
  int code{0};          ///< Engine-specific error code (Error only)
  std::string message{};

  [[nodiscard]] static EngineResult success() { return EngineResult{}; }
  [[nodiscard]] static EngineResult error(int code, std::string message) {
    return EngineResult{Kind::Error, code, std::move(message)};
  }
  [[nodiscard]] static EngineResult stopped() { return EngineResult{Kind::Stopped, 0, {}}; }
};

/// @brief "success", "error" or "stopped".
[[nodiscard]] const char* toString(EngineResult::Kind kind) noexcept;

/**
 * @brief Receiver for engine callbacks. Implementations must accept calls
 *        from arbitrary threads.
 */
class EngineSink {
public:
  virtual ~EngineSink() = default;

  virtual void onProgressEvent(JobId id, const ProgressEvent& event) = 0;
  virtual void onEngineResult(JobId id, const EngineResult& result) = 0;
};

/* ----------------------------- Engine ----------------------------- */

/**
 * @brief Flow control for a running conversion. Commands are requests;
 *        stop() is confirmed by an EngineResult::Kind::Stopped callback.
 */
class EngineHandle {
public:
  virtual ~EngineHandle() = default;

  virtual void stop() = 0;
  virtual void pause() = 0;
  virtual void resume() = 0;
  virtual void setThrottle(bool throttled) = 0;
};

struct EngineRequest {
  JobId jobId{NO_JOB};
  MediaDescriptor input{};
  OutputTarget output{};
};

/**
 * @brief Result of CodecEngine::begin().
 */
struct EngineStart {
  std::shared_ptr<EngineHandle> handle{};
  Status status{};

  explicit operator bool() const noexcept { return status.ok() && handle != nullptr; }
};

class CodecEngine {
public:
  virtual ~CodecEngine() = default;

  /**
   * @brief Start converting.
   * @param request Job id, source and destination.
   * @param sink Receives progress and the terminal result for request.jobId.
   * @return Handle on success; EngineError status otherwise.
   * @note Must not call back into @p sink before returning.
   */
  [[nodiscard]] virtual EngineStart begin(const EngineRequest& request, EngineSink& sink) = 0;
};

} // namespace job

} // namespace kiln

#endif // KILN_JOB_CODEC_ENGINE_HPP
