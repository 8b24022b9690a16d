#ifndef KILN_JOB_JOB_STATE_HPP
#define KILN_JOB_JOB_STATE_HPP
/**
 * @file JobState.hpp
 * @brief Conversion job lifecycle states and the transition table.
 *
 *   Pending    --Start-----------> Preparing
 *   Preparing  --EngineReady-----> Running
 *   Preparing  --EngineError-----> Failed
 *   Running    --PauseDecision---> Paused
 *   Running    --PauseRequest----> Paused
 *   Running    --Progress100-----> Completed
 *   Running    --AbortDecision---> Cancelling
 *   Running    --CancelRequest---> Cancelling
 *   Running    --EngineError-----> Failed
 *   Paused     --ResumeDecision--> Running
 *   Paused     --ResumeRequest---> Running
 *   Paused     --CancelRequest---> Cancelling
 *   Paused     --AbortDecision---> Cancelling
 *   Paused     --EngineError-----> Failed
 *   Paused     --Progress100-----> Completed
 *   Cancelling --EngineStopped---> Cancelled
 *   Cancelling --StopTimeout-----> Cancelled
 *
 * Completed, Failed and Cancelled are terminal.
 */

#include <cstdint>
#include <optional>

namespace kiln {

namespace job {

/* ----------------------------- JobState ----------------------------- */

enum class JobState : std::uint8_t {
  Pending = 0,
  Preparing,
  Running,
  Paused,
  Cancelling,
  Completed,
  Failed,
  Cancelled,
};

/// @brief Lowercase name, e.g. "cancelling".
[[nodiscard]] const char* toString(JobState state) noexcept;

/// @brief True for Completed, Failed and Cancelled.
[[nodiscard]] constexpr bool isTerminal(JobState state) noexcept {
  return state == JobState::Completed || state == JobState::Failed ||
         state == JobState::Cancelled;
}

/* ----------------------------- JobEvent ----------------------------- */

enum class JobEvent : std::uint8_t {
  Start = 0,
  EngineReady,
  PauseDecision,
  ResumeDecision,
  Progress100,
  AbortDecision,
  CancelRequest,
  EngineStopped,
  EngineError,
  StopTimeout,
  PauseRequest,
  ResumeRequest,
};

/// @brief snake_case name, e.g. "pause_decision".
[[nodiscard]] const char* toString(JobEvent event) noexcept;

/* ----------------------------- Transitions ----------------------------- */

/**
 * @brief Look up the transition table.
 * @return Target state, or std::nullopt if @p event is not accepted in @p from.
 */
[[nodiscard]] std::optional<JobState> nextState(JobState from, JobEvent event) noexcept;

} // namespace job

} // namespace kiln

#endif // KILN_JOB_JOB_STATE_HPP
