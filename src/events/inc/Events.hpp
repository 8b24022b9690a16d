#ifndef KILN_EVENTS_EVENTS_HPP
#define KILN_EVENTS_EVENTS_HPP
/**
 * @file Events.hpp
 * @brief Event types fanned out by the EventBus.
 */

#include "src/common/inc/Clock.hpp"
#include "src/events/inc/Alert.hpp"
#include "src/job/inc/Job.hpp"
#include "src/job/inc/JobState.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace kiln {

namespace events {

/* ----------------------------- Event Types ----------------------------- */

struct JobStateChanged {
  job::JobId jobId{job::NO_JOB};
  job::JobState from{job::JobState::Pending};
  job::JobState to{job::JobState::Pending};
  std::string reason{}; ///< Failure / cancel reason, or decision reason
  WallTime at{};
};

struct ProgressUpdated {
  job::JobId jobId{job::NO_JOB};
  job::JobProgress progress{};
};

struct AlertRaised {
  Alert alert{};
};

using Event = std::variant<JobStateChanged, ProgressUpdated, AlertRaised>;

/// @brief One-line rendering for logs and the CLI.
[[nodiscard]] std::string describe(const Event& event);

/* ----------------------------- EventFilter ----------------------------- */

/**
 * @brief Selects which events a subscriber receives. Default: everything.
 */
struct EventFilter {
  bool jobStates{true};
  bool progress{true};
  bool alerts{true};
  std::optional<job::JobId> jobId{}; ///< Restrict job events to one job

  [[nodiscard]] bool matches(const Event& event) const noexcept;

  [[nodiscard]] static EventFilter alertsOnly() {
    EventFilter filter{};
    filter.jobStates = false;
    filter.progress = false;
    return filter;
  }

  [[nodiscard]] static EventFilter forJob(job::JobId id) {
    EventFilter filter{};
    filter.alerts = false;
    filter.jobId = id;
    return filter;
  }
};

} // namespace events

} // namespace kiln

#endif // KILN_EVENTS_EVENTS_HPP
