/**
 * @file Events.cpp
 * @brief Event rendering and filtering.
 */

#include "src/events/inc/Events.hpp"

#include <type_traits> // std::decay_t, std::is_same_v

#include <fmt/core.h>

namespace kiln {

namespace events {

std::string describe(const Event& event) {
  return std::visit(
      [](const auto& ev) -> std::string {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, JobStateChanged>) {
          return fmt::format("job #{} {} -> {}{}{}", ev.jobId, job::toString(ev.from),
                             job::toString(ev.to), ev.reason.empty() ? "" : ": ", ev.reason);
        } else if constexpr (std::is_same_v<T, ProgressUpdated>) {
          return fmt::format("job #{} {:.1f}% {}", ev.jobId, ev.progress.percent,
                             ev.progress.phase);
        } else {
          return fmt::format("alert #{} {}", ev.alert.id, ev.alert.toString());
        }
      },
      event);
}

bool EventFilter::matches(const Event& event) const noexcept {
  if (const auto* STATE = std::get_if<JobStateChanged>(&event)) {
    return jobStates && (!jobId || *jobId == STATE->jobId);
  }
  if (const auto* PROGRESS = std::get_if<ProgressUpdated>(&event)) {
    return progress && (!jobId || *jobId == PROGRESS->jobId);
  }
  return alerts;
}

} // namespace events

} // namespace kiln
