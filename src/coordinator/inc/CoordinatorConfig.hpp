#ifndef KILN_COORDINATOR_COORDINATOR_CONFIG_HPP
#define KILN_COORDINATOR_COORDINATOR_CONFIG_HPP
/**
 * @file CoordinatorConfig.hpp
 * @brief Everything the coordinator is tuned by. Passed explicitly, never global.
 */

#include "src/job/inc/Precheck.hpp"
#include "src/monitor/inc/ResourceMonitor.hpp"
#include "src/policy/inc/Threshold.hpp"

#include <chrono>  // std::chrono::milliseconds
#include <cstddef> // std::size_t

namespace kiln {

namespace coordinator {

struct CoordinatorConfig {
  policy::PolicyConfig policy{};    ///< Threshold defaults and alert cooldown
  monitor::MonitorConfig monitor{}; ///< Poll interval, snapshot timeout, history

  std::chrono::milliseconds engineStopTimeout{10000}; ///< Cancelling -> forced Cancelled
  std::chrono::milliseconds precheckTimeout{5000};    ///< Preparing validation deadline
  double storageSafetyFactor{job::DEFAULT_STORAGE_SAFETY_FACTOR};

  std::size_t jobHistoryCapacity{50};    ///< Terminal jobs retained
  std::size_t alertRetention{200};       ///< Alerts retained
  std::size_t eventChannelCapacity{256}; ///< Engine/tick messages awaiting dispatch
  std::size_t mailboxCapacity{256};      ///< Per-subscriber event queue
};

} // namespace coordinator

} // namespace kiln

#endif // KILN_COORDINATOR_COORDINATOR_CONFIG_HPP
