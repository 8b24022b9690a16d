/**
 * @file ConversionStats.cpp
 * @brief Derived statistics.
 */

#include "src/coordinator/inc/ConversionStats.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace kiln {

namespace coordinator {

double ConversionStats::successRate() const noexcept {
  const std::uint64_t FINISHED = completed + failed + cancelled;
  if (FINISHED == 0) {
    return 0.0;
  }
  return static_cast<double>(completed) / static_cast<double>(FINISHED);
}

double ConversionStats::averageProcessingSeconds() const noexcept {
  if (completed == 0) {
    return 0.0;
  }
  return totalProcessingSeconds / static_cast<double>(completed);
}

std::string ConversionStats::toString() const {
  return fmt::format("{} submitted, {} completed, {} failed, {} cancelled ({} forced), {} "
                     "rejected, {} retried; success {:.0f}%, avg {}",
                     submitted, completed, failed, cancelled, forcedCancels, rejected, retried,
                     successRate() * 100.0,
                     helpers::format::duration(averageProcessingSeconds()));
}

} // namespace coordinator

} // namespace kiln
