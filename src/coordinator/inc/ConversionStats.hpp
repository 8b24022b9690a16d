#ifndef KILN_COORDINATOR_CONVERSION_STATS_HPP
#define KILN_COORDINATOR_CONVERSION_STATS_HPP
/**
 * @file ConversionStats.hpp
 * @brief Lifetime job counters kept by the coordinator.
 */

#include <cstdint>
#include <string>

namespace kiln {

namespace coordinator {

struct ConversionStats {
  std::uint64_t submitted{0}; ///< Jobs created (rejections excluded)
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t cancelled{0};
  std::uint64_t rejected{0};        ///< submit() refused with AlreadyRunning
  std::uint64_t retried{0};         ///< Jobs created by retry()
  std::uint64_t forcedCancels{0};   ///< Cancelled by stop timeout (leaked handles)
  double totalProcessingSeconds{0}; ///< Sum over completed jobs

  /// @brief completed / (completed + failed + cancelled); 0 when none finished.
  [[nodiscard]] double successRate() const noexcept;

  /// @brief Mean processing time of completed jobs; 0 when none.
  [[nodiscard]] double averageProcessingSeconds() const noexcept;

  [[nodiscard]] std::string toString() const;
};

} // namespace coordinator

} // namespace kiln

#endif // KILN_COORDINATOR_CONVERSION_STATS_HPP
