#ifndef KILN_JOB_PRECHECK_HPP
#define KILN_JOB_PRECHECK_HPP
/**
 * @file Precheck.hpp
 * @brief Validation run while a job is Preparing, before the engine is contacted.
 */

#include "src/common/inc/Status.hpp"
#include "src/job/inc/Job.hpp"
#include "src/storage/inc/FileStore.hpp"

#include <cstdint>

namespace kiln {

namespace job {

/// Default headroom over the input size required on the output volume.
inline constexpr double DEFAULT_STORAGE_SAFETY_FACTOR = 1.2;

/**
 * @brief Bytes the output volume must have free for @p request.
 * @param inputBytes Input size in bytes.
 * @param safetyFactor Multiplier (values below 1.0, and NaN, are treated as 1.0).
 * @return Saturates at the largest uint64_t.
 */
[[nodiscard]] std::uint64_t requiredOutputBytes(std::uint64_t inputBytes,
                                                double safetyFactor) noexcept;

/**
 * @brief Check input, output and free space, in that order.
 * @param request Request under validation.
 * @param store File store to query.
 * @param safetyFactor Free space needed as a multiple of the input size.
 * @return ValidationError with message "input not accessible: <path>",
 *         "output path not writable: <path>" or "insufficient storage";
 *         success otherwise.
 *
 * The input size comes from the request when known, else from the store.
 */
[[nodiscard]] Status runPrechecks(const ConversionRequest& request,
                                  const storage::FileStore& store, double safetyFactor);

} // namespace job

} // namespace kiln

#endif // KILN_JOB_PRECHECK_HPP
