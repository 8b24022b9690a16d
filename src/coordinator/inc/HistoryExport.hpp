#ifndef KILN_COORDINATOR_HISTORY_EXPORT_HPP
#define KILN_COORDINATOR_HISTORY_EXPORT_HPP
/**
 * @file HistoryExport.hpp
 * @brief JSON rendering of job records.
 */

#include "src/job/inc/Job.hpp"

#include <string>
#include <vector>

namespace kiln {

namespace coordinator {

/// @brief One job as a single-line JSON object.
[[nodiscard]] std::string jobToJson(const job::Job& record);

/**
 * @brief JSON array of @p jobs, one object per line, in the given order.
 *
 * Timestamps are UTC ISO-8601; absent optionals are null.
 */
[[nodiscard]] std::string jobsToJson(const std::vector<job::Job>& jobs);

} // namespace coordinator

} // namespace kiln

#endif // KILN_COORDINATOR_HISTORY_EXPORT_HPP
