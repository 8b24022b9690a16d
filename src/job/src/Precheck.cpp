/**
 * @file Precheck.cpp
 * @brief Input / output / free-space validation.
 */

#include "src/job/inc/Precheck.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cmath>  // std::ceil
#include <limits> // std::numeric_limits

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace kiln {

namespace job {

using kiln::helpers::format::bytesBinary;

std::uint64_t requiredOutputBytes(std::uint64_t inputBytes, double safetyFactor) noexcept {
  const double FACTOR = (safetyFactor >= 1.0) ? safetyFactor : 1.0;
  const double REQUIRED = std::ceil(static_cast<double>(inputBytes) * FACTOR);
  // 2^64 is exactly representable; anything at or above it does not fit.
  constexpr double LIMIT = 18446744073709551616.0;
  if (!(REQUIRED < LIMIT)) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return static_cast<std::uint64_t>(REQUIRED);
}

Status runPrechecks(const ConversionRequest& request, const storage::FileStore& store,
                    double safetyFactor) {
  const MediaDescriptor& IN = request.input;
  const OutputTarget& OUT = request.output;

  if (IN.path.empty() || !store.exists(IN.path)) {
    return Status::failure(ErrorCode::ValidationError,
                           fmt::format("input not accessible: {}", IN.path));
  }

  if (OUT.path.empty() || !store.isWritable(OUT.path)) {
    return Status::failure(ErrorCode::ValidationError,
                           fmt::format("output path not writable: {}", OUT.path));
  }

  const std::uint64_t INPUT_BYTES = (IN.sizeBytes != 0) ? IN.sizeBytes : store.fileSize(IN.path);
  const std::uint64_t REQUIRED = requiredOutputBytes(INPUT_BYTES, safetyFactor);
  const std::uint64_t FREE = store.freeSpace(OUT.path);
  if (FREE < REQUIRED) {
    spdlog::info("[precheck] {} needs {} free, volume has {}", OUT.path, bytesBinary(REQUIRED),
                 bytesBinary(FREE));
    return Status::failure(ErrorCode::ValidationError, "insufficient storage");
  }

  return Status::success();
}

} // namespace job

} // namespace kiln
