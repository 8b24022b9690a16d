/**
 * @file CodecEngine.cpp
 * @brief EngineResult kind names.
 */

#include "src/job/inc/CodecEngine.hpp"

namespace kiln {

namespace job {

const char* toString(EngineResult::Kind kind) noexcept {
  switch (kind) {
  case EngineResult::Kind::Success:
    return "success";
  case EngineResult::Kind::Error:
    return "error";
  case EngineResult::Kind::Stopped:
    return "stopped";
  }
  return "unknown";
}

} // namespace job

} // namespace kiln
