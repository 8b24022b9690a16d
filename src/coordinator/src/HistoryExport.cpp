/**
 * @file HistoryExport.cpp
 * @brief Job JSON rendering with fmt.
 */

#include "src/coordinator/inc/HistoryExport.hpp"
#include "src/helpers/inc/Format.hpp"

#include <optional>

#include <fmt/core.h>

namespace kiln {

namespace coordinator {

using kiln::helpers::format::isoTime;
using kiln::helpers::format::jsonString;

namespace {

inline std::string optTime(const std::optional<WallTime>& tp) {
  return tp ? jsonString(isoTime(*tp)) : std::string("null");
}

inline std::string optText(const std::optional<std::string>& text) {
  return text ? jsonString(*text) : std::string("null");
}

} // namespace

std::string jobToJson(const job::Job& record) {
  const job::JobProgress& PROG = record.progress();
  const job::EncodeParams& PARAMS = record.output().params;

  std::string out = fmt::format(
      "{{\"id\": {}, \"state\": \"{}\", \"input\": {{\"path\": {}, \"sizeBytes\": {}, "
      "\"durationSeconds\": {:.3f}, \"codec\": {}}}, ",
      record.id(), job::toString(record.state()), jsonString(record.input().path),
      record.input().sizeBytes, record.input().durationSeconds, jsonString(record.input().codec));

  out += fmt::format("\"output\": {{\"path\": {}, \"container\": {}, \"videoCodec\": {}, "
                     "\"audioCodec\": {}, \"width\": {}, \"height\": {}, \"bitrateKbps\": {}, "
                     "\"crf\": {}, \"preset\": {}}}, ",
                     jsonString(record.output().path), jsonString(PARAMS.container),
                     jsonString(PARAMS.videoCodec), jsonString(PARAMS.audioCodec), PARAMS.width,
                     PARAMS.height, PARAMS.bitrateKbps, PARAMS.crf, jsonString(PARAMS.preset));

  out += fmt::format("\"progress\": {{\"percent\": {:.1f}, \"phase\": {}, "
                     "\"processedUnits\": {}, \"totalUnits\": {}}}, ",
                     PROG.percent, jsonString(PROG.phase), PROG.processedUnits, PROG.totalUnits);

  out += fmt::format("\"createdAt\": {}, \"startedAt\": {}, \"endedAt\": {}, "
                     "\"processingSeconds\": {:.3f}, \"failureReason\": {}, "
                     "\"cancelReason\": {}, \"forcedCancel\": {}}}",
                     jsonString(isoTime(record.createdAt())), optTime(record.startedAt()),
                     optTime(record.endedAt()), record.processingSeconds(),
                     optText(record.failureReason()), optText(record.cancelReason()),
                     record.forcedCancel());
  return out;
}

std::string jobsToJson(const std::vector<job::Job>& jobs) {
  if (jobs.empty()) {
    return "[]";
  }
  std::string out = "[\n";
  for (std::size_t i = 0; i < jobs.size(); ++i) {
    out += "  ";
    out += jobToJson(jobs[i]);
    out += (i + 1 < jobs.size()) ? ",\n" : "\n";
  }
  out += "]";
  return out;
}

} // namespace coordinator

} // namespace kiln
