/**
 * @file kiln-precheck.cpp
 * @brief Run the conversion prechecks for an input/output pair.
 *
 * Applies the same checks a submitted job goes through in Preparing: input
 * exists, output location is writable, output volume has room for the input
 * times the safety factor.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/job/inc/Job.hpp"
#include "src/job/inc/Precheck.hpp"
#include "src/storage/inc/LocalFileStore.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = kiln::helpers::args;
namespace format = kiln::helpers::format;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_INPUT = 2,
  ARG_OUTPUT = 3,
  ARG_FACTOR = 4,
  ARG_LOG_LEVEL = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Conversion precheck.\n"
    "Verifies the input exists, the output is writable and the output volume\n"
    "has enough free space. Exit status is 0 when every check passes.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", {}, false, "Show this help message"};
  map[ARG_JSON] = {"--json", {}, false, "Output in JSON format"};
  map[ARG_INPUT] = {"--input", "<file>", true, "Source media file"};
  map[ARG_OUTPUT] = {"--output", "<file>", true, "Destination file"};
  map[ARG_FACTOR] = {"--safety-factor", "<x>", false,
                     "Free space needed per input byte (default: 1.2)"};
  map[ARG_LOG_LEVEL] = {"--log-level", "<level>", false,
                        "trace|debug|info|warn|error|off (default: warn)"};
  return map;
}

/// Everything the checks looked at, for display.
struct PrecheckReport {
  std::string input;
  std::string output;
  bool inputExists{false};
  bool outputWritable{false};
  std::uint64_t inputBytes{0};
  std::uint64_t requiredBytes{0};
  std::uint64_t freeBytes{0};
  double safetyFactor{0.0};
  kiln::Status status{};
};

/* ----------------------------- Human Output ----------------------------- */

const char* mark(bool ok) { return ok ? "\033[32m[ OK ]\033[0m" : "\033[31m[FAIL]\033[0m"; }

void printHumanOutput(const PrecheckReport& rpt) {
  fmt::print("Conversion Precheck\n");
  fmt::print("===================\n\n");

  fmt::print("  {} input exists       {}\n", mark(rpt.inputExists), rpt.input);
  fmt::print("  {} output writable    {}\n", mark(rpt.outputWritable), rpt.output);

  const bool ROOM = rpt.freeBytes >= rpt.requiredBytes;
  fmt::print("  {} free space         {} free, {} needed ({} x {:.2f})\n", mark(ROOM),
             format::bytesBinary(rpt.freeBytes), format::bytesBinary(rpt.requiredBytes),
             format::bytesBinary(rpt.inputBytes), rpt.safetyFactor);

  fmt::print("\n");
  if (rpt.status.ok()) {
    fmt::print("\033[32mReady to convert\033[0m\n");
  } else {
    fmt::print("\033[31m{}\033[0m\n", rpt.status.message);
  }
}

void printJsonOutput(const PrecheckReport& rpt) {
  fmt::print("{{\n");
  fmt::print("  \"input\": {},\n", format::jsonString(rpt.input));
  fmt::print("  \"output\": {},\n", format::jsonString(rpt.output));
  fmt::print("  \"inputExists\": {},\n", rpt.inputExists);
  fmt::print("  \"outputWritable\": {},\n", rpt.outputWritable);
  fmt::print("  \"inputBytes\": {},\n", rpt.inputBytes);
  fmt::print("  \"requiredBytes\": {},\n", rpt.requiredBytes);
  fmt::print("  \"freeBytes\": {},\n", rpt.freeBytes);
  fmt::print("  \"safetyFactor\": {:.3f},\n", rpt.safetyFactor);
  fmt::print("  \"ok\": {},\n", rpt.status.ok());
  fmt::print("  \"error\": {}\n",
             rpt.status.ok() ? std::string("null") : format::jsonString(rpt.status.message));
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  for (const std::string_view ARG : argList) {
    if (ARG == "--help") {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }
  }

  if (const std::optional<std::string> PARSE_ERROR = args::parseArgs(argList, ARG_MAP, pargs)) {
    fmt::print(stderr, "Error: {}\n\n", *PARSE_ERROR);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  kiln::helpers::log::init(args::stringValue(pargs, ARG_LOG_LEVEL, "warn"));

  kiln::job::ConversionRequest request{};
  request.input.path = args::stringValue(pargs, ARG_INPUT, "");
  request.output.path = args::stringValue(pargs, ARG_OUTPUT, "");

  PrecheckReport rpt{};
  rpt.input = request.input.path;
  rpt.output = request.output.path;
  rpt.safetyFactor =
      args::doubleValue(pargs, ARG_FACTOR, kiln::job::DEFAULT_STORAGE_SAFETY_FACTOR);

  const kiln::storage::LocalFileStore STORE{};
  rpt.inputExists = STORE.exists(rpt.input);
  rpt.outputWritable = STORE.isWritable(rpt.output);
  rpt.inputBytes = rpt.inputExists ? STORE.fileSize(rpt.input) : 0;
  rpt.requiredBytes = kiln::job::requiredOutputBytes(rpt.inputBytes, rpt.safetyFactor);
  rpt.freeBytes = STORE.freeSpace(rpt.output);
  rpt.status = kiln::job::runPrechecks(request, STORE, rpt.safetyFactor);

  if (args::hasFlag(pargs, ARG_JSON)) {
    printJsonOutput(rpt);
  } else {
    printHumanOutput(rpt);
  }

  return rpt.status.ok() ? 0 : 2;
}
