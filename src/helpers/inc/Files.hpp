#ifndef KILN_HELPERS_FILES_HPP
#define KILN_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Bounded reads of small sysfs/procfs files.
 *
 * Telemetry attributes are tiny text files that may vanish between a
 * directory scan and the read (hot-plugged batteries, unloaded hwmon
 * drivers). Every reader here reports failure through its return value and
 * never throws.
 *
 * @note Uses open/read/close into caller-provided buffers.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat
#include <unistd.h>   // read, close

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtoll, strtoull
#include <string>

namespace kiln {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Default buffer size for attribute reads.
inline constexpr std::size_t FILE_READ_BUFFER_SIZE = 256;

/// Size for small integer file reads.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and carriage returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  kiln::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/**
 * @brief Read the first line of a small attribute file.
 * @param path File path to read.
 * @return Line without trailing whitespace; empty on error.
 */
[[nodiscard]] inline std::string readFileLine(const std::string& path) {
  std::array<char, FILE_READ_BUFFER_SIZE> buf{};
  const std::size_t LEN = readFileToBuffer(path.c_str(), buf.data(), buf.size());
  if (LEN == 0) {
    return {};
  }

  std::size_t lineLen = 0;
  while (lineLen < LEN && buf[lineLen] != '\n') {
    ++lineLen;
  }
  return std::string(buf.data(), lineLen);
}

/**
 * @brief Read signed 64-bit integer from file.
 * @param path File path to read.
 * @param defaultVal Value to return on error.
 * @return Parsed integer or defaultVal on failure.
 */
[[nodiscard]] inline std::int64_t readFileInt64(const char* path,
                                                std::int64_t defaultVal = -1) noexcept {
  std::array<char, INT_READ_BUFFER_SIZE> buf{};
  if (readFileToBuffer(path, buf.data(), buf.size()) == 0) {
    return defaultVal;
  }

  char* end = nullptr;
  const long long VAL = std::strtoll(buf.data(), &end, 10);
  if (end == buf.data()) {
    return defaultVal;
  }

  return static_cast<std::int64_t>(VAL);
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file or directory).
 * @param path Path to check.
 * @return true if path exists.
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

} // namespace files
} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_FILES_HPP
