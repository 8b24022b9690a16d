#ifndef KILN_HELPERS_STRINGS_HPP
#define KILN_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Small string helpers for parsing sysfs/procfs text.
 *
 * Operates on null-terminated buffers filled by helpers::files.
 *
 * @note All functions are noexcept and do not allocate.
 */

#include <cstddef>
#include <cstring> // strlen, strncmp

namespace kiln {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Skip leading whitespace (spaces and tabs).
 * @param ptr Pointer into string.
 * @return Pointer to first non-whitespace character (or end of string).
 */
[[nodiscard]] inline const char* skipWhitespace(const char* ptr) noexcept {
  if (ptr == nullptr) {
    return nullptr;
  }
  while (*ptr == ' ' || *ptr == '\t') {
    ++ptr;
  }
  return ptr;
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(const char* str, const char* prefix) noexcept {
  if (str == nullptr || prefix == nullptr) {
    return false;
  }
  const std::size_t PREFIX_LEN = std::strlen(prefix);
  return std::strncmp(str, prefix, PREFIX_LEN) == 0;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

} // namespace strings
} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_STRINGS_HPP
