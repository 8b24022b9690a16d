#ifndef KILN_STORAGE_FILE_STORE_HPP
#define KILN_STORAGE_FILE_STORE_HPP
/**
 * @file FileStore.hpp
 * @brief Narrow view of persistent storage used by job prechecks.
 * @note Implementations must be safe to call from a helper thread; the
 *       coordinator runs prechecks with a deadline.
 */

#include <cstdint>
#include <string>

namespace kiln {

namespace storage {

/* ----------------------------- FileStore ----------------------------- */

class FileStore {
public:
  virtual ~FileStore() = default;

  /// @brief True if @p path names an existing regular file or directory.
  [[nodiscard]] virtual bool exists(const std::string& path) const = 0;

  /**
   * @brief True if a file can be created (or replaced) at @p path.
   *
   * The parent directory must exist and be writable; an existing file at
   * @p path must itself be writable.
   */
  [[nodiscard]] virtual bool isWritable(const std::string& path) const = 0;

  /**
   * @brief Bytes available to unprivileged writers on the volume holding @p path.
   * @return 0 if the volume cannot be queried.
   */
  [[nodiscard]] virtual std::uint64_t freeSpace(const std::string& path) const = 0;

  /// @brief Size of the file at @p path, 0 if absent or not a regular file.
  [[nodiscard]] virtual std::uint64_t fileSize(const std::string& path) const = 0;
};

} // namespace storage

} // namespace kiln

#endif // KILN_STORAGE_FILE_STORE_HPP
