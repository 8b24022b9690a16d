#ifndef KILN_STORAGE_LOCAL_FILE_STORE_HPP
#define KILN_STORAGE_LOCAL_FILE_STORE_HPP
/**
 * @file LocalFileStore.hpp
 * @brief FileStore over the local filesystem.
 * @note Linux-only. Uses std::filesystem (non-throwing overloads),
 *       access(2) and statvfs(3).
 * @note Thread-safe: stateless.
 */

#include "src/storage/inc/FileStore.hpp"

#include <cstdint>
#include <string>

namespace kiln {

namespace storage {

class LocalFileStore final : public FileStore {
public:
  [[nodiscard]] bool exists(const std::string& path) const override;
  [[nodiscard]] bool isWritable(const std::string& path) const override;
  [[nodiscard]] std::uint64_t freeSpace(const std::string& path) const override;
  [[nodiscard]] std::uint64_t fileSize(const std::string& path) const override;
};

/**
 * @brief Nearest existing ancestor of @p path (or @p path itself).
 * @return Empty string if nothing on the way up exists.
 *
 * Output files do not exist yet; free space is measured on the volume
 * that will hold them.
 */
[[nodiscard]] std::string nearestExistingDirectory(const std::string& path);

} // namespace storage

} // namespace kiln

#endif // KILN_STORAGE_LOCAL_FILE_STORE_HPP
