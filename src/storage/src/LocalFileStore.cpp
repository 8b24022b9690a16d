/**
 * @file LocalFileStore.cpp
 * @brief Local filesystem checks for job prechecks.
 */

#include "src/storage/inc/LocalFileStore.hpp"

#include <sys/statvfs.h> // statvfs
#include <unistd.h>      // access, W_OK

#include <filesystem>   // std::filesystem
#include <system_error> // std::error_code

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace kiln {

namespace storage {

namespace {

/// Directory that would receive a new file at @p path.
inline fs::path parentOf(const fs::path& path) {
  const fs::path PARENT = path.parent_path();
  return PARENT.empty() ? fs::path(".") : PARENT;
}

} // namespace

/* ----------------------------- Helpers ----------------------------- */

std::string nearestExistingDirectory(const std::string& path) {
  if (path.empty()) {
    return {};
  }

  std::error_code ec;
  fs::path cur = fs::absolute(fs::path(path), ec);
  if (ec) {
    cur = fs::path(path);
  }

  while (!cur.empty()) {
    if (fs::is_directory(cur, ec)) {
      return cur.string();
    }
    const fs::path NEXT = cur.parent_path();
    if (NEXT == cur) {
      break;
    }
    cur = NEXT;
  }
  return {};
}

/* ----------------------------- LocalFileStore ----------------------------- */

bool LocalFileStore::exists(const std::string& path) const {
  if (path.empty()) {
    return false;
  }
  std::error_code ec;
  const fs::file_status STATUS = fs::status(path, ec);
  if (ec) {
    return false;
  }
  return fs::is_regular_file(STATUS) || fs::is_directory(STATUS);
}

bool LocalFileStore::isWritable(const std::string& path) const {
  if (path.empty()) {
    return false;
  }

  std::error_code ec;
  const fs::path TARGET(path);
  if (fs::is_directory(TARGET, ec)) {
    return false;
  }

  const fs::path PARENT = parentOf(TARGET);
  if (!fs::is_directory(PARENT, ec) || ::access(PARENT.c_str(), W_OK) != 0) {
    spdlog::debug("[storage] {} not writable (parent {})", path, PARENT.string());
    return false;
  }

  if (fs::exists(TARGET, ec) && ::access(TARGET.c_str(), W_OK) != 0) {
    return false;
  }
  return true;
}

std::uint64_t LocalFileStore::freeSpace(const std::string& path) const {
  const std::string DIR = nearestExistingDirectory(path);
  if (DIR.empty()) {
    return 0;
  }

  struct statvfs vfs{};
  if (::statvfs(DIR.c_str(), &vfs) != 0) {
    spdlog::debug("[storage] statvfs({}) failed", DIR);
    return 0;
  }
  return static_cast<std::uint64_t>(vfs.f_bavail) * static_cast<std::uint64_t>(vfs.f_frsize);
}

std::uint64_t LocalFileStore::fileSize(const std::string& path) const {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return 0;
  }
  const std::uintmax_t SIZE = fs::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(SIZE);
}

} // namespace storage

} // namespace kiln
