#pragma once

#include <filesystem>
#include <string>

#include "depot/common.hpp"

namespace depot::util {

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read file with error handling
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all |
                                                                       std::filesystem::perms::group_read |
                                                                       std::filesystem::perms::group_exec |
                                                                       std::filesystem::perms::others_read |
                                                                       std::filesystem::perms::others_exec);

  // Copy file, refusing to overwrite an existing target
  static Result<void> copyFile(const std::filesystem::path& from,
                               const std::filesystem::path& to);

  // Remove file safely
  static Result<void> removeFile(const std::filesystem::path& path);

 private:
  // Internal helper for fsync
  static void syncPath(const std::filesystem::path& path);
};

}  // namespace depot::util
