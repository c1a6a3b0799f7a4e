#include "depot/util/filesystem.hpp"

#include <fstream>

#include "depot/util/security.hpp"

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace depot::util {

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  auto parent = path.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    auto dir_result = createDirectories(parent);
    if (!dir_result.has_value()) {
      return dir_result;
    }
  }

  auto temp_path = path;
  temp_path += ".tmp." + Security::toHex(Security::randomBytes(4));

  {
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create temporary file: " + temp_path.string()));
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed to write temporary file: " + temp_path.string()));
    }
  }

  syncPath(temp_path);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  // Sync parent directory to ensure rename is persistent
  if (!parent.empty()) {
    syncPath(parent);
  }

  return {};
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Cannot get file size"));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Read failed"));
  }

  return content;
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories: " + ec.message()));
  }

  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                     "Cannot set directory permissions: " + ec.message()));
  }

  return {};
}

Result<void> FileSystem::copyFile(const std::filesystem::path& from,
                                  const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Copy failed: " + ec.message()));
  }

  return {};
}

Result<void> FileSystem::removeFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot remove file: " + ec.message()));
  }

  return {};
}

void FileSystem::syncPath(const std::filesystem::path& path) {
#ifdef _WIN32
  int fd = _open(path.string().c_str(), _O_RDONLY);
  if (fd >= 0) {
    _commit(fd);
    _close(fd);
  }
#else
  int fd = open(path.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }
#endif
}

}  // namespace depot::util
