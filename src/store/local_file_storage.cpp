#include "depot/store/local_file_storage.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "depot/naming/path_builder.hpp"
#include "depot/util/filesystem.hpp"

namespace depot::store {

LocalFileStorage::LocalFileStorage(Config config, naming::NamingPolicy policy)
    : StorageBase(std::move(policy)), config_(std::move(config)) {
  config_.root = config_.root.lexically_normal();
  if (!config_.root.has_filename() && config_.root.has_relative_path()) {
    // Drop the trailing separator so lexically_relative() compares cleanly
    config_.root = config_.root.parent_path();
  }

  if (config_.auto_create_dirs && !config_.root.empty()) {
    auto ensure_root = util::FileSystem::createDirectories(config_.root);
    if (!ensure_root.has_value()) {
      spdlog::warn("Cannot create storage root {}: {}", config_.root.string(),
                   ensure_root.error().message());
    }
  }
}

Result<bool> LocalFileStorage::exists(const std::string& filename, const std::string& target_dir) {
  auto path_result = resolve(naming::PathBuilder::join(target_dir, filename));
  if (!path_result.has_value()) {
    return std::unexpected(path_result.error());
  }

  std::error_code ec;
  bool found = std::filesystem::exists(*path_result, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot stat " + path_result->string() + ": " + ec.message()));
  }

  return found;
}

Result<std::string> LocalFileStorage::save(const naming::FileDescriptor& file,
                                           const std::string& target_dir) {
  if (file.path.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "No source path for upload: " + file.name));
  }
  if (!std::filesystem::exists(file.path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Source file not found: " + file.path.string()));
  }

  std::string directory = target_dir;
  if (directory.empty() && config_.dated_directories) {
    directory = targetDir();
  }

  std::string stored_path = uniquePathname(file, directory);
  auto target_result = resolve(stored_path);
  if (!target_result.has_value()) {
    return std::unexpected(target_result.error());
  }

  auto dir_result = util::FileSystem::createDirectories(target_result->parent_path());
  if (!dir_result.has_value()) {
    return std::unexpected(dir_result.error());
  }

  auto copy_result = util::FileSystem::copyFile(file.path, *target_result);
  if (!copy_result.has_value()) {
    spdlog::error("Failed to store {} at {}: {}", file.name, stored_path,
                  copy_result.error().message());
    return std::unexpected(copy_result.error());
  }

  spdlog::info("Stored {} as {}", file.name, stored_path);
  return stored_path;
}

Result<ServedFile> LocalFileStorage::serve(const std::string& stored_path) {
  auto content_result = read(stored_path);
  if (!content_result.has_value()) {
    return std::unexpected(content_result.error());
  }

  ServedFile served;
  served.size = content_result->size();
  served.content = std::move(*content_result);
  served.mime_type = detectMimeType(stored_path);
  return served;
}

Result<void> LocalFileStorage::remove(const std::string& filename, const std::string& target_dir) {
  auto path_result = resolve(naming::PathBuilder::join(target_dir, filename));
  if (!path_result.has_value()) {
    return std::unexpected(path_result.error());
  }

  if (!std::filesystem::is_regular_file(*path_result)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Stored file not found: " + path_result->string()));
  }

  auto remove_result = util::FileSystem::removeFile(*path_result);
  if (!remove_result.has_value()) {
    return remove_result;
  }

  spdlog::info("Removed {}", naming::PathBuilder::join(target_dir, filename));
  return {};
}

Result<std::string> LocalFileStorage::read(const std::string& stored_path) {
  auto path_result = resolve(stored_path);
  if (!path_result.has_value()) {
    return std::unexpected(path_result.error());
  }

  if (!std::filesystem::is_regular_file(*path_result)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Stored file not found: " + stored_path));
  }

  return util::FileSystem::readFile(*path_result);
}

Result<std::string> LocalFileStorage::saveRaw(const std::string& content,
                                              const std::string& stored_path) {
  auto path_result = resolve(stored_path);
  if (!path_result.has_value()) {
    return std::unexpected(path_result.error());
  }

  auto write_result = util::FileSystem::writeFileAtomic(*path_result, content);
  if (!write_result.has_value()) {
    return std::unexpected(write_result.error());
  }

  return path_result->lexically_relative(config_.root).string();
}

Result<std::filesystem::path> LocalFileStorage::resolve(const std::string& stored_path) const {
  std::filesystem::path relative(stored_path);
  if (relative.empty() || relative.is_absolute()) {
    return std::unexpected(makeError(ErrorCode::kSecurityError,
                                     "Stored path must be relative: '" + stored_path + "'"));
  }

  auto full = (config_.root / relative).lexically_normal();
  auto inside = full.lexically_relative(config_.root);
  if (inside.empty() || inside == "." || *inside.begin() == "..") {
    return std::unexpected(makeError(ErrorCode::kSecurityError,
                                     "Path escapes storage root: " + stored_path));
  }

  return full;
}

std::string LocalFileStorage::detectMimeType(const std::filesystem::path& file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // Simple MIME type detection based on extension
  static const std::unordered_map<std::string, std::string> mime_types = {
    {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
    {".png", "image/png"}, {".gif", "image/gif"}, {".svg", "image/svg+xml"},
    {".webp", "image/webp"}, {".ico", "image/x-icon"},
    {".pdf", "application/pdf"},
    {".txt", "text/plain"}, {".md", "text/markdown"},
    {".json", "application/json"}, {".xml", "application/xml"},
    {".csv", "text/csv"},
    {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".ogg", "audio/ogg"},
    {".mp4", "video/mp4"}, {".webm", "video/webm"},
    {".zip", "application/zip"}, {".tar", "application/x-tar"},
    {".gz", "application/gzip"}
  };

  auto it = mime_types.find(extension);
  if (it != mime_types.end()) {
    return it->second;
  }

  return "application/octet-stream";
}

}  // namespace depot::store
