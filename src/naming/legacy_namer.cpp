#include "depot/naming/legacy_namer.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "depot/naming/name_parts.hpp"
#include "depot/naming/path_builder.hpp"
#include "depot/naming/sanitizer.hpp"

namespace depot::naming {

LegacyNamer::LegacyNamer(ExistsCheck exists, size_t max_attempts)
    : exists_(std::move(exists)), max_attempts_(max_attempts) {
}

std::string LegacyNamer::candidate(const std::string& name, const std::string& ext,
                                   size_t attempt) {
  std::string filename = name;
  if (attempt > 0) {
    filename += "-" + std::to_string(attempt);
  }
  return filename + ext;
}

Result<std::string> LegacyNamer::uniquePathname(const FileDescriptor& file,
                                                const std::string& target_dir) const {
  if (!exists_) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                        "No existence check configured");
  }

  std::string sanitized = Sanitizer::sanitize(std::filesystem::path(file.name).filename().string());
  std::string ext = NameParts::extension(sanitized);
  std::string name = NameParts::stem(sanitized, ext, "");

  for (size_t attempt = 0; attempt < max_attempts_; ++attempt) {
    std::string filename = candidate(name, ext, attempt);

    auto exists_result = exists_(filename, target_dir);
    if (!exists_result.has_value()) {
      return std::unexpected(exists_result.error());
    }

    if (!*exists_result) {
      return PathBuilder::join(target_dir, filename);
    }

    spdlog::debug("Name {} already taken in '{}'", filename, target_dir);
  }

  spdlog::warn("Gave up naming {} after {} attempts", file.name, max_attempts_);
  return makeErrorResult<std::string>(ErrorCode::kNameExhausted,
                                      "No free name for " + file.name + " after " +
                                      std::to_string(max_attempts_) + " attempts");
}

}  // namespace depot::naming
