#include "depot/naming/unique_namer.hpp"

#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "depot/naming/name_parts.hpp"
#include "depot/naming/path_builder.hpp"
#include "depot/naming/sanitizer.hpp"
#include "depot/util/security.hpp"

namespace depot::naming {

UniqueNamer::UniqueNamer(NamingPolicy policy)
    : policy_(std::move(policy)), composer_(policy_.max_filename_bytes) {
  auto valid = policy_.validate();
  if (!valid.has_value()) {
    throw std::invalid_argument("Invalid naming policy: " + valid.error().message());
  }
}

std::string UniqueNamer::uniqueFilename(const FileDescriptor& file) const {
  std::string basename = std::filesystem::path(file.name).filename().string();
  std::string sanitized = Sanitizer::sanitize(basename);

  std::string ext = NameParts::extension(sanitized);
  std::string marker = file.suffix.value_or(policy_.default_suffix);
  if (!policy_.fitsMarker(marker)) {
    spdlog::debug("Marker of {} bytes leaves no room within {} bytes, not preserving it",
                  marker.size(), policy_.max_filename_bytes);
    marker.clear();
  }

  std::string suffix = NameParts::suffix(sanitized, ext, marker);
  std::string stem = NameParts::stem(sanitized, ext, suffix);

  return composer_.compose(stem, util::Security::generateSecureHash(), suffix, ext);
}

std::string UniqueNamer::uniquePathname(const FileDescriptor& file,
                                        std::string_view target_dir) const {
  return PathBuilder::join(target_dir, uniqueFilename(file));
}

} // namespace depot::naming
