#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace depot::naming {

// An incoming file as handed to a storage backend
struct FileDescriptor {
  std::string name;                   // Client-supplied name, may carry a path prefix
  std::optional<std::string> suffix;  // Marker to preserve, policy default when unset
  std::filesystem::path path;         // Where the upload currently lives (save only)
};

}  // namespace depot::naming
