#pragma once

#include <functional>
#include <string>

#include "depot/common.hpp"
#include "depot/naming/file_descriptor.hpp"

namespace depot::naming {

// Existence check supplied by a storage backend: (filename, directory) -> exists?
using ExistsCheck = std::function<Result<bool>(const std::string& filename,
                                               const std::string& directory)>;

// Sequential naming kept for backends that predate hash-based names.
// Tries "name.ext", "name-1.ext", "name-2.ext", ... until the check reports
// a free slot. Check and later write are not atomic, so concurrent callers
// may still pick the same name.
class LegacyNamer {
 public:
  LegacyNamer(ExistsCheck exists, size_t max_attempts);

  // Fails with kNameExhausted after max_attempts occupied candidates
  Result<std::string> uniquePathname(const FileDescriptor& file,
                                     const std::string& target_dir) const;

  static std::string candidate(const std::string& name, const std::string& ext, size_t attempt);

 private:
  ExistsCheck exists_;
  size_t max_attempts_;
};

}  // namespace depot::naming
