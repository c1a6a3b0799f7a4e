#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "depot/common.hpp"

namespace depot::naming {

// Limits and markers used when naming stored files. Each storage backend
// carries its own copy, so backends with different limits can coexist.
struct NamingPolicy {
  static constexpr size_t kDefaultMaxFilenameBytes = 255;
  static constexpr std::string_view kDefaultSuffix = "_o";
  static constexpr size_t kDefaultLegacyMaxAttempts = 1000;

  // Longest extension accepted by NameParts::extension(): "." + 10 chars
  static constexpr size_t kMaxExtensionBytes = 11;

  size_t max_filename_bytes = kDefaultMaxFilenameBytes;
  std::string default_suffix{kDefaultSuffix};
  size_t legacy_max_attempts = kDefaultLegacyMaxAttempts;

  // Bytes that are never truncated: "-" + hash + default suffix + longest extension
  size_t reservedBytes() const;

  // Same for an arbitrary marker suffix
  size_t reservedBytes(std::string_view marker) const;

  // True when a name keeping this marker still leaves room for the stem
  bool fitsMarker(std::string_view marker) const;

  // Check that the limits leave room for a non-empty stem and that the
  // suffix survives sanitization unchanged
  Result<void> validate() const;
};

}  // namespace depot::naming
