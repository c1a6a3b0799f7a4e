#include "depot/naming/naming_policy.hpp"

#include "depot/naming/sanitizer.hpp"
#include "depot/util/security.hpp"

namespace depot::naming {

size_t NamingPolicy::reservedBytes() const {
  return reservedBytes(default_suffix);
}

size_t NamingPolicy::reservedBytes(std::string_view marker) const {
  return 1 + util::Security::kSecureHashLength + marker.size() + kMaxExtensionBytes;
}

bool NamingPolicy::fitsMarker(std::string_view marker) const {
  return reservedBytes(marker) < max_filename_bytes;
}

Result<void> NamingPolicy::validate() const {
  if (!fitsMarker(default_suffix)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "max_filename_bytes must be greater than " +
                                     std::to_string(reservedBytes())));
  }

  if (Sanitizer::sanitize(default_suffix) != default_suffix) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "default_suffix contains characters outside [A-Za-z0-9_@.-]: " +
                                     default_suffix));
  }

  if (legacy_max_attempts == 0) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "legacy_max_attempts must be positive"));
  }

  return {};
}

}  // namespace depot::naming
