#pragma once

#include <string>
#include <string_view>

namespace depot::naming {

// Maps arbitrary names onto the filesystem-safe alphabet [A-Za-z0-9_@.-]
class Sanitizer {
 public:
  // Replace every code point outside [A-Za-z0-9_@.] with a single '-'.
  // Input is treated as UTF-8; each byte of a malformed sequence becomes '-'.
  // Idempotent: sanitize(sanitize(x)) == sanitize(x).
  static std::string sanitize(std::string_view name);

  // True when the code point is kept unchanged by sanitize()
  static bool isAllowed(char32_t codepoint);

 private:
  Sanitizer() = default;
};

}  // namespace depot::naming
