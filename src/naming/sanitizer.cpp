#include "depot/naming/sanitizer.hpp"

#include <cstdint>

#include <unicode/utf8.h>

namespace depot::naming {

bool Sanitizer::isAllowed(char32_t codepoint) {
  return (codepoint >= U'a' && codepoint <= U'z') ||
         (codepoint >= U'A' && codepoint <= U'Z') ||
         (codepoint >= U'0' && codepoint <= U'9') ||
         codepoint == U'_' || codepoint == U'@' || codepoint == U'.';
}

std::string Sanitizer::sanitize(std::string_view name) {
  std::string result;
  result.reserve(name.size());

  const char* data = name.data();
  const auto length = static_cast<int32_t>(name.size());
  int32_t offset = 0;

  while (offset < length) {
    int32_t start = offset;
    UChar32 codepoint = 0;
    U8_NEXT(data, offset, length, codepoint);

    if (codepoint < 0) {
      // Malformed sequence
      result.append(static_cast<size_t>(offset - start), '-');
    } else if (isAllowed(static_cast<char32_t>(codepoint))) {
      result.push_back(static_cast<char>(codepoint));
    } else {
      result.push_back('-');
    }
  }

  return result;
}

}  // namespace depot::naming
