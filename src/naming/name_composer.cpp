#include "depot/naming/name_composer.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>
#include <unicode/utf8.h>

namespace depot::naming {

NameComposer::NameComposer(size_t max_filename_bytes)
    : max_filename_bytes_(max_filename_bytes) {
}

std::string NameComposer::compose(std::string_view stem, std::string_view hash,
                                  std::string_view suffix, std::string_view ext) const {
  std::string tail;
  tail.reserve(1 + hash.size() + suffix.size() + ext.size());
  tail += '-';
  tail += hash;
  tail += suffix;
  tail += ext;

  if (stem.size() + tail.size() <= max_filename_bytes_) {
    return std::string(stem) + tail;
  }

  // The tail is fixed, so whatever is left is the budget for the stem
  size_t budget = tail.size() < max_filename_bytes_ ? max_filename_bytes_ - tail.size() : 0;
  size_t kept = fitToBytes(stem, budget);

  spdlog::debug("Truncating stem from {} to {} bytes (limit {})",
                stem.size(), kept, max_filename_bytes_);

  return std::string(stem.substr(0, kept)) + tail;
}

size_t NameComposer::fitToBytes(std::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text.size();
  }

  const char* data = text.data();
  const auto length = static_cast<int32_t>(text.size());
  int32_t offset = 0;
  size_t boundary = 0;

  while (offset < length) {
    UChar32 codepoint = 0;
    U8_NEXT(data, offset, length, codepoint);
    (void)codepoint;

    if (static_cast<size_t>(offset) > max_bytes) {
      break;
    }
    boundary = static_cast<size_t>(offset);
  }

  return boundary;
}

}  // namespace depot::naming
