#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "depot/naming/naming_policy.hpp"

namespace depot::naming {

// Builds "stem-hash[suffix][ext]" within a byte budget. Only the stem is
// ever shortened, and only on UTF-8 code point boundaries. The result fits
// max_filename_bytes only while the tail does; UniqueNamer guarantees that
// through NamingPolicy::validate() and NamingPolicy::fitsMarker().
class NameComposer {
 public:
  explicit NameComposer(size_t max_filename_bytes = NamingPolicy::kDefaultMaxFilenameBytes);

  std::string compose(std::string_view stem, std::string_view hash,
                      std::string_view suffix = {}, std::string_view ext = {}) const;

  size_t maxFilenameBytes() const { return max_filename_bytes_; }

  // Length of the longest prefix of text that is at most max_bytes long
  // and ends on a code point boundary
  static size_t fitToBytes(std::string_view text, size_t max_bytes);

 private:
  size_t max_filename_bytes_;
};

}  // namespace depot::naming
