#include "depot/naming/name_parts.hpp"

#include <filesystem>
#include <regex>

namespace depot::naming {

namespace {

std::string_view withoutTrailing(std::string_view text, std::string_view tail) {
  if (!tail.empty() && text.ends_with(tail)) {
    text.remove_suffix(tail.size());
  }
  return text;
}

} // namespace

bool NameParts::isValidExtension(std::string_view ext) {
  static const std::regex kExtensionShape(R"(^(\.[a-z0-9]{2,10})+$)", std::regex::icase);
  static const std::regex kNumericOnly(R"(^\.[0-9]+$)");

  if (ext.empty()) {
    return false;
  }

  const std::string value(ext);
  return std::regex_match(value, kExtensionShape) && !std::regex_match(value, kNumericOnly);
}

std::string NameParts::extension(std::string_view sanitized) {
  std::string ext = std::filesystem::path(std::string(sanitized)).extension().string();
  return isValidExtension(ext) ? ext : std::string();
}

std::string NameParts::suffix(std::string_view sanitized, std::string_view ext,
                              std::string_view candidate) {
  if (candidate.empty()) {
    return "";
  }

  std::string_view stem_with_suffix = withoutTrailing(sanitized, ext);
  if (stem_with_suffix.ends_with(candidate)) {
    return std::string(candidate);
  }
  return "";
}

std::string NameParts::stem(std::string_view sanitized, std::string_view ext,
                            std::string_view suffix) {
  return std::string(withoutTrailing(withoutTrailing(sanitized, ext), suffix));
}

} // namespace depot::naming
