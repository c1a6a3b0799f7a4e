#pragma once

#include <string>
#include <string_view>

namespace depot::naming {

/**
 * @brief Splits a sanitized filename into stem, marker suffix and extension
 *
 * "photo_o.jpg" with candidate "_o" splits into stem "photo", suffix "_o"
 * and extension ".jpg". Every function is total: a missing part is reported
 * as an empty string.
 */
class NameParts {
public:
  /**
   * @brief Extract a plausible extension from a sanitized filename
   * @param sanitized Output of Sanitizer::sanitize()
   * @return ".ext" with 2-10 alphanumeric characters, or "" when the trailing
   *         dot-group is missing, purely numeric (".1", ".342") or out of range
   */
  static std::string extension(std::string_view sanitized);

  /**
   * @brief Check an extension candidate against the accepted shape
   */
  static bool isValidExtension(std::string_view ext);

  /**
   * @brief Detect a reserved marker right before the extension
   * @param sanitized Sanitized filename
   * @param ext Extension returned by extension()
   * @param candidate Marker to look for, e.g. "_o"
   * @return candidate when the stem ends with it, "" otherwise
   */
  static std::string suffix(std::string_view sanitized, std::string_view ext,
                            std::string_view candidate);

  /**
   * @brief Strip extension and suffix from a sanitized filename
   */
  static std::string stem(std::string_view sanitized, std::string_view ext,
                          std::string_view suffix);

private:
  NameParts() = default;
};

} // namespace depot::naming
