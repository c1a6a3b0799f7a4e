#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace depot::util {

/**
 * @brief Cryptographically secure randomness for naming stored files
 */
class Security {
public:
  static constexpr size_t kSecureHashBytes = 8;
  static constexpr size_t kSecureHashLength = kSecureHashBytes * 2;

  /**
   * @brief Fill a buffer from the operating system CSPRNG
   * @param count Number of random bytes
   * @return Random bytes
   */
  static std::vector<uint8_t> randomBytes(size_t count);

  /**
   * @brief Generate a uniqueness token for a filename
   * @return 16 lowercase hex characters (64 bits of entropy), fresh on every call
   */
  static std::string generateSecureHash();

  /**
   * @brief Render bytes as lowercase hex
   */
  static std::string toHex(const std::vector<uint8_t>& bytes);

private:
  Security() = default;
};

} // namespace depot::util
