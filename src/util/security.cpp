#include "depot/util/security.hpp"

#include <cerrno>
#include <random>

#include <spdlog/spdlog.h>

#ifdef __APPLE__
#include <Security/SecRandom.h>
#elif defined(__linux__)
#include <sys/random.h>
#endif

namespace depot::util {

namespace {

bool fillFromSystem(uint8_t* data, size_t count) {
#ifdef __APPLE__
  return SecRandomCopyBytes(kSecRandomDefault, count, data) == errSecSuccess;
#elif defined(__linux__)
  size_t filled = 0;
  while (filled < count) {
    ssize_t n = getrandom(data + filled, count - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    filled += static_cast<size_t>(n);
  }
  return true;
#else
  (void)data;
  (void)count;
  return false;
#endif
}

} // namespace

std::vector<uint8_t> Security::randomBytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count == 0 || fillFromSystem(bytes.data(), count)) {
    return bytes;
  }

  spdlog::warn("System CSPRNG unavailable, using std::random_device");

  // random_device draws from the kernel entropy source on supported platforms
  static thread_local std::random_device rd;
  std::uniform_int_distribution<unsigned int> dis(0, 255);
  for (auto& byte : bytes) {
    byte = static_cast<uint8_t>(dis(rd));
  }
  return bytes;
}

std::string Security::generateSecureHash() {
  return toHex(randomBytes(kSecureHashBytes));
}

std::string Security::toHex(const std::vector<uint8_t>& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";

  std::string result;
  result.reserve(bytes.size() * 2);
  for (uint8_t byte : bytes) {
    result += kDigits[byte >> 4];
    result += kDigits[byte & 0x0F];
  }
  return result;
}

} // namespace depot::util
