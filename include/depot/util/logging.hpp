#pragma once

#include <filesystem>
#include <string_view>

#include <spdlog/common.h>

namespace depot::util {

// Logger setup for depot: stderr always, rotating file when configured
class Logging {
 public:
  // Install the "depot" logger as spdlog's default. Safe to call again
  // to change level or file.
  static void initialize(std::string_view level, const std::filesystem::path& log_file = {});

  // "trace", "debug", "info", "warn", "error", "critical", "off"; unknown -> info
  static spdlog::level::level_enum parseLevel(std::string_view level);

 private:
  Logging() = default;
};

}  // namespace depot::util
