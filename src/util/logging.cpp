#include "depot/util/logging.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace depot::util {

namespace {
constexpr size_t kMaxLogFileBytes = 1024 * 1024 * 5;  // 5MB files
constexpr size_t kMaxLogFiles = 3;
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
}  // namespace

spdlog::level::level_enum Logging::parseLevel(std::string_view level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void Logging::initialize(std::string_view level, const std::filesystem::path& log_file) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  std::string file_error;
  if (!log_file.empty()) {
    try {
      std::error_code ec;
      if (log_file.has_parent_path()) {
        std::filesystem::create_directories(log_file.parent_path(), ec);
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file.string(), kMaxLogFileBytes, kMaxLogFiles));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("depot", sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(parseLevel(level));
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

}  // namespace depot::util
