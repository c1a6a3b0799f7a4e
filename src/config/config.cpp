#include "depot/config/config.hpp"

#include <sstream>

#include <toml++/toml.hpp>

#include "depot/util/filesystem.hpp"
#include "depot/util/xdg.hpp"

namespace depot::config {

Config::Config() {
  applyDefaults();

  // Try to load from default location
  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = load(default_path);
    if (!result.has_value()) {
      load_error_ = result.error();
    }
  }
}

Config::Config(const std::filesystem::path& config_path) {
  applyDefaults();

  auto result = load(config_path);
  if (!result.has_value()) {
    // Continue with defaults so the caller can still operate
    load_error_ = result.error();
  }
}

Config::Config(DefaultsTag) {
  applyDefaults();
}

Config Config::defaults() {
  return Config(DefaultsTag{});
}

Result<Config> Config::fromFile(const std::filesystem::path& config_path) {
  Config config(DefaultsTag{});
  auto result = config.load(config_path);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return config;
}

void Config::applyDefaults() {
  naming = naming::NamingPolicy{};
  storage_root = util::Xdg::contentDir();
  dated_directories = true;
  log_level = "info";
  log_file.clear();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  // Parsed values only replace the current ones once they validate
  Config next = *this;

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto naming_table = config_data["naming"].as_table()) {
      if (auto value = (*naming_table)["max_filename_bytes"].value<int64_t>()) {
        if (*value <= 0) {
          return std::unexpected(makeError(ErrorCode::kValidationError,
                                           "naming.max_filename_bytes must be positive"));
        }
        next.naming.max_filename_bytes = static_cast<size_t>(*value);
      }
      if (auto value = (*naming_table)["default_suffix"].value<std::string>()) {
        next.naming.default_suffix = *value;
      }
      if (auto value = (*naming_table)["legacy_max_attempts"].value<int64_t>()) {
        if (*value <= 0) {
          return std::unexpected(makeError(ErrorCode::kValidationError,
                                           "naming.legacy_max_attempts must be positive"));
        }
        next.naming.legacy_max_attempts = static_cast<size_t>(*value);
      }
    }

    if (auto storage_table = config_data["storage"].as_table()) {
      if (auto value = (*storage_table)["root"].value<std::string>()) {
        next.storage_root = *value;
      }
      if (auto value = (*storage_table)["dated_directories"].value<bool>()) {
        next.dated_directories = *value;
      }
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        next.log_level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        next.log_file = *value;
      }
    }

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.description())));
  }

  auto validation = next.validate();
  if (!validation.has_value()) {
    return validation;
  }

  next.config_path_ = config_path;
  next.load_error_.reset();
  *this = std::move(next);
  return {};
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data{
      {"naming", toml::table{
          {"max_filename_bytes", static_cast<int64_t>(naming.max_filename_bytes)},
          {"default_suffix", naming.default_suffix},
          {"legacy_max_attempts", static_cast<int64_t>(naming.legacy_max_attempts)},
      }},
      {"storage", toml::table{
          {"root", storage_root.string()},
          {"dated_directories", dated_directories},
      }},
      {"logging", toml::table{
          {"level", log_level},
          {"file", log_file.string()},
      }},
  };

  std::ostringstream oss;
  oss << config_data << "\n";
  return util::FileSystem::writeFileAtomic(save_path, oss.str());
}

Result<void> Config::validate() const {
  auto naming_result = naming.validate();
  if (!naming_result.has_value()) {
    return naming_result;
  }

  if (storage_root.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "storage.root must not be empty"));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

}  // namespace depot::config
