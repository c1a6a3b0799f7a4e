#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "depot/common.hpp"
#include "depot/naming/naming_policy.hpp"

namespace depot::config {

// Configuration for depot
class Config {
 public:
  // Default constructor loads from default config file. A file that fails
  // to load leaves the defaults in place and is reported by loadError().
  Config();

  // Load from specific file, keeping defaults when it fails to load
  explicit Config(const std::filesystem::path& config_path);

  // Defaults only, no file is read
  static Config defaults();

  // Defaults overlaid with config_path, failing on a missing or invalid file
  static Result<Config> fromFile(const std::filesystem::path& config_path);

  // Naming limits, handed to every storage backend
  naming::NamingPolicy naming;

  // Local storage backend
  std::filesystem::path storage_root;
  bool dated_directories = true;

  // Logging
  std::string log_level = "info";
  std::filesystem::path log_file;

  // Load configuration from file, keeping current values for missing keys.
  // Nothing changes unless the whole file parses and validates.
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Validate configuration
  Result<void> validate() const;

  // Get default config path
  static std::filesystem::path defaultConfigPath();

  const std::filesystem::path& configPath() const { return config_path_; }

  // Why the constructor fell back to defaults, if it did
  const std::optional<Error>& loadError() const { return load_error_; }

 private:
  struct DefaultsTag {};
  explicit Config(DefaultsTag);

  std::filesystem::path config_path_;
  std::optional<Error> load_error_;

  void applyDefaults();
};

}  // namespace depot::config
