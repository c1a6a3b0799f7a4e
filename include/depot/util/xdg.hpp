#pragma once

#include <filesystem>
#include <string>

namespace depot::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/depot)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/depot)
  static std::filesystem::path configHome();

  // Get default content root for the local backend
  static std::filesystem::path contentDir();

  // Get config file path
  static std::filesystem::path configFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace depot::util
