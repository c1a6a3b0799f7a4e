#pragma once

#include <filesystem>
#include <string>

#include "depot/store/storage_base.hpp"

namespace depot::store {

// Local-disk backend. Stored paths are relative to the configured root.
class LocalFileStorage : public StorageBase {
 public:
  struct Config {
    std::filesystem::path root;
    bool dated_directories = true;
    bool auto_create_dirs = true;
  };

  explicit LocalFileStorage(Config config, naming::NamingPolicy policy = {});
  ~LocalFileStorage() override = default;

  // StorageBase interface
  Result<bool> exists(const std::string& filename, const std::string& target_dir) override;
  Result<std::string> save(const naming::FileDescriptor& file,
                           const std::string& target_dir = "") override;
  Result<ServedFile> serve(const std::string& stored_path) override;
  Result<void> remove(const std::string& filename, const std::string& target_dir) override;
  Result<std::string> read(const std::string& stored_path) override;

  // Write a buffer to an exact relative path, replacing any existing file
  Result<std::string> saveRaw(const std::string& content, const std::string& stored_path);

  const Config& config() const { return config_; }

  // Map a stored path under the root, rejecting paths that escape it
  Result<std::filesystem::path> resolve(const std::string& stored_path) const;

  static std::string detectMimeType(const std::filesystem::path& file_path);

 private:
  Config config_;
};

}  // namespace depot::store
