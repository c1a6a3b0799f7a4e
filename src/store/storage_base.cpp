#include "depot/store/storage_base.hpp"

#include "depot/naming/path_builder.hpp"

namespace depot::store {

StorageBase::StorageBase(naming::NamingPolicy policy) : namer_(std::move(policy)) {
}

std::string StorageBase::targetDir(const std::string& base_dir) const {
  return naming::PathBuilder::datedDirectory(base_dir);
}

std::string StorageBase::uniquePathname(const naming::FileDescriptor& file,
                                        const std::string& target_dir) const {
  return namer_.uniquePathname(file, target_dir);
}

Result<std::string> StorageBase::legacyUniquePathname(const naming::FileDescriptor& file,
                                                      const std::string& target_dir) {
  naming::LegacyNamer legacy(
      [this](const std::string& filename, const std::string& directory) {
        return exists(filename, directory);
      },
      policy().legacy_max_attempts);
  return legacy.uniquePathname(file, target_dir);
}

}  // namespace depot::store
