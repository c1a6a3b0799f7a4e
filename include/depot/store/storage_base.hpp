#pragma once

#include <cstdint>
#include <string>

#include "depot/common.hpp"
#include "depot/naming/file_descriptor.hpp"
#include "depot/naming/legacy_namer.hpp"
#include "depot/naming/naming_policy.hpp"
#include "depot/naming/unique_namer.hpp"

namespace depot::store {

// File content handed back by serve()
struct ServedFile {
  std::string content;
  std::string mime_type;
  std::uintmax_t size = 0;
};

// Capability contract for storage backends. Every operation is pure
// virtual, so a backend missing one of them does not compile when it is
// instantiated. Naming helpers are shared by all backends.
class StorageBase {
 public:
  explicit StorageBase(naming::NamingPolicy policy = {});
  virtual ~StorageBase() = default;

  // Whether filename already exists inside target_dir
  virtual Result<bool> exists(const std::string& filename, const std::string& target_dir) = 0;

  // Store an uploaded file, returning the path it was stored at
  virtual Result<std::string> save(const naming::FileDescriptor& file,
                                   const std::string& target_dir = "") = 0;

  // Content and type of a stored file, for handing to a client
  virtual Result<ServedFile> serve(const std::string& stored_path) = 0;

  // Delete a stored file
  virtual Result<void> remove(const std::string& filename, const std::string& target_dir) = 0;

  // Raw bytes of a stored file
  virtual Result<std::string> read(const std::string& stored_path) = 0;

  // Dated "base/YYYY/MM" directory for new uploads
  std::string targetDir(const std::string& base_dir = "") const;

  // Hash-based unique path, no existence check needed
  std::string uniquePathname(const naming::FileDescriptor& file,
                             const std::string& target_dir) const;

  // Sequential "name-N" path, probing exists() at most
  // policy().legacy_max_attempts times
  Result<std::string> legacyUniquePathname(const naming::FileDescriptor& file,
                                           const std::string& target_dir);

  const naming::NamingPolicy& policy() const { return namer_.policy(); }

 private:
  naming::UniqueNamer namer_;
};

}  // namespace depot::store
