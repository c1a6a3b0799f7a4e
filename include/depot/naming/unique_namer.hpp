#pragma once

#include <string>
#include <string_view>

#include "depot/naming/file_descriptor.hpp"
#include "depot/naming/name_composer.hpp"
#include "depot/naming/naming_policy.hpp"

namespace depot::naming {

/**
 * @brief Hash-based naming pipeline
 *
 * basename -> sanitize -> extension / suffix -> stem -> hash -> compose -> join.
 * Stateless apart from the policy; safe to call from many threads at once.
 */
class UniqueNamer {
public:
  /**
   * @brief Bind the pipeline to a policy
   * @throws std::invalid_argument when policy.validate() fails
   */
  explicit UniqueNamer(NamingPolicy policy = {});

  /**
   * @brief Produce a fresh filename for an incoming file
   * @return "stem-<16 hex>[suffix][ext]" within the policy's byte limit.
   *         A marker too long to leave room for the stem is not kept apart
   *         and is truncated along with the stem.
   */
  std::string uniqueFilename(const FileDescriptor& file) const;

  /**
   * @brief uniqueFilename() joined onto a target directory
   */
  std::string uniquePathname(const FileDescriptor& file, std::string_view target_dir) const;

  const NamingPolicy& policy() const { return policy_; }

private:
  NamingPolicy policy_;
  NameComposer composer_;
};

} // namespace depot::naming
