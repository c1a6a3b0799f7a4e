#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace depot::naming {

// Directory joins for target paths. Nothing here touches the filesystem.
class PathBuilder {
 public:
  // Join with platform separator semantics and normalize redundant
  // separators and dot segments. An empty directory yields the filename.
  static std::string join(std::string_view directory, std::string_view filename);

  // Calendar layout "base/YYYY/MM" in local time, "YYYY/MM" for an empty base
  static std::string datedDirectory(std::string_view base,
                                    std::chrono::system_clock::time_point when =
                                        std::chrono::system_clock::now());

 private:
  PathBuilder() = default;
};

}  // namespace depot::naming
