#include "depot/naming/path_builder.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace depot::naming {

std::string PathBuilder::join(std::string_view directory, std::string_view filename) {
  std::filesystem::path joined(directory);
  joined /= std::filesystem::path(filename);
  return joined.lexically_normal().string();
}

std::string PathBuilder::datedDirectory(std::string_view base,
                                        std::chrono::system_clock::time_point when) {
  auto time_t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &time_t);
#else
  localtime_r(&time_t, &local);
#endif

  std::ostringstream year;
  year << std::put_time(&local, "%Y");
  std::ostringstream month;
  month << std::put_time(&local, "%m");

  std::filesystem::path dir(base);
  dir /= year.str();
  dir /= month.str();
  return dir.lexically_normal().string();
}

}  // namespace depot::naming
