#include "depot/cli/commands/name_command.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace depot::cli {

NameCommand::NameCommand(Application& app) : app_(app) {
}

Result<int> NameCommand::execute(const GlobalOptions& options) {
  auto& storage = app_.storage();

  naming::FileDescriptor file;
  file.name = file_name_;
  if (!suffix_.empty()) {
    file.suffix = suffix_;
  }

  std::string directory = target_dir_;
  if (directory.empty() && storage.config().dated_directories) {
    directory = storage.targetDir();
  }

  std::string pathname;
  if (legacy_) {
    auto legacy_result = storage.legacyUniquePathname(file, directory);
    if (!legacy_result.has_value()) {
      return std::unexpected(legacy_result.error());
    }
    pathname = *legacy_result;
  } else {
    pathname = storage.uniquePathname(file, directory);
  }

  if (options.json) {
    nlohmann::json result;
    result["name"] = file_name_;
    result["path"] = pathname;
    result["directory"] = directory;
    result["filename"] = std::filesystem::path(pathname).filename().string();
    result["mode"] = legacy_ ? "legacy" : "hash";
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << pathname << std::endl;
  }

  return 0;
}

void NameCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_name_, "Incoming file name")->required();
  cmd->add_option("-d,--dir", target_dir_, "Target directory (default: dated directory)");
  cmd->add_option("-s,--suffix", suffix_, "Marker suffix to preserve (default from config)");
  cmd->add_flag("--legacy", legacy_, "Use sequential name-N naming checked against the storage root");
}

} // namespace depot::cli
