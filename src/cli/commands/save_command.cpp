#include "depot/cli/commands/save_command.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace depot::cli {

SaveCommand::SaveCommand(Application& app) : app_(app) {
}

Result<int> SaveCommand::execute(const GlobalOptions& options) {
  naming::FileDescriptor file;
  file.path = source_path_;
  file.name = file_name_.empty() ? file.path.filename().string() : file_name_;
  if (!suffix_.empty()) {
    file.suffix = suffix_;
  }

  auto save_result = app_.storage().save(file, target_dir_);
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["name"] = file.name;
    result["source"] = source_path_;
    result["path"] = *save_result;
    result["root"] = app_.storage().config().root.string();
    result["mime_type"] = depot::store::LocalFileStorage::detectMimeType(*save_result);
    std::cout << result.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << *save_result << std::endl;
  }

  return 0;
}

void SaveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("source", source_path_, "File to store")->required()->check(CLI::ExistingFile);
  cmd->add_option("-n,--name", file_name_, "Name to derive the stored name from (default: source filename)");
  cmd->add_option("-d,--dir", target_dir_, "Directory under the storage root (default: dated directory)");
  cmd->add_option("-s,--suffix", suffix_, "Marker suffix to preserve (default from config)");
}

} // namespace depot::cli
