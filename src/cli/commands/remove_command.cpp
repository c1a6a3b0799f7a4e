#include "depot/cli/commands/remove_command.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace depot::cli {

RemoveCommand::RemoveCommand(Application& app) : app_(app) {
}

Result<int> RemoveCommand::execute(const GlobalOptions& options) {
  std::filesystem::path stored(stored_path_);

  auto remove_result = app_.storage().remove(stored.filename().string(),
                                             stored.parent_path().string());
  if (!remove_result.has_value()) {
    return std::unexpected(remove_result.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["removed"] = stored_path_;
    std::cout << result.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Removed " << stored_path_ << std::endl;
  }

  return 0;
}

void RemoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("path", stored_path_, "Stored path relative to the storage root")->required();
}

} // namespace depot::cli
