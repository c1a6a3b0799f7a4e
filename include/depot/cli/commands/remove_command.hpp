#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "depot/cli/application.hpp"

namespace depot::cli {

class RemoveCommand : public Command {
public:
  explicit RemoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "rm"; }
  std::string description() const override { return "Remove a stored file\n\nEXAMPLES:\n  depot rm 2024/06/photo-3f2a9c0d11b4e6a7.jpg"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string stored_path_;
};

} // namespace depot::cli
