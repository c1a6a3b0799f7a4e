#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "depot/cli/application.hpp"

namespace depot::cli {

class SaveCommand : public Command {
public:
  explicit SaveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "save"; }
  std::string description() const override { return "Store a file under a unique name\n\nEXAMPLES:\n  depot save ./photo.jpg\n  depot save /tmp/upload-1234 --name \"Team photo.jpg\" --dir images"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string source_path_;
  std::string file_name_;
  std::string target_dir_;
  std::string suffix_;
};

} // namespace depot::cli
