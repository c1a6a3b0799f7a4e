#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "depot/cli/application.hpp"

namespace depot::cli {

class NameCommand : public Command {
public:
  explicit NameCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "name"; }
  std::string description() const override { return "Print the path a file would be stored at\n\nEXAMPLES:\n  depot name \"My Photo.JPG\"\n  depot name avatar_o.png --dir images\n  depot name report.pdf --legacy"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string file_name_;
  std::string target_dir_;
  std::string suffix_;
  bool legacy_ = false;
};

} // namespace depot::cli
