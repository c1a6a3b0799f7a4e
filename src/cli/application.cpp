#include "depot/cli/application.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "depot/util/logging.hpp"
#include "depot/cli/commands/name_command.hpp"
#include "depot/cli/commands/remove_command.hpp"
#include "depot/cli/commands/save_command.hpp"

namespace depot::cli {

Application::Application()
    : app_("depot", "Collision-resistant file naming and local storage") {
  app_.set_version_flag("--version", depot::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();

  app_.footer(R"(Examples:
  depot name "Holiday Photo (1).JPG" --dir 2024/06
  depot name report.pdf --legacy --json
  depot save ./upload.tmp --name avatar_o.png
  depot rm 2024/06/avatar-3f2a9c0d11b4e6a7_o.png)");
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

depot::config::Config& Application::config() {
  return *config_;
}

depot::store::LocalFileStorage& Application::storage() {
  return *storage_;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--root", global_options_.root, "Override storage root directory");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<NameCommand>(*this));
  registerCommand(std::make_unique<SaveCommand>(*this));
  registerCommand(std::make_unique<RemoveCommand>(*this));
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      printError(global_options_, init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      printError(global_options_, result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (storage_) {
    return {};
  }

  if (global_options_.config_file.empty()) {
    config_ = std::make_unique<depot::config::Config>();
  } else {
    auto load_result = depot::config::Config::fromFile(global_options_.config_file);
    if (!load_result.has_value()) {
      return std::unexpected(load_result.error());
    }
    config_ = std::make_unique<depot::config::Config>(std::move(*load_result));
  }

  if (!global_options_.root.empty()) {
    config_->storage_root = global_options_.root;
  }

  auto validation = config_->validate();
  if (!validation.has_value()) {
    return validation;
  }

  std::string level = config_->log_level;
  if (global_options_.verbose > 1) {
    level = "trace";
  } else if (global_options_.verbose == 1) {
    level = "debug";
  } else if (global_options_.quiet) {
    level = "error";
  }
  depot::util::Logging::initialize(level, config_->log_file);

  if (config_->loadError().has_value()) {
    spdlog::warn("Ignoring config {}: {}", depot::config::Config::defaultConfigPath().string(),
                 config_->loadError()->message());
  }

  depot::store::LocalFileStorage::Config storage_config;
  storage_config.root = config_->storage_root;
  storage_config.dated_directories = config_->dated_directories;
  storage_ = std::make_unique<depot::store::LocalFileStorage>(storage_config, config_->naming);

  return {};
}

void printError(const GlobalOptions& options, const Error& error) {
  if (options.json) {
    nlohmann::json error_json;
    error_json["error"] = error.message();
    error_json["code"] = static_cast<int>(error.code());
    error_json["kind"] = std::string(errorCodeToString(error.code()));
    std::cout << error_json.dump() << std::endl;
  } else {
    std::cerr << "Error: " << error.message() << std::endl;
  }
}

} // namespace depot::cli
