#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "depot/common.hpp"
#include "depot/config/config.hpp"
#include "depot/store/local_file_storage.hpp"

namespace depot::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string root;            // --root: Override storage root
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  depot::config::Config& config();
  depot::store::LocalFileStorage& storage();

private:
  void setupGlobalOptions();
  void setupCommands();
  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();

  CLI::App app_;
  GlobalOptions global_options_;

  std::unique_ptr<depot::config::Config> config_;
  std::unique_ptr<depot::store::LocalFileStorage> storage_;

  std::vector<std::unique_ptr<Command>> commands_;
};

/**
 * @brief Print an error the way every command reports failures
 */
void printError(const GlobalOptions& options, const Error& error);

} // namespace depot::cli
