#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "nb/common.hpp"
#include "nb/config/config.hpp"
#include "nb/notes/notes_manager.hpp"
#include "nb/script/command_executor.hpp"
#include "nb/util/rate_limiter.hpp"

namespace nb::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string account;         // --account: Override configured account
  int timeout_ms = 0;          // --timeout: Override interpreter timeout (0 = config)
  bool no_color = false;       // --no-color: Disable colored output
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
   * @return Result with exit code (0 = success, 1 = failure, 2 = not found)
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

  // Runs note commands on `executor` instead of spawning the configured interpreter
  explicit Application(std::shared_ptr<script::CommandExecutor> executor);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration and build services without running a command
   */
  Result<void> initialize();

  /**
   * @brief Gate in front of every note operation
   *
   * Fails when the configuration is invalid or when `operation` has used up
   * its rate limit window.
   */
  Result<void> admit(const std::string& operation);

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  nb::config::Config& config();
  nb::notes::NotesManager& notesManager();
  nb::util::RateLimiter& rateLimiter();

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  std::unique_ptr<nb::config::Config> config_;
  std::shared_ptr<script::CommandExecutor> executor_;
  std::unique_ptr<nb::notes::NotesManager> notes_manager_;
  std::unique_ptr<nb::util::RateLimiter> rate_limiter_;
  bool services_initialized_ = false;

  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace nb::cli
