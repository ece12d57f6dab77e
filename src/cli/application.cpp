#include "nb/cli/application.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

#include "nb/cli/command_error_handler.hpp"
#include "nb/util/error_handler.hpp"

#include "nb/cli/commands/accounts_command.hpp"
#include "nb/cli/commands/config_command.hpp"
#include "nb/cli/commands/create_command.hpp"
#include "nb/cli/commands/edit_command.hpp"
#include "nb/cli/commands/folders_command.hpp"
#include "nb/cli/commands/get_command.hpp"
#include "nb/cli/commands/move_command.hpp"
#include "nb/cli/commands/remove_command.hpp"
#include "nb/cli/commands/search_command.hpp"

namespace nb::cli {

namespace {

std::string consoleLevelFor(const GlobalOptions& options) {
  if (options.verbose > 1) return "trace";
  if (options.verbose == 1) return "debug";
  // Errors reach the user through CommandErrorHandler
  return "off";
}

}  // namespace

Application::Application()
    : app_("nb", "Manage notes in the Notes app through AppleScript") {
  app_.set_version_flag("--version", nb::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

Application::Application(std::shared_ptr<script::CommandExecutor> executor)
    : Application() {
  executor_ = std::move(executor);
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::Error& e) {
    // Parse errors, --help and the exit codes thrown by command callbacks
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize() {
  return initializeServices();
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--account", global_options_.account, "Notes account to operate on");
  app_.add_option("--timeout", global_options_.timeout_ms, "Interpreter timeout in milliseconds")
      ->check(CLI::NonNegativeNumber);
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored output");
}

void Application::setupCommands() {
  // Note operations
  registerCommand(std::make_unique<CreateCommand>(*this));
  registerCommand(std::make_unique<SearchCommand>(*this));
  registerCommand(std::make_unique<GetCommand>(*this));
  registerCommand(std::make_unique<EditCommand>(*this));
  registerCommand(std::make_unique<RemoveCommand>(*this));
  registerCommand(std::make_unique<MoveCommand>(*this));

  // Containers
  registerCommand(std::make_unique<FoldersCommand>(*this));
  registerCommand(std::make_unique<AccountsCommand>(*this));

  // Configuration management commands
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  nb create "Groceries" "milk\neggs" --tags home --folder Lists
  nb search "eggs" --json
  nb get "Groceries"
  nb mv "Groceries" Archive
  nb --account Work folders

Exit codes: 0 success, 1 failure, 2 note or folder not found.

For more information on a specific command, run:
  nb <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler errors(global_options_);

    if (auto init_result = initializeServices(); !init_result) {
      throw CLI::RuntimeError(
          errors.handleCommandError(errors.convertError(init_result.error(), "initialize")));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result) {
      throw CLI::RuntimeError(
          errors.handleCommandError(errors.convertError(result.error(), cmd_ptr->name())));
    }
    if (*result != kExitSuccess) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  if (!global_options_.config_file.empty()) {
    std::filesystem::path config_path = global_options_.config_file;
    if (!std::filesystem::exists(config_path)) {
      return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                       "Config file not found: " + config_path.string()));
    }
    config_ = std::make_unique<nb::config::Config>(config_path);
  } else {
    config_ = std::make_unique<nb::config::Config>();
  }

  // Command line overrides
  if (!global_options_.account.empty()) {
    config_->account = global_options_.account;
  }
  if (global_options_.timeout_ms > 0) {
    config_->timeout_ms = global_options_.timeout_ms;
  }

  std::string level = global_options_.verbose > 1 ? "trace"
                      : global_options_.verbose == 1 ? "debug"
                      : config_->logging.level;
  util::setupErrorHandling(config_->logging.file, level, consoleLevelFor(global_options_));

  if (!executor_) {
    script::ExecutorOptions executor_options;
    executor_options.interpreter = config_->interpreter;
    executor_options.timeout = std::chrono::milliseconds(config_->timeout_ms);
    executor_ = std::make_shared<script::ProcessCommandExecutor>(std::move(executor_options));
  }

  notes::NotesManagerOptions manager_options;
  manager_options.application = config_->application;
  manager_options.account = config_->account;
  manager_options.list_separator = config_->list_separator.empty() ? ',' : config_->list_separator.front();
  notes_manager_ = std::make_unique<notes::NotesManager>(*executor_, std::move(manager_options));

  util::RateLimiterOptions limiter_options;
  limiter_options.window = std::chrono::milliseconds(config_->rate_limit.window_ms);
  limiter_options.max_requests = config_->rate_limit.max_requests;
  rate_limiter_ = std::make_unique<util::RateLimiter>(std::make_shared<util::SystemClock>(),
                                                      limiter_options);

  services_initialized_ = true;
  return {};
}

Result<void> Application::admit(const std::string& operation) {
  auto init_result = initializeServices();
  if (!init_result.has_value()) {
    return init_result;
  }

  auto valid = config_->validate();
  if (!valid.has_value()) {
    return valid;
  }

  if (!config_->rate_limit.enabled) {
    return {};
  }
  return rate_limiter_->check(operation);
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

nb::config::Config& Application::config() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *config_;
}

nb::notes::NotesManager& Application::notesManager() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *notes_manager_;
}

nb::util::RateLimiter& Application::rateLimiter() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *rate_limiter_;
}

} // namespace nb::cli
