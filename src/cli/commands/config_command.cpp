#include "nb/cli/commands/config_command.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"

namespace nb::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { mode_ = Mode::kGet; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { mode_ = Mode::kSet; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { mode_ = Mode::kList; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { mode_ = Mode::kPath; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { mode_ = Mode::kValidate; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  switch (mode_) {
    case Mode::kGet: return executeGet(options);
    case Mode::kSet: return executeSet(options);
    case Mode::kList: return executeList(options);
    case Mode::kPath: return executePath(options);
    case Mode::kValidate: return executeValidate(options);
    case Mode::kNone: break;
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }

  auto result = app_.config().get(key_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *result;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *result << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }

  auto& config = app_.config();
  auto result = config.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto save_result = config.save();
  if (!save_result.has_value()) {
    return std::unexpected(makeError(save_result.error().code(),
                                     "Failed to save configuration: " + save_result.error().message()));
  }

  CommandErrorHandler error_handler(options);
  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    std::cout << output.dump(2) << "\n";
  } else {
    error_handler.displaySuccess("Configuration updated: " + key_ + " = " + value_);
  }
  return 0;
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  auto& config = app_.config();

  nlohmann::json output;
  for (const auto& key : nb::config::Config::keys()) {
    auto value = config.get(key);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    if (options.json) {
      output[key] = *value;
    } else {
      std::cout << key << " = " << *value << "\n";
    }
  }

  if (options.json) {
    std::cout << output.dump(2) << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto config_path = app_.config().path().empty() ? nb::config::Config::defaultConfigPath()
                                                  : app_.config().path();
  bool exists = std::filesystem::exists(config_path);

  if (options.json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << config_path.string() << "\n";
    if (!exists && !options.quiet) {
      std::cout << "(file not found, using defaults)\n";
    }
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(const GlobalOptions& options) {
  auto result = app_.config().validate();

  if (options.json) {
    nlohmann::json output;
    output["valid"] = result.has_value();
    if (!result.has_value()) {
      output["error"] = result.error().message();
    }
    std::cout << output.dump(2) << "\n";
  } else if (result.has_value()) {
    std::cout << "Configuration is valid\n";
  } else {
    std::cout << "Configuration validation failed: " << result.error().message() << "\n";
  }
  return result.has_value() ? 0 : 1;
}

bool ConfigCommand::isValidConfigKey(const std::string& key) const {
  auto keys = nb::config::Config::keys();
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

}  // namespace nb::cli
