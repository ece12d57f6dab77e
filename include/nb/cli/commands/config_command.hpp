#pragma once

#include "nb/cli/application.hpp"
#include "nb/common.hpp"

namespace nb::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value and save
 * - list: List all configuration
 * - path: Show configuration file path
 * - validate: Validate current configuration
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }

private:
  Application& app_;

  enum class Mode { kNone, kGet, kSet, kList, kPath, kValidate };
  Mode mode_ = Mode::kNone;

  std::string key_;
  std::string value_;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
  Result<int> executeValidate(const GlobalOptions& options);

  bool isValidConfigKey(const std::string& key) const;
};

}  // namespace nb::cli
