#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "nb/cli/application.hpp"

namespace nb::cli {

class AccountsCommand : public Command {
public:
  explicit AccountsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "accounts"; }
  std::string description() const override { return "List accounts known to the Notes app"; }

private:
  Application& app_;
};

} // namespace nb::cli
