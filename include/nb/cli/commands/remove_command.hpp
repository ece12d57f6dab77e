#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "nb/cli/application.hpp"

namespace nb::cli {

class RemoveCommand : public Command {
public:
  explicit RemoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "rm"; }
  std::string description() const override { return "Delete a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string title_;
};

} // namespace nb::cli
