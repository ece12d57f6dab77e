#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "nb/cli/application.hpp"

namespace nb::cli {

class MoveCommand : public Command {
public:
  explicit MoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "mv"; }
  std::string description() const override { return "Move a note to another folder"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string title_;
  std::string folder_;
};

} // namespace nb::cli
