#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "nb/cli/application.hpp"

namespace nb::cli {

class EditCommand : public Command {
public:
  explicit EditCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "edit"; }
  std::string description() const override { return "Replace the body of a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string title_;
  std::string content_;
  bool from_stdin_ = false;
};

} // namespace nb::cli
