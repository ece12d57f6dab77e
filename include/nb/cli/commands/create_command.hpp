#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "nb/cli/application.hpp"

namespace nb::cli {

class CreateCommand : public Command {
public:
  explicit CreateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "create"; }
  std::string description() const override { return "Create a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string title_;
  std::string content_;
  std::vector<std::string> tags_;
  std::string folder_;
  bool from_stdin_ = false;
};

} // namespace nb::cli
