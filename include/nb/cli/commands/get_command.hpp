#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "nb/cli/application.hpp"

namespace nb::cli {

class GetCommand : public Command {
public:
  explicit GetCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "get"; }
  std::string description() const override { return "Print the body of a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string title_;
};

} // namespace nb::cli
