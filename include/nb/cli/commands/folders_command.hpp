#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "nb/cli/application.hpp"

namespace nb::cli {

class FoldersCommand : public Command {
public:
  explicit FoldersCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "folders"; }
  std::string description() const override { return "List folders of the account"; }

private:
  Application& app_;
};

} // namespace nb::cli
