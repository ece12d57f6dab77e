#include "nb/cli/commands/accounts_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"

namespace nb::cli {

AccountsCommand::AccountsCommand(Application& app) : app_(app) {
}

Result<int> AccountsCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto admitted = app_.admit("list-accounts");
  NB_TRY_COMMAND(error_handler, admitted, "list-accounts");

  auto result = app_.notesManager().listAccounts();
  if (!result.isOk()) {
    auto context = NB_ERROR_CONTEXT()
      .withStack({"AccountsCommand::execute", "NotesManager::listAccounts"});
    return error_handler.handleOperationResult(result, context);
  }

  const auto& current = app_.config().account;
  if (options.json) {
    nlohmann::json output;
    output["accounts"] = result.value();
    output["current"] = current;
    std::cout << output.dump(2) << std::endl;
  } else {
    for (const auto& account : result.value()) {
      std::cout << (account == current ? "* " : "  ") << account << "\n";
    }
    std::cout.flush();
  }
  return 0;
}

} // namespace nb::cli
