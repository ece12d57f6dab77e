#include "nb/cli/commands/folders_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"

namespace nb::cli {

FoldersCommand::FoldersCommand(Application& app) : app_(app) {
}

Result<int> FoldersCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto admitted = app_.admit("list-folders");
  NB_TRY_COMMAND(error_handler, admitted, "list-folders");

  auto result = app_.notesManager().listFolders();
  if (!result.isOk()) {
    auto context = NB_ERROR_CONTEXT()
      .withSubject(app_.config().account)
      .withStack({"FoldersCommand::execute", "NotesManager::listFolders"});
    return error_handler.handleOperationResult(result, context);
  }

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& folder : result.value()) {
      output.push_back(notes::toJson(folder));
    }
    std::cout << output.dump(2) << std::endl;
  } else {
    for (const auto& folder : result.value()) {
      std::cout << folder.name << "\n";
    }
    std::cout.flush();
  }
  return 0;
}

} // namespace nb::cli
