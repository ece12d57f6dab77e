#include "nb/cli/commands/remove_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"

namespace nb::cli {

RemoveCommand::RemoveCommand(Application& app) : app_(app) {
}

Result<int> RemoveCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto admitted = app_.admit("delete-note");
  NB_TRY_COMMAND(error_handler, admitted, "delete-note");

  auto result = app_.notesManager().deleteNote(title_);
  if (!result.isOk()) {
    auto context = NB_ERROR_CONTEXT()
      .withSubject(title_)
      .withStack({"RemoveCommand::execute", "NotesManager::deleteNote"});
    return error_handler.handleOperationResult(result, context);
  }

  if (options.json) {
    nlohmann::json result_json;
    result_json["success"] = true;
    result_json["title"] = title_;
    result_json["operation"] = "delete";
    std::cout << result_json.dump() << std::endl;
  } else {
    error_handler.displaySuccess("Deleted note: " + title_);
  }
  return 0;
}

void RemoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("title", title_, "Exact title of the note to delete")->required();
}

} // namespace nb::cli
