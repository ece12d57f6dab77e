#include "nb/cli/commands/move_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"

namespace nb::cli {

MoveCommand::MoveCommand(Application& app) : app_(app) {
}

Result<int> MoveCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto admitted = app_.admit("move-note");
  NB_TRY_COMMAND(error_handler, admitted, "move-note");

  auto result = app_.notesManager().moveNote(title_, folder_);
  if (!result.isOk()) {
    bool folder_missing = result.status() == notes::OperationStatus::kFolderNotFound;
    auto context = NB_ERROR_CONTEXT()
      .withSubject(folder_missing ? folder_ : title_)
      .withStack({"MoveCommand::execute", "NotesManager::moveNote"});
    return error_handler.handleOperationResult(result, context);
  }

  if (options.json) {
    nlohmann::json result_json;
    result_json["success"] = true;
    result_json["title"] = title_;
    result_json["folder"] = folder_;
    std::cout << result_json.dump() << std::endl;
  } else {
    error_handler.displaySuccess("Moved note " + title_ + " to " + folder_);
  }
  return 0;
}

void MoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("title", title_, "Exact title of the note to move")->required();
  cmd->add_option("folder", folder_, "Destination folder")->required();
}

} // namespace nb::cli
