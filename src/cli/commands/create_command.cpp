#include "nb/cli/commands/create_command.hpp"

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"
#include "nb/cli/commands/command_input.hpp"

namespace nb::cli {

CreateCommand::CreateCommand(Application& app) : app_(app) {
}

Result<int> CreateCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto admitted = app_.admit("create-note");
  NB_TRY_COMMAND(error_handler, admitted, "create-note");

  std::optional<std::string> folder;
  if (!folder_.empty()) {
    folder = folder_;
  }

  auto result = app_.notesManager().createNote(title_, resolveContent(content_, from_stdin_),
                                               tags_, folder);
  if (!result.isOk()) {
    auto context = NB_ERROR_CONTEXT()
      .withSubject(folder ? *folder : title_)
      .withStack({"CreateCommand::execute", "NotesManager::createNote"});
    return error_handler.handleOperationResult(result, context);
  }

  if (options.json) {
    std::cout << notes::toJson(result.value()).dump(2) << std::endl;
  } else {
    std::string where = folder ? " in folder " + *folder : "";
    error_handler.displaySuccess("Created note: " + title_ + where);
  }
  return 0;
}

void CreateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("title", title_, "Note title")->required();
  cmd->add_option("content", content_, "Note body");
  cmd->add_option("-t,--tags", tags_, "Tags recorded on the returned note")->delimiter(',');
  cmd->add_option("-f,--folder", folder_, "Folder to create the note in");
  cmd->add_flag("--stdin", from_stdin_, "Read the body from standard input");
}

} // namespace nb::cli
