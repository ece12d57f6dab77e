#include "nb/cli/commands/edit_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"
#include "nb/cli/commands/command_input.hpp"

namespace nb::cli {

EditCommand::EditCommand(Application& app) : app_(app) {
}

Result<int> EditCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  if (!from_stdin_ && content_.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "New content required (positional or --stdin)"));
  }

  auto admitted = app_.admit("edit-note");
  NB_TRY_COMMAND(error_handler, admitted, "edit-note");

  auto result = app_.notesManager().editNote(title_, resolveContent(content_, from_stdin_));
  if (!result.isOk()) {
    auto context = NB_ERROR_CONTEXT()
      .withSubject(title_)
      .withStack({"EditCommand::execute", "NotesManager::editNote"});
    return error_handler.handleOperationResult(result, context);
  }

  if (options.json) {
    std::cout << notes::toJson(result.value()).dump(2) << std::endl;
  } else {
    error_handler.displaySuccess("Updated note: " + title_);
  }
  return 0;
}

void EditCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("title", title_, "Exact note title")->required();
  cmd->add_option("content", content_, "New note body");
  cmd->add_flag("--stdin", from_stdin_, "Read the new body from standard input");
}

} // namespace nb::cli
