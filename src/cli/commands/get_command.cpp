#include "nb/cli/commands/get_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"

namespace nb::cli {

GetCommand::GetCommand(Application& app) : app_(app) {
}

Result<int> GetCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto admitted = app_.admit("get-note-content");
  NB_TRY_COMMAND(error_handler, admitted, "get-note-content");

  auto result = app_.notesManager().getNoteContent(title_);
  if (!result.isOk()) {
    auto context = NB_ERROR_CONTEXT()
      .withSubject(title_)
      .withStack({"GetCommand::execute", "NotesManager::getNoteContent"});
    return error_handler.handleOperationResult(result, context);
  }

  if (options.json) {
    nlohmann::json output;
    output["title"] = title_;
    output["content"] = result.value();
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << result.value() << std::endl;
  }
  return 0;
}

void GetCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("title", title_, "Exact note title")->required();
}

} // namespace nb::cli
