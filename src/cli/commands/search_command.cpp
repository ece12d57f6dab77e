#include "nb/cli/commands/search_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "nb/cli/command_error_handler.hpp"

namespace nb::cli {

SearchCommand::SearchCommand(Application& app) : app_(app) {
}

Result<int> SearchCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto admitted = app_.admit("search-notes");
  NB_TRY_COMMAND(error_handler, admitted, "search-notes");

  auto result = app_.notesManager().searchNotes(query_);
  if (!result.isOk()) {
    auto context = NB_ERROR_CONTEXT()
      .withSubject(query_)
      .withStack({"SearchCommand::execute", "NotesManager::searchNotes"});
    return error_handler.handleOperationResult(result, context);
  }

  const auto& found = result.value();
  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& note : found) {
      output.push_back(notes::toJson(note));
    }
    std::cout << output.dump(2) << std::endl;
  } else if (found.empty()) {
    if (!options.quiet) {
      std::cout << "No notes found for \"" << query_ << "\"" << std::endl;
    }
  } else {
    for (const auto& note : found) {
      std::cout << note.title << "\n";
    }
    std::cout.flush();
  }
  return 0;
}

void SearchCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("query", query_, "Text to look for in note bodies")->required();
}

} // namespace nb::cli
