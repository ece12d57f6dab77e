#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nb/notes/note.hpp"
#include "nb/notes/operation_result.hpp"
#include "nb/script/command_executor.hpp"

namespace nb::notes {

struct NotesManagerOptions {
  std::string application = "Notes";
  std::string account = "iCloud";
  char list_separator = ',';
};

/**
 * @brief Note operations against one account of the scriptable application
 *
 * Every operation generates one command (creation may try several), runs it on
 * the executor and decodes the answer into an OperationResult. Interpreter
 * diagnostics are logged and never returned.
 */
class NotesManager {
 public:
  explicit NotesManager(script::CommandExecutor& executor,
                        NotesManagerOptions options = NotesManagerOptions{});

  OperationResult<std::vector<std::string>> listAccounts();

  OperationResult<Note> createNote(const std::string& title, const std::string& content,
                                   const std::vector<std::string>& tags = {},
                                   const std::optional<std::string>& folder = std::nullopt);

  // Notes whose body contains `query`; only titles are filled in
  OperationResult<std::vector<Note>> searchNotes(const std::string& query);

  // Body of the first note titled exactly `title`
  OperationResult<std::string> getNoteContent(const std::string& title);

  // Replaces the body of the first note titled exactly `title`
  OperationResult<Note> editNote(const std::string& title, const std::string& content);

  OperationResult<Done> deleteNote(const std::string& title);

  OperationResult<std::vector<Folder>> listFolders();

  OperationResult<Done> moveNote(const std::string& title, const std::string& folder);

  const NotesManagerOptions& options() const { return options_; }

 private:
  // Run one command, logging any process-layer diagnostic under `operation`
  script::CommandOutcome run(const char* operation, const std::string& command);

  script::CommandExecutor& executor_;
  NotesManagerOptions options_;
};

// Newlines become <br>, the line break the application stores in note bodies
std::string formatContent(const std::string& content);

// Reason reported for every process-layer failure
inline constexpr const char* kExecutionFailedMessage = "Failed to execute command";

}  // namespace nb::notes
