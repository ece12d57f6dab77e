#include "nb/notes/notes_manager.hpp"

#include <array>

#include <spdlog/spdlog.h>

#include "nb/notes/creation_strategy.hpp"
#include "nb/notes/note_scripts.hpp"
#include "nb/script/result_decoder.hpp"
#include "nb/script/sentinels.hpp"

namespace nb::notes {

using script::Signal;
using script::SentinelRule;
namespace sentinel = script::sentinel;

namespace {

constexpr std::array<SentinelRule, 0> kNoRules = {};

constexpr std::array<SentinelRule, 1> kNoteRules = {{
    {sentinel::kNotFound, Signal::kNotFound},
}};

constexpr std::array<SentinelRule, 2> kMoveRules = {{
    {sentinel::kNoteNotFound, Signal::kNotFound},
    {sentinel::kFolderNotFound, Signal::kFolderNotFound},
}};

scripts::Target targetOf(const NotesManagerOptions& options) {
  return scripts::Target{options.application, options.account, options.list_separator};
}

// Decode a command that answers "success" or one of `rules`
template <size_t N>
OperationResult<Done> decodeAcknowledged(const script::CommandOutcome& outcome,
                                         const std::array<SentinelRule, N>& rules,
                                         const char* failure_message) {
  auto decoded = script::decode(outcome, rules);
  switch (decoded.signal) {
    case Signal::kNotFound:
      return OperationResult<Done>::notFound();
    case Signal::kFolderNotFound:
      return OperationResult<Done>::folderNotFound();
    case Signal::kFailed:
      return OperationResult<Done>::failed(kExecutionFailedMessage);
    case Signal::kPayload:
      break;
  }

  if (decoded.payload != sentinel::kSuccess) {
    spdlog::warn("Unexpected answer from script, expected '{}'", sentinel::kSuccess);
    return OperationResult<Done>::failed(failure_message);
  }
  return OperationResult<Done>::ok(Done{});
}

}  // namespace

std::string formatContent(const std::string& content) {
  std::string formatted;
  formatted.reserve(content.size());
  for (char c : content) {
    if (c == '\n') {
      formatted += "<br>";
    } else {
      formatted += c;
    }
  }
  return formatted;
}

NotesManager::NotesManager(script::CommandExecutor& executor, NotesManagerOptions options)
    : executor_(executor), options_(std::move(options)) {}

script::CommandOutcome NotesManager::run(const char* operation, const std::string& command) {
  spdlog::debug("Running {} against account '{}'", operation, options_.account);
  auto outcome = executor_.execute(command);
  if (!outcome.success) {
    spdlog::debug("{} failed: {}", operation, outcome.error.value_or(""));
  }
  return outcome;
}

OperationResult<std::vector<std::string>> NotesManager::listAccounts() {
  auto outcome = run("listAccounts", scripts::listAccounts(targetOf(options_)));
  auto decoded = script::decode(outcome, kNoRules);
  if (decoded.signal != Signal::kPayload) {
    return OperationResult<std::vector<std::string>>::failed(kExecutionFailedMessage);
  }
  return OperationResult<std::vector<std::string>>::ok(
      script::decodeList(decoded.payload, options_.list_separator));
}

OperationResult<Note> NotesManager::createNote(const std::string& title, const std::string& content,
                                               const std::vector<std::string>& tags,
                                               const std::optional<std::string>& folder) {
  auto strategy = CreationStrategy::forNote(targetOf(options_), title, formatContent(content),
                                            folder);
  spdlog::debug("Running createNote with {} variant(s)", strategy.variants().size());

  auto decoded = strategy.run(executor_);
  switch (decoded.signal) {
    case Signal::kFolderNotFound:
      return OperationResult<Note>::folderNotFound();
    case Signal::kFailed:
      return OperationResult<Note>::failed("Failed to create note");
    case Signal::kNotFound:
    case Signal::kPayload:
      break;
  }

  if (decoded.signal != Signal::kPayload || decoded.payload != sentinel::kCreated) {
    spdlog::warn("Unexpected answer from create script, expected '{}'", sentinel::kCreated);
    return OperationResult<Note>::failed("Failed to create note");
  }

  spdlog::info("Created note in account '{}'", options_.account);
  return OperationResult<Note>::ok(Note::make(title, content, tags));
}

OperationResult<std::vector<Note>> NotesManager::searchNotes(const std::string& query) {
  auto outcome = run("searchNotes", scripts::searchNotes(targetOf(options_), query));
  auto decoded = script::decode(outcome, kNoRules);
  if (decoded.signal != Signal::kPayload) {
    return OperationResult<std::vector<Note>>::failed(kExecutionFailedMessage);
  }

  std::vector<Note> notes;
  for (auto& title : script::decodeList(decoded.payload, options_.list_separator)) {
    notes.push_back(Note::make(std::move(title)));
  }
  return OperationResult<std::vector<Note>>::ok(std::move(notes));
}

OperationResult<std::string> NotesManager::getNoteContent(const std::string& title) {
  auto outcome = run("getNoteContent", scripts::getNoteBody(targetOf(options_), title));
  auto decoded = script::decode(outcome, kNoteRules);
  switch (decoded.signal) {
    case Signal::kPayload:
      return OperationResult<std::string>::ok(std::move(decoded.payload));
    case Signal::kNotFound:
      return OperationResult<std::string>::notFound();
    case Signal::kFolderNotFound:
    case Signal::kFailed:
      break;
  }
  return OperationResult<std::string>::failed(kExecutionFailedMessage);
}

OperationResult<Note> NotesManager::editNote(const std::string& title, const std::string& content) {
  auto outcome = run("editNote",
                     scripts::editNoteBody(targetOf(options_), title, formatContent(content)));
  auto acknowledged = decodeAcknowledged(outcome, kNoteRules, "Failed to update note");
  switch (acknowledged.status()) {
    case OperationStatus::kOk:
      return OperationResult<Note>::ok(Note::make(title, content));
    case OperationStatus::kNotFound:
      return OperationResult<Note>::notFound();
    case OperationStatus::kFolderNotFound:
      return OperationResult<Note>::folderNotFound();
    case OperationStatus::kFailed:
      break;
  }
  return OperationResult<Note>::failed(acknowledged.message());
}

OperationResult<Done> NotesManager::deleteNote(const std::string& title) {
  auto outcome = run("deleteNote", scripts::deleteNote(targetOf(options_), title));
  return decodeAcknowledged(outcome, kNoteRules, "Failed to delete note");
}

OperationResult<std::vector<Folder>> NotesManager::listFolders() {
  auto outcome = run("listFolders", scripts::listFolders(targetOf(options_)));
  auto decoded = script::decode(outcome, kNoRules);
  if (decoded.signal != Signal::kPayload) {
    return OperationResult<std::vector<Folder>>::failed(kExecutionFailedMessage);
  }

  std::vector<Folder> folders;
  for (auto& name : script::decodeList(decoded.payload, options_.list_separator)) {
    folders.push_back(Folder::make(std::move(name), options_.account));
  }
  return OperationResult<std::vector<Folder>>::ok(std::move(folders));
}

OperationResult<Done> NotesManager::moveNote(const std::string& title, const std::string& folder) {
  auto outcome = run("moveNote", scripts::moveNote(targetOf(options_), title, folder));
  return decodeAcknowledged(outcome, kMoveRules, "Failed to move note");
}

}  // namespace nb::notes
