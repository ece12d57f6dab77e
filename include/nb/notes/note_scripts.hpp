#pragma once

#include <string>
#include <string_view>

// AppleScript generators for every note operation. Each returns complete
// script text; user-supplied values are sanitized inside. Commands that look
// entities up by name return a sentinel on both the found and the missing path.
namespace nb::notes::scripts {

// Target application and account shared by all commands of one manager
struct Target {
  std::string application;
  std::string account;
  char list_separator = ',';
};

std::string listAccounts(const Target& target);

// make new note in the application's default account
std::string createNoteInDefaultAccount(const Target& target, std::string_view title,
                                       std::string_view body);

// make new note inside the configured account
std::string createNoteInAccount(const Target& target, std::string_view title,
                                std::string_view body);

// make new note inside a named folder of the configured account
std::string createNoteInFolder(const Target& target, std::string_view folder,
                               std::string_view title, std::string_view body);

std::string searchNotes(const Target& target, std::string_view query);

std::string getNoteBody(const Target& target, std::string_view title);

std::string editNoteBody(const Target& target, std::string_view title, std::string_view body);

std::string deleteNote(const Target& target, std::string_view title);

std::string listFolders(const Target& target);

std::string moveNote(const Target& target, std::string_view title, std::string_view folder);

}  // namespace nb::notes::scripts
