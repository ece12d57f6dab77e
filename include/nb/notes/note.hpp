#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nb/notes/note_id.hpp"

namespace nb::notes {

// A note as reported back to callers. Only the title (and the body, where an
// operation read or wrote it) comes from the application; id and timestamps
// are assigned when the value is built.
struct Note {
  NoteId id;
  std::string title;
  std::string content;
  std::vector<std::string> tags;
  std::chrono::system_clock::time_point created;
  std::chrono::system_clock::time_point modified;

  static Note make(std::string title, std::string content = {},
                   std::vector<std::string> tags = {});
};

struct Folder {
  NoteId id;
  std::string name;
  std::string account;

  static Folder make(std::string name, std::string account);
};

// ISO 8601 UTC timestamp, second precision
std::string formatTimestamp(std::chrono::system_clock::time_point time);

nlohmann::json toJson(const Note& note);
nlohmann::json toJson(const Folder& folder);

}  // namespace nb::notes
