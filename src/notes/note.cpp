#include "nb/notes/note.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace nb::notes {

Note Note::make(std::string title, std::string content, std::vector<std::string> tags) {
  auto now = std::chrono::system_clock::now();
  return Note{NoteId::generate(now), std::move(title), std::move(content), std::move(tags),
              now, now};
}

Folder Folder::make(std::string name, std::string account) {
  return Folder{NoteId::generate(), std::move(name), std::move(account)};
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  std::tm utc_tm{};
  gmtime_r(&time_t, &utc_tm);

  std::ostringstream oss;
  oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

nlohmann::json toJson(const Note& note) {
  nlohmann::json json;
  json["id"] = note.id.toString();
  json["title"] = note.title;
  json["content"] = note.content;
  json["tags"] = note.tags;
  json["created"] = formatTimestamp(note.created);
  json["modified"] = formatTimestamp(note.modified);
  return json;
}

nlohmann::json toJson(const Folder& folder) {
  nlohmann::json json;
  json["id"] = folder.id.toString();
  json["name"] = folder.name;
  json["account"] = folder.account;
  return json;
}

}  // namespace nb::notes
