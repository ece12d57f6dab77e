#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "nb/common.hpp"

namespace nb::notes {

// Locally generated identifier for notes and folders. The scripting
// interpreter does not report stable ids, so every returned entity gets a
// fresh ULID: 26 Crockford base32 characters, sortable by creation time.
// Ids generated within the same millisecond keep their generation order.
class NoteId {
 public:
  static NoteId generate();
  static NoteId generate(std::chrono::system_clock::time_point timestamp);

  static Result<NoteId> fromString(std::string_view str);

  // Default constructor creates invalid ID
  NoteId() = default;

  const std::string& toString() const noexcept { return id_; }

  std::chrono::system_clock::time_point timestamp() const;

  bool operator==(const NoteId& other) const noexcept { return id_ == other.id_; }
  bool operator!=(const NoteId& other) const noexcept { return id_ != other.id_; }
  bool operator<(const NoteId& other) const noexcept { return id_ < other.id_; }

  bool isValid() const noexcept;

 private:
  explicit NoteId(std::string id);

  static bool isValidFormat(std::string_view str);

  std::string id_;
};

}  // namespace nb::notes
