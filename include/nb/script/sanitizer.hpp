#pragma once

#include <string>
#include <string_view>

namespace nb::script {

class SanitizedText;

/**
 * @brief Escape text for embedding inside an AppleScript string literal
 *
 * Order of replacements:
 *   1. \   -> \\            (first, so later escapes are not doubled)
 *   2. "   -> \"
 *   3. '   -> " & "'" & "   (close literal, concatenate a quote, reopen)
 *   4. LF, CR, TAB -> \n, \r, \t
 *
 * Empty input yields empty output. No length or content validation is done here.
 */
SanitizedText sanitize(std::string_view raw);

/**
 * @brief Text that is safe between the quotes of a single AppleScript literal
 *
 * Only sanitize() can create one, so command builders that accept a
 * SanitizedText cannot be handed raw user input by accident.
 */
class SanitizedText {
 public:
  const std::string& str() const { return value_; }
  bool empty() const { return value_.empty(); }

 private:
  explicit SanitizedText(std::string value) : value_(std::move(value)) {}

  std::string value_;

  friend SanitizedText sanitize(std::string_view raw);
};

}  // namespace nb::script
