#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "nb/script/sanitizer.hpp"

namespace nb::script {

/**
 * @brief Assembles AppleScript source from trusted template lines
 *
 * Template lines are fixed text written by the caller. Anything that came from
 * user input enters a script only through literal(), which takes SanitizedText,
 * or quote(), which sanitizes on the spot.
 */
class ScriptBuilder {
 public:
  // Opens `tell application "<name>"`
  explicit ScriptBuilder(std::string_view application);

  // Opens `tell account (<name>)`
  ScriptBuilder& tellAccount(std::string_view account);

  // Opens `tell <target>` where target is a script variable
  ScriptBuilder& tellVariable(std::string_view variable);

  // Opens a block; closing is emitted by end() or build()
  ScriptBuilder& begin(std::string_view opening, std::string_view closing);

  // Closes the innermost open block
  ScriptBuilder& end();

  // Appends one trusted statement
  ScriptBuilder& add(std::string_view statement);

  // Appends `return "<sentinel>"`
  ScriptBuilder& returnSentinel(std::string_view sentinel);

  // Joins list items with a separator when the list is coerced to text
  ScriptBuilder& useListSeparator(char separator);

  // Closes all open blocks and returns the script
  std::string build() const;

  // Parenthesized string literal: ("text"). The parentheses keep the
  // concatenation emitted for single quotes together as one operand.
  static std::string literal(const SanitizedText& text);

  // literal(sanitize(raw))
  static std::string quote(std::string_view raw);

 private:
  void emit(std::string_view text);

  std::vector<std::string> lines_;
  std::vector<std::string> closers_;
};

}  // namespace nb::script
