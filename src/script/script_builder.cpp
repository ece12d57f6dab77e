#include "nb/script/script_builder.hpp"

namespace nb::script {

namespace {

constexpr size_t kIndentWidth = 2;

}  // namespace

ScriptBuilder::ScriptBuilder(std::string_view application) {
  begin("tell application \"" + sanitize(application).str() + "\"", "end tell");
}

ScriptBuilder& ScriptBuilder::tellAccount(std::string_view account) {
  return begin("tell account " + quote(account), "end tell");
}

ScriptBuilder& ScriptBuilder::tellVariable(std::string_view variable) {
  return begin("tell " + std::string(variable), "end tell");
}

ScriptBuilder& ScriptBuilder::begin(std::string_view opening, std::string_view closing) {
  emit(opening);
  closers_.emplace_back(closing);
  return *this;
}

ScriptBuilder& ScriptBuilder::end() {
  if (closers_.empty()) {
    return *this;
  }
  std::string closing = std::move(closers_.back());
  closers_.pop_back();
  emit(closing);
  return *this;
}

ScriptBuilder& ScriptBuilder::add(std::string_view statement) {
  emit(statement);
  return *this;
}

ScriptBuilder& ScriptBuilder::returnSentinel(std::string_view sentinel) {
  return add("return \"" + std::string(sentinel) + "\"");
}

ScriptBuilder& ScriptBuilder::useListSeparator(char separator) {
  return add("set AppleScript's text item delimiters to " + quote(std::string_view(&separator, 1)));
}

std::string ScriptBuilder::build() const {
  std::string script;
  for (const auto& line : lines_) {
    script += line;
    script += '\n';
  }

  size_t depth = closers_.size();
  for (auto it = closers_.rbegin(); it != closers_.rend(); ++it) {
    --depth;
    script += std::string(depth * kIndentWidth, ' ');
    script += *it;
    script += '\n';
  }
  return script;
}

std::string ScriptBuilder::literal(const SanitizedText& text) {
  return "(\"" + text.str() + "\")";
}

std::string ScriptBuilder::quote(std::string_view raw) {
  return literal(sanitize(raw));
}

void ScriptBuilder::emit(std::string_view text) {
  std::string line(closers_.size() * kIndentWidth, ' ');
  line += text;
  lines_.push_back(std::move(line));
}

}  // namespace nb::script
