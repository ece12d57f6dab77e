#include "nb/script/sanitizer.hpp"

#include <array>
#include <utility>

namespace nb::script {

namespace {

void replaceAll(std::string& text, std::string_view from, std::string_view to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Applied in sequence; the backslash entry must stay first
constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kEscapes = {{
  {"\\", "\\\\"},
  {"\"", "\\\""},
  {"'", "\" & \"'\" & \""},
  {"\n", "\\n"},
  {"\r", "\\r"},
  {"\t", "\\t"},
}};

}  // namespace

SanitizedText sanitize(std::string_view raw) {
  if (raw.empty()) {
    return SanitizedText(std::string());
  }

  std::string escaped(raw);
  for (const auto& [from, to] : kEscapes) {
    replaceAll(escaped, from, to);
  }
  return SanitizedText(std::move(escaped));
}

}  // namespace nb::script
