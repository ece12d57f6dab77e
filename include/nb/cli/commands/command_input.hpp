#pragma once

#include <iostream>
#include <iterator>
#include <string>

namespace nb::cli {

// Content from --stdin when requested, otherwise the positional value
inline std::string resolveContent(const std::string& positional, bool from_stdin) {
  if (!from_stdin) {
    return positional;
  }
  std::string content{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  while (!content.empty() && (content.back() == '\n' || content.back() == '\r')) {
    content.pop_back();
  }
  return content;
}

} // namespace nb::cli
