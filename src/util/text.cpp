#include "nb/util/text.hpp"

namespace nb::util {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

}  // namespace

std::string trim(std::string_view text) {
  auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(kWhitespace);
  return std::string(text.substr(begin, end - begin + 1));
}

std::vector<std::string> splitTrimmed(std::string_view text, char separator) {
  std::vector<std::string> parts;
  size_t start = 0;

  while (start <= text.size()) {
    size_t end = text.find(separator, start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto part = trim(text.substr(start, end - start));
    if (!part.empty()) {
      parts.push_back(std::move(part));
    }
    start = end + 1;
  }

  return parts;
}

}  // namespace nb::util
