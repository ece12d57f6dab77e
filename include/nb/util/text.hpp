#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nb::util {

// Strip leading and trailing ASCII whitespace
std::string trim(std::string_view text);

// Split on a single character, trimming each element and dropping empty ones.
// Empty or all-whitespace input yields an empty vector.
std::vector<std::string> splitTrimmed(std::string_view text, char separator);

}  // namespace nb::util
