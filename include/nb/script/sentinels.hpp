#pragma once

#include <string_view>

// Literal values generated scripts return to signal their outcome.
// Builders emit them and decoders match them, so both sides use these names.
namespace nb::script::sentinel {

inline constexpr std::string_view kCreated = "created";
inline constexpr std::string_view kSuccess = "success";
inline constexpr std::string_view kNotFound = "not found";
inline constexpr std::string_view kNoteNotFound = "note not found";
inline constexpr std::string_view kFolderNotFound = "folder not found";

}  // namespace nb::script::sentinel
