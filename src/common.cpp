#include "nb/common.hpp"

#include <format>

#ifndef NB_VERSION_MAJOR
#define NB_VERSION_MAJOR 0
#define NB_VERSION_MINOR 1
#define NB_VERSION_PATCH 0
#endif

namespace nb {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument: return "Invalid argument";
    case ErrorCode::kFileNotFound: return "File not found";
    case ErrorCode::kFileWriteError: return "File write error";
    case ErrorCode::kConfigError: return "Configuration error";
    case ErrorCode::kExternalToolError: return "Scripting interpreter error";
    case ErrorCode::kSystemError: return "System error";
    case ErrorCode::kProcessError: return "Process error";
    case ErrorCode::kRateLimited: return "Rate limited";
    case ErrorCode::kNotFound: return "Not found";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  return std::format("{}.{}.{}", major, minor, patch);
}

Version getVersion() {
  return Version{NB_VERSION_MAJOR, NB_VERSION_MINOR, NB_VERSION_PATCH};
}

}  // namespace nb
