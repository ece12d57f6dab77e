#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace nb {

// Failures outside the note result protocol: configuration, process setup,
// admission and CLI input. Note-level outcomes (not found, folder not found)
// travel in notes::OperationResult instead.
enum class ErrorCode {
  kInvalidArgument,
  kFileNotFound,
  kFileWriteError,
  kConfigError,
  kExternalToolError,  // interpreter missing, crashed or answered off-protocol
  kSystemError,        // pipe, spawn or poll failure
  kProcessError,
  kRateLimited,
  kNotFound
};

std::string_view errorCodeToString(ErrorCode code);

class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

 private:
  ErrorCode code_;
  std::string message_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

// Build version, injected through NB_VERSION_* compile definitions
struct Version {
  int major;
  int minor;
  int patch;

  std::string toString() const;
};

Version getVersion();

}  // namespace nb
