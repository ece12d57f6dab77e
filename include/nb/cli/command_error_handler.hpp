#pragma once

#include <iostream>
#include <string>

#include "nb/cli/application.hpp"
#include "nb/notes/operation_result.hpp"
#include "nb/util/error_handler.hpp"

namespace nb::cli {

// Exit codes shared by all commands
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitNotFound = 2;

// Command-specific error handler that formats errors for CLI output
class CommandErrorHandler {
public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Display an error and return the exit code for it
  int handleCommandError(const util::ContextualError& error);

  // Convert a plain Error, tagging it with the operation it came from
  util::ContextualError convertError(const Error& error, const std::string& operation = "");

  // Display the non-ok outcome of a notes operation and return the exit code for it
  template <typename T>
  int handleOperationResult(const notes::OperationResult<T>& result,
                            const util::ErrorContext& context) {
    return handleOperationStatus(result.status(), result.message(), context);
  }

  void displaySuccess(const std::string& message);

private:
  int handleOperationStatus(notes::OperationStatus status, const std::string& message,
                            const util::ErrorContext& context);
  bool shouldShowStackTrace() const;

  const GlobalOptions& options_;
};

// Return from the enclosing command when a Result<void> gate fails
#define NB_TRY_COMMAND(handler, result, operation) \
  do { \
    if (!(result).has_value()) { \
      auto ctx_error = (handler).convertError((result).error(), operation); \
      return (handler).handleCommandError(ctx_error); \
    } \
  } while(0)

} // namespace nb::cli
