#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "nb/common.hpp"

namespace nb::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Expected negative outcomes (entity not found, rate limited)
  kError,    // Serious errors that prevent operation
  kCritical  // Errors that leave the tool unusable (broken config, missing interpreter)
};

// Error context for providing additional debugging information
struct ErrorContext {
  std::string subject;    // Entity being operated on (note title, folder, config key)
  std::string operation;  // Operation being performed
  std::vector<std::string> stack;

  ErrorContext& withSubject(const std::string& value) {
    subject = value;
    return *this;
  }

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }

  ErrorContext& withStack(const std::vector<std::string>& st) {
    stack = st;
    return *this;
  }
};

// Enhanced error with context and severity
class ContextualError {
public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  // "<code>: <message> (during <operation>) [subject: ...] [stack: a -> b]", as logged
  std::string fullDescription() const;

private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

// Error handler for logging and formatting errors
class ErrorHandler {
public:
  static ErrorHandler& instance();

  // Forward error to the registered logger
  void report(const ContextualError& error) const;

  // Set error logging callback
  void setErrorLogger(std::function<void(const ContextualError&)> logger);

  // Format error for user display
  std::string formatUserError(const ContextualError& error, bool json_format = false, bool color = true) const;

private:
  ErrorHandler() = default;
  std::function<void(const ContextualError&)> error_logger_;
};

// Convenience functions for creating contextual errors
ContextualError makeContextualError(ErrorCode code, const std::string& message,
                                  const ErrorContext& context = {},
                                  ErrorSeverity severity = ErrorSeverity::kError);

// Severity a plain Error is reported with
ErrorSeverity severityFor(ErrorCode code);

// Install spdlog sinks (rotating file + stderr) and route ErrorHandler reports to them.
// An empty log_file selects the XDG log location.
void setupErrorHandling(const std::filesystem::path& log_file, const std::string& level,
                        const std::string& console_level = "warn");

// Macro for creating error context at call site
#define NB_ERROR_CONTEXT() \
  ::nb::util::ErrorContext{}.withOperation(__FUNCTION__)

} // namespace nb::util
