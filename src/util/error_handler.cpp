#include "nb/util/error_handler.hpp"

#include <sstream>
#include <string_view>

#include <nlohmann/json.hpp>

namespace nb::util {

namespace {

struct SeverityStyle {
  std::string_view name;   // machine-readable, used in JSON
  std::string_view label;  // shown to the user
  std::string_view color;
};

const SeverityStyle& styleFor(ErrorSeverity severity) {
  static const SeverityStyle kInfo{"info", "Info", "\033[36m"};
  static const SeverityStyle kWarning{"warning", "Warning", "\033[33m"};
  static const SeverityStyle kError{"error", "Error", "\033[31m"};
  static const SeverityStyle kCritical{"critical", "Critical", "\033[35m"};

  switch (severity) {
    case ErrorSeverity::kInfo: return kInfo;
    case ErrorSeverity::kWarning: return kWarning;
    case ErrorSeverity::kCritical: return kCritical;
    case ErrorSeverity::kError: break;
  }
  return kError;
}

// Stable identifiers for scripts consuming --json output
std::string_view codeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument: return "invalid_argument";
    case ErrorCode::kFileNotFound: return "file_not_found";
    case ErrorCode::kFileWriteError: return "file_write_error";
    case ErrorCode::kConfigError: return "config_error";
    case ErrorCode::kExternalToolError: return "interpreter_error";
    case ErrorCode::kSystemError: return "system_error";
    case ErrorCode::kProcessError: return "process_error";
    case ErrorCode::kRateLimited: return "rate_limited";
    case ErrorCode::kNotFound: return "not_found";
  }
  return "unknown";
}

std::string_view hintFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kRateLimited:
      return "Wait for the current window to expire or raise rate_limit.max_requests";
    case ErrorCode::kConfigError:
      return "Run 'nb config validate' and check the config file";
    case ErrorCode::kExternalToolError:
      return "Check that the interpreter is installed and the Notes app is reachable; rerun with -v for details";
    default:
      return {};
  }
}

}  // namespace

std::string ContextualError::fullDescription() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;

  if (context_) {
    if (!context_->operation.empty()) {
      oss << " (during " << context_->operation << ")";
    }
    if (!context_->subject.empty()) {
      oss << " [subject: " << context_->subject << "]";
    }
    if (!context_->stack.empty()) {
      oss << " [stack: ";
      for (size_t i = 0; i < context_->stack.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << context_->stack[i];
      }
      oss << "]";
    }
  }

  return oss.str();
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance_;
  return instance_;
}

void ErrorHandler::report(const ContextualError& error) const {
  if (error_logger_) {
    error_logger_(error);
  }
}

void ErrorHandler::setErrorLogger(std::function<void(const ContextualError&)> logger) {
  error_logger_ = std::move(logger);
}

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format, bool color) const {
  const auto& style = styleFor(error.severity());

  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = std::string(codeName(error.code()));
    error_json["severity"] = std::string(style.name);
    error_json["message"] = error.message();

    if (error.context()) {
      auto& ctx = *error.context();
      if (!ctx.subject.empty()) {
        error_json["subject"] = ctx.subject;
      }
      if (!ctx.operation.empty()) {
        error_json["operation"] = ctx.operation;
      }
    }
    if (auto hint = hintFor(error.code()); !hint.empty()) {
      error_json["hint"] = std::string(hint);
    }

    return error_json.dump();
  }

  std::ostringstream oss;
  if (color) {
    oss << style.color << style.label << "\033[0m";
  } else {
    oss << style.label;
  }
  oss << ": " << error.message();

  if (error.context() && !error.context()->subject.empty()) {
    oss << "\n  Subject: " << error.context()->subject;
  }
  if (auto hint = hintFor(error.code()); !hint.empty()) {
    oss << "\n  Hint: " << hint;
  }

  return oss.str();
}

ContextualError makeContextualError(ErrorCode code, const std::string& message,
                                  const ErrorContext& context, ErrorSeverity severity) {
  return ContextualError(code, message, context, severity);
}

ErrorSeverity severityFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNotFound:
    case ErrorCode::kRateLimited:
    case ErrorCode::kInvalidArgument:
      return ErrorSeverity::kWarning;
    case ErrorCode::kConfigError:
      return ErrorSeverity::kCritical;
    default:
      return ErrorSeverity::kError;
  }
}

} // namespace nb::util
