#include "nb/cli/command_error_handler.hpp"

#include <nlohmann/json.hpp>

namespace nb::cli {

int CommandErrorHandler::handleCommandError(const util::ContextualError& error) {
  auto& handler = util::ErrorHandler::instance();
  handler.report(error);

  std::string formatted_error = handler.formatUserError(error, options_.json, !options_.no_color);

  if (options_.json) {
    std::cout << formatted_error << std::endl;
  } else {
    std::cerr << formatted_error << std::endl;

    // Show stack trace in verbose mode
    if (shouldShowStackTrace() && error.context() && !error.context()->stack.empty()) {
      std::cerr << "\nCall stack:" << std::endl;
      for (const auto& frame : error.context()->stack) {
        std::cerr << "  " << frame << std::endl;
      }
    }
  }

  return error.code() == ErrorCode::kNotFound ? kExitNotFound : kExitFailure;
}

util::ContextualError CommandErrorHandler::convertError(const Error& error, const std::string& operation) {
  util::ErrorContext context;
  if (!operation.empty()) {
    context.withOperation(operation);
  }
  return util::ContextualError(error.code(), error.message(), context, util::severityFor(error.code()));
}

int CommandErrorHandler::handleOperationStatus(notes::OperationStatus status,
                                               const std::string& message,
                                               const util::ErrorContext& context) {
  switch (status) {
    case notes::OperationStatus::kOk:
      return kExitSuccess;
    case notes::OperationStatus::kNotFound:
    case notes::OperationStatus::kFolderNotFound:
      return handleCommandError(util::makeContextualError(
          ErrorCode::kNotFound, message, context, util::ErrorSeverity::kWarning));
    case notes::OperationStatus::kFailed:
      break;
  }
  return handleCommandError(util::makeContextualError(
      ErrorCode::kExternalToolError, message, context, util::ErrorSeverity::kError));
}

void CommandErrorHandler::displaySuccess(const std::string& message) {
  if (options_.quiet) {
    return;
  }
  if (options_.json) {
    nlohmann::json success_json;
    success_json["success"] = true;
    success_json["message"] = message;
    std::cout << success_json.dump() << std::endl;
  } else if (options_.no_color) {
    std::cout << message << std::endl;
  } else {
    std::cout << "\033[32m✓\033[0m " << message << std::endl;
  }
}

bool CommandErrorHandler::shouldShowStackTrace() const {
  return options_.verbose > 1; // Show stack trace in very verbose mode (-vv)
}

} // namespace nb::cli
