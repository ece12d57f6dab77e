#include "nb/script/command_executor.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "nb/util/safe_process.hpp"
#include "nb/util/text.hpp"

namespace nb::script {

std::future<CommandOutcome> CommandExecutor::executeAsync(std::string command) {
  return std::async(std::launch::async, [this, command = std::move(command)]() {
    return execute(command);
  });
}

ProcessCommandExecutor::ProcessCommandExecutor(ExecutorOptions options)
    : options_(std::move(options)) {}

CommandOutcome ProcessCommandExecutor::execute(const std::string& command) {
  try {
    std::vector<std::string> args = options_.leading_args;
    args.push_back(command);

    util::ProcessOptions process_options;
    process_options.timeout = options_.timeout;
    process_options.max_output_size = options_.max_output_size;

    auto result = util::SafeProcess::execute(options_.interpreter, args, process_options);
    if (!result.has_value()) {
      spdlog::warn("Could not start {}: {}", options_.interpreter, result.error().message());
      return CommandOutcome::failed("Failed to execute " + options_.interpreter + ": " +
                                    result.error().message());
    }

    if (result->timed_out) {
      spdlog::warn("{} timed out after {} ms", options_.interpreter, options_.timeout.count());
      return CommandOutcome::failed(options_.interpreter + " timed out after " +
                                    std::to_string(options_.timeout.count()) + " ms");
    }

    if (result->truncated) {
      spdlog::warn("{} output exceeded {} bytes", options_.interpreter, options_.max_output_size);
      return CommandOutcome::failed(options_.interpreter + " output exceeded " +
                                    std::to_string(options_.max_output_size) + " bytes");
    }

    if (result->exit_code == 0) {
      return CommandOutcome::succeeded(util::trim(result->stdout_output));
    }

    auto diagnostic = util::trim(result->stderr_output);
    spdlog::warn("{} exited with code {}: {}", options_.interpreter, result->exit_code, diagnostic);
    if (diagnostic.empty()) {
      diagnostic = options_.interpreter + " exited with code " + std::to_string(result->exit_code);
    }
    return CommandOutcome::failed(std::move(diagnostic));

  } catch (const std::exception& e) {
    spdlog::error("Executing {} failed: {}", options_.interpreter, e.what());
    return CommandOutcome::failed("Failed to execute " + options_.interpreter + ": " + e.what());
  }
}

}  // namespace nb::script
