#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace nb::script {

/**
 * @brief Outcome of one interpreter invocation
 *
 * success is true exactly when the interpreter ran, exited with status 0 and its
 * whole stdout was captured.
 * output holds trimmed stdout on success and is empty otherwise; error holds the
 * trimmed diagnostic on failure.
 */
struct CommandOutcome {
  bool success = false;
  std::string output;
  std::optional<std::string> error;

  static CommandOutcome succeeded(std::string output) {
    return CommandOutcome{true, std::move(output), std::nullopt};
  }

  static CommandOutcome failed(std::string error) {
    return CommandOutcome{false, std::string(), std::move(error)};
  }
};

/**
 * @brief Runs generated commands; implementations never throw
 */
class CommandExecutor {
 public:
  virtual ~CommandExecutor() = default;

  // Blocks until the command finishes or times out
  virtual CommandOutcome execute(const std::string& command) = 0;

  // Runs execute() on its own thread; independent commands may overlap
  std::future<CommandOutcome> executeAsync(std::string command);
};

struct ExecutorOptions {
  std::string interpreter = "osascript";
  // Arguments placed before the command, which always travels as one argv entry
  std::vector<std::string> leading_args = {"-e"};
  std::chrono::milliseconds timeout{10000};
  // Larger stdout fails the command rather than returning a cut-off answer
  size_t max_output_size = 10 * 1024 * 1024;
};

/**
 * @brief Executes commands with an external interpreter process
 */
class ProcessCommandExecutor : public CommandExecutor {
 public:
  explicit ProcessCommandExecutor(ExecutorOptions options = ExecutorOptions{});

  CommandOutcome execute(const std::string& command) override;

  const ExecutorOptions& options() const { return options_; }

 private:
  ExecutorOptions options_;
};

}  // namespace nb::script
