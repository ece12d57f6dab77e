#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nb/common.hpp"

namespace nb::util {

/**
 * @brief Limits applied to a single process execution
 */
struct ProcessOptions {
  // Wall-clock limit; zero means wait for the child indefinitely
  std::chrono::milliseconds timeout{0};
  // Per-stream capture limit; excess output is discarded and stdout overflow
  // marks the result truncated
  size_t max_output_size = 10 * 1024 * 1024;
};

/**
 * @brief Secure process execution utility to replace unsafe system() calls
 *
 * The command is spawned directly with posix_spawn. Arguments are passed as an
 * argument vector and never reach a shell, so no argument is re-tokenized.
 */
class SafeProcess {
public:
  /**
   * @brief Result of a process execution
   */
  struct ProcessResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    // stdout exceeded ProcessOptions::max_output_size
    bool truncated = false;
    bool success() const { return !timed_out && !truncated && exit_code == 0; }
  };

  /**
   * @brief Execute a command with arguments safely
   * @param command The command to execute (no shell interpretation)
   * @param args Command arguments, each delivered verbatim as one argv entry
   * @param options Timeout and capture limits
   * @return Result of execution, or an error if the process could not be started
   */
  static Result<ProcessResult> execute(
    const std::string& command,
    const std::vector<std::string>& args = {},
    const ProcessOptions& options = ProcessOptions{}
  );

  /**
   * @brief Find the full path of a command in PATH
   * @param command Command name to find
   * @return Full path to command or nullopt if not found
   */
  static std::optional<std::string> findCommand(const std::string& command);

  /**
   * @brief Validate that a command name is safe for execution
   * @param command Command name to validate
   * @return true if safe to use
   */
  static bool isValidCommand(const std::string& command);

  /**
   * @brief Validate that an argument can be delivered intact through argv
   *
   * Any byte except NUL survives posix_spawn unchanged. Length is left to the
   * kernel, which fails the spawn with E2BIG when an argument is too large.
   */
  static bool isValidArgument(const std::string& arg);

private:
  SafeProcess() = default;
};

} // namespace nb::util
