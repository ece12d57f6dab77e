#include "nb/util/safe_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>
#include <thread>

#include <spdlog/spdlog.h>

extern char **environ;

namespace nb::util {

namespace {

  using Clock = std::chrono::steady_clock;

  /**
   * @brief Close file descriptor safely
   */
  void safeClose(int& fd) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }

  /**
   * @brief Create a pipe whose ends are not inherited by unrelated children
   */
  bool makePipe(int fds[2]) {
    if (pipe(fds) == -1) {
      return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
  }

  /**
   * @brief Convert vector of strings to char* array for posix_spawn
   * @note This function creates a safe copy to avoid const_cast issues
   */
  class SafeArgvBuilder {
  private:
    std::vector<std::unique_ptr<char[]>> storage_;
    std::vector<char*> argv_;

  public:
    explicit SafeArgvBuilder(const std::vector<std::string>& strings) {
      storage_.reserve(strings.size());
      argv_.reserve(strings.size() + 1);

      for (const auto& str : strings) {
        auto len = str.length() + 1;
        auto buffer = std::make_unique<char[]>(len);
        std::memcpy(buffer.get(), str.c_str(), len);

        argv_.push_back(buffer.get());
        storage_.push_back(std::move(buffer));
      }
      argv_.push_back(nullptr);
    }

    char* const* data() { return argv_.data(); }
  };

  /**
   * @brief One captured output stream of the child
   */
  struct StreamCapture {
    int fd = -1;
    std::string data;
    bool open = false;
    bool truncated = false;
  };

  /**
   * @brief Drain whatever is currently readable; marks the stream closed on EOF
   */
  void drainReadable(StreamCapture& stream, size_t max_output_size) {
    char buffer[4096];
    while (true) {
      ssize_t bytes_read = read(stream.fd, buffer, sizeof(buffer));
      if (bytes_read > 0) {
        size_t remaining = max_output_size > stream.data.size()
                               ? max_output_size - stream.data.size()
                               : 0;
        auto bytes = static_cast<size_t>(bytes_read);
        if (bytes > remaining) {
          stream.truncated = true;
        }
        // Keep reading past the limit so the child never blocks on a full pipe
        stream.data.append(buffer, std::min(remaining, bytes));
        continue;
      }
      if (bytes_read == 0) {
        stream.open = false;
        return;
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        stream.open = false;
      }
      return;
    }
  }

  int remainingMillis(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

  int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      return 128 + WTERMSIG(status);
    }
    return -1;
  }

  void killProcessGroup(pid_t pid) {
    // The child leads its own group, so helpers it forked die with it
    if (kill(-pid, SIGKILL) == -1) {
      kill(pid, SIGKILL);
    }
  }

}  // namespace

Result<SafeProcess::ProcessResult> SafeProcess::execute(
    const std::string& command,
    const std::vector<std::string>& args,
    const ProcessOptions& options) {
  if (!SafeProcess::isValidCommand(command)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid command name: " + command));
  }

  for (size_t i = 0; i < args.size(); ++i) {
    if (!SafeProcess::isValidArgument(args[i])) {
      // Arguments carry user text, so only their position and size are reported
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Argument " + std::to_string(i + 1) + " (" +
                                       std::to_string(args[i].size()) +
                                       " bytes) contains a NUL byte"));
    }
  }

  auto command_path = findCommand(command);
  if (!command_path.has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Command not found: " + command));
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (!makePipe(stdout_pipe) || !makePipe(stderr_pipe)) {
    int saved_errno = errno;
    safeClose(stdout_pipe[0]);
    safeClose(stdout_pipe[1]);
    safeClose(stderr_pipe[0]);
    safeClose(stderr_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to create pipes: " + std::string(strerror(saved_errno))));
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());

  SafeArgvBuilder argv_builder(full_args);

  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);
  posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);

  posix_spawnattr_t attributes;
  posix_spawnattr_init(&attributes);
  posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attributes, 0);

  pid_t pid;
  int spawn_result = posix_spawn(&pid, command_path->c_str(), &file_actions, &attributes,
                                 argv_builder.data(), environ);

  posix_spawn_file_actions_destroy(&file_actions);
  posix_spawnattr_destroy(&attributes);

  safeClose(stdout_pipe[1]);
  safeClose(stderr_pipe[1]);

  if (spawn_result != 0) {
    safeClose(stdout_pipe[0]);
    safeClose(stderr_pipe[0]);
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn process: " + std::string(strerror(spawn_result))));
  }

  spdlog::debug("Spawned {} (pid {})", *command_path, pid);

  const bool bounded = options.timeout.count() > 0;
  const auto deadline = Clock::now() + options.timeout;

  ProcessResult result;
  StreamCapture out{stdout_pipe[0], {}, true};
  StreamCapture err{stderr_pipe[0], {}, true};
  fcntl(out.fd, F_SETFL, fcntl(out.fd, F_GETFL) | O_NONBLOCK);
  fcntl(err.fd, F_SETFL, fcntl(err.fd, F_GETFL) | O_NONBLOCK);

  // Output arrives in arbitrary chunks on both streams until the child closes them
  while (out.open || err.open) {
    struct pollfd fds[2];
    nfds_t count = 0;
    StreamCapture* streams[2];
    for (StreamCapture* stream : {&out, &err}) {
      if (stream->open) {
        fds[count].fd = stream->fd;
        fds[count].events = POLLIN;
        fds[count].revents = 0;
        streams[count] = stream;
        ++count;
      }
    }

    int wait_ms = bounded ? remainingMillis(deadline) : -1;
    if (bounded && wait_ms == 0) {
      result.timed_out = true;
      break;
    }

    int ready = poll(fds, count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      int saved_errno = errno;
      killProcessGroup(pid);
      waitpid(pid, nullptr, 0);
      safeClose(out.fd);
      safeClose(err.fd);
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to poll process output: " + std::string(strerror(saved_errno))));
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
        drainReadable(*streams[i], options.max_output_size);
      }
    }
  }

  // Streams may close before the child exits
  int status = 0;
  while (!result.timed_out) {
    pid_t waited = waitpid(pid, &status, bounded ? WNOHANG : 0);
    if (waited == pid) {
      result.exit_code = decodeWaitStatus(status);
      break;
    }
    if (waited == -1 && errno != EINTR) {
      int saved_errno = errno;
      safeClose(out.fd);
      safeClose(err.fd);
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to wait for process: " + std::string(strerror(saved_errno))));
    }
    if (bounded && waited == 0) {
      if (remainingMillis(deadline) == 0) {
        result.timed_out = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  if (result.timed_out) {
    spdlog::warn("Process {} exceeded {} ms, killing it", pid, options.timeout.count());
    killProcessGroup(pid);
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    result.exit_code = decodeWaitStatus(status);
  }

  safeClose(out.fd);
  safeClose(err.fd);

  result.truncated = out.truncated;
  result.stdout_output = std::move(out.data);
  result.stderr_output = std::move(err.data);
  return result;
}

std::optional<std::string> SafeProcess::findCommand(const std::string& command) {
  if (!SafeProcess::isValidCommand(command)) {
    return std::nullopt;
  }

  // Check if command is an absolute path
  if (!command.empty() && command.front() == '/') {
    struct stat st;
    if (stat(command.c_str(), &st) == 0 && (st.st_mode & S_IXUSR)) {
      return command;
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return std::nullopt;
  }

  std::string path_str(path_env);
  std::istringstream path_stream(path_str);
  std::string dir;

  while (std::getline(path_stream, dir, ':')) {
    if (dir.empty()) continue;

    std::string full_path = dir + "/" + command;
    struct stat st;
    if (stat(full_path.c_str(), &st) == 0 && (st.st_mode & S_IXUSR)) {
      return full_path;
    }
  }

  return std::nullopt;
}

bool SafeProcess::isValidCommand(const std::string& command) {
  if (command.empty() || command.length() > 255) {
    return false;
  }

  const std::string dangerous_chars = "|&;(){}[]<>*?~$`\"'\\";
  for (char c : command) {
    if (dangerous_chars.find(c) != std::string::npos) {
      return false;
    }
    if (static_cast<unsigned char>(c) < 32) {
      return false;
    }
  }

  // Reject paths with .. to prevent directory traversal
  if (command.find("..") != std::string::npos) {
    return false;
  }

  return true;
}

bool SafeProcess::isValidArgument(const std::string& arg) {
  // argv entries are C strings; everything else, control bytes included, passes
  return arg.find('\0') == std::string::npos;
}

} // namespace nb::util
