#include "nb/util/error_handler.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "nb/util/xdg.hpp"

namespace nb::util {

// Error logger setup for nb
class NbErrorLogger {
public:
  static NbErrorLogger& instance() {
    static NbErrorLogger instance_;
    return instance_;
  }

  void initialize(const std::filesystem::path& log_file, spdlog::level::level_enum level,
                  spdlog::level::level_enum console_level) {
    if (initialized_) return;

    try {
      if (auto dir = Xdg::ensureDirectory(log_file.parent_path()); !dir) {
        throw std::runtime_error(dir.error().message());
      }

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), 1024 * 1024 * 5, 3); // 5MB files, 3 backups

      // stdout belongs to command output
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(console_level);

      std::vector<spdlog::sink_ptr> sinks = {file_sink, console_sink};
      auto logger = std::make_shared<spdlog::logger>("nb", sinks.begin(), sinks.end());

      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      logger->set_level(level);

      spdlog::set_default_logger(logger);

      initialized_ = true;

    } catch (const std::exception& e) {
      // Fallback to console-only logging if file setup fails
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      spdlog::set_default_logger(std::make_shared<spdlog::logger>("nb", console_sink));
      spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      spdlog::set_level(spdlog::level::warn);
      spdlog::warn("Failed to setup file logging: {}", e.what());
    }
  }

  void logContextualError(const ContextualError& error) {
    auto description = error.fullDescription();

    switch (error.severity()) {
      case ErrorSeverity::kInfo:
        spdlog::info(description);
        break;
      case ErrorSeverity::kWarning:
        spdlog::warn(description);
        break;
      case ErrorSeverity::kError:
        spdlog::error(description);
        break;
      case ErrorSeverity::kCritical:
        spdlog::critical(description);
        break;
    }
  }

private:
  bool initialized_ = false;
};

void setupErrorHandling(const std::filesystem::path& log_file, const std::string& level,
                        const std::string& console_level) {
  auto& logger = NbErrorLogger::instance();
  logger.initialize(log_file.empty() ? Xdg::logFile() : log_file,
                    spdlog::level::from_str(level), spdlog::level::from_str(console_level));

  ErrorHandler::instance().setErrorLogger([&logger](const ContextualError& error) {
    logger.logContextualError(error);
  });
}

} // namespace nb::util
