#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nb/common.hpp"

namespace nb::config {

// Configuration for nb
class Config {
 public:
  // Default constructor loads from default config file
  Config();

  // Load from specific file
  explicit Config(const std::filesystem::path& config_path);

  // Interpreter binary that runs generated scripts
  std::string interpreter = "osascript";

  // Scriptable application every command targets
  std::string application = "Notes";

  // Account commands are scoped to (supports env:VAR)
  std::string account = "iCloud";

  // Upper bound for a single interpreter invocation
  int timeout_ms = 10000;

  // Separator the interpreter uses when coercing a list to text
  std::string list_separator = ",";

  struct RateLimitConfig {
    bool enabled = true;
    int window_ms = 60000;
    int max_requests = 30;
  };
  RateLimitConfig rate_limit;

  struct LoggingConfig {
    std::string level = "info";   // trace, debug, info, warn, error, critical, off
    std::filesystem::path file;   // empty = XDG data dir
  };
  LoggingConfig logging;

  Result<void> load(const std::filesystem::path& config_path);

  Result<void> save(const std::filesystem::path& config_path = {}) const;

  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  Result<void> validate() const;

  // Keys accepted by get/set, in dotted notation
  static std::vector<std::string> keys();

  static std::filesystem::path defaultConfigPath();

  const std::filesystem::path& path() const { return config_path_; }

 private:
  std::filesystem::path config_path_;

  void applyDefaults();
  std::string resolveEnvVar(const std::string& value) const;
  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);
  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace nb::config
