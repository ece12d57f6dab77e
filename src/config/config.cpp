#include "nb/config/config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "nb/util/xdg.hpp"

namespace nb::config {

namespace {

Result<int> parseInt(const std::string& key, const std::string& value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Invalid integer for " + key + ": " + value));
    }
    return parsed;
  } catch (const std::exception&) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid integer for " + key + ": " + value));
  }
}

// TOML integers are 64-bit; a plain cast would wrap into a valid-looking value
Result<int> narrowInt(const std::string& key, int64_t value) {
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     key + " is out of range: " + std::to_string(value)));
  }
  return static_cast<int>(value);
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Invalid boolean for " + key + ": " + value));
}

}  // namespace

Config::Config() {
  applyDefaults();

  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = load(default_path);
    if (!result) {
      spdlog::warn("Using default configuration: {}", result.error().message());
    }
  }
}

Config::Config(const std::filesystem::path& config_path) {
  applyDefaults();

  // Missing or invalid config leaves the defaults in place
  auto result = load(config_path);
  if (!result) {
    spdlog::warn("Using default configuration: {}", result.error().message());
  }
}

void Config::applyDefaults() {
  if (auto env_account = util::Xdg::env("APPLE_NOTES_ACCOUNT")) {
    account = *env_account;
  }
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["interpreter"].value<std::string>()) {
      interpreter = *value;
    }
    if (auto value = config_data["application"].value<std::string>()) {
      application = *value;
    }
    if (auto value = config_data["account"].value<std::string>()) {
      account = resolveEnvVar(*value);
    }
    if (auto value = config_data["timeout_ms"].value<int64_t>()) {
      auto narrowed = narrowInt("timeout_ms", *value);
      if (!narrowed) return std::unexpected(narrowed.error());
      timeout_ms = *narrowed;
    }
    if (auto value = config_data["list_separator"].value<std::string>()) {
      list_separator = *value;
    }

    if (auto limit_table = config_data["rate_limit"].as_table()) {
      if (auto value = (*limit_table)["enabled"].value<bool>()) {
        rate_limit.enabled = *value;
      }
      if (auto value = (*limit_table)["window_ms"].value<int64_t>()) {
        auto narrowed = narrowInt("rate_limit.window_ms", *value);
        if (!narrowed) return std::unexpected(narrowed.error());
        rate_limit.window_ms = *narrowed;
      }
      if (auto value = (*limit_table)["max_requests"].value<int64_t>()) {
        auto narrowed = narrowInt("rate_limit.max_requests", *value);
        if (!narrowed) return std::unexpected(narrowed.error());
        rate_limit.max_requests = *narrowed;
      }
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    config_data.insert_or_assign("interpreter", interpreter);
    config_data.insert_or_assign("application", application);
    config_data.insert_or_assign("account", account);
    config_data.insert_or_assign("timeout_ms", timeout_ms);
    config_data.insert_or_assign("list_separator", list_separator);

    auto limit_table = toml::table{};
    limit_table.insert_or_assign("enabled", rate_limit.enabled);
    limit_table.insert_or_assign("window_ms", rate_limit.window_ms);
    limit_table.insert_or_assign("max_requests", rate_limit.max_requests);
    config_data.insert_or_assign("rate_limit", limit_table);

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    if (!logging.file.empty()) {
      logging_table.insert_or_assign("file", logging.file.string());
    }
    config_data.insert_or_assign("logging", logging_table);

    if (save_path.has_parent_path()) {
      if (auto dir = util::Xdg::ensureDirectory(save_path.parent_path()); !dir) {
        return std::unexpected(dir.error());
      }
    }

    std::ofstream file(save_path);
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed to open config file for writing: " + save_path.string()));
    }

    file << config_data;
    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to save config: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

Result<void> Config::validate() const {
  if (interpreter.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Interpreter must not be empty"));
  }

  if (application.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Application must not be empty"));
  }

  // The application name is a bare literal in `tell application`, so the
  // quote splice that handles ' in other values cannot be used there
  if (application.find('\'') != std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Application name must not contain single quotes"));
  }

  if (account.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Account must not be empty"));
  }

  if (timeout_ms <= 0 || timeout_ms > 600000) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid timeout_ms value: " + std::to_string(timeout_ms)));
  }

  if (list_separator.size() != 1) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "list_separator must be a single character"));
  }

  if (rate_limit.window_ms <= 0 || rate_limit.max_requests <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Rate limit window and max_requests must be positive"));
  }

  return {};
}

std::vector<std::string> Config::keys() {
  return {"interpreter", "application", "account", "timeout_ms", "list_separator",
          "rate_limit.enabled", "rate_limit.window_ms", "rate_limit.max_requests",
          "logging.level", "logging.file"};
}

std::filesystem::path Config::defaultConfigPath() {
  return nb::util::Xdg::configFile();
}

std::string Config::resolveEnvVar(const std::string& value) const {
  if (value.substr(0, 4) == "env:") {
    return util::Xdg::env(value.substr(4)).value_or("");
  }
  return value;
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "interpreter") return interpreter;
    if (key == "application") return application;
    if (key == "account") return account;
    if (key == "timeout_ms") return std::to_string(timeout_ms);
    if (key == "list_separator") return list_separator;
  } else if (path.size() == 2) {
    if (path[0] == "rate_limit") {
      if (path[1] == "enabled") return std::string(rate_limit.enabled ? "true" : "false");
      if (path[1] == "window_ms") return std::to_string(rate_limit.window_ms);
      if (path[1] == "max_requests") return std::to_string(rate_limit.max_requests);
    } else if (path[0] == "logging") {
      if (path[1] == "level") return logging.level;
      if (path[1] == "file") return logging.file.string();
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "interpreter") { interpreter = value; return {}; }
    if (key == "application") { application = value; return {}; }
    if (key == "account") { account = resolveEnvVar(value); return {}; }
    if (key == "list_separator") { list_separator = value; return {}; }
    if (key == "timeout_ms") {
      auto parsed = parseInt(key, value);
      if (!parsed) return std::unexpected(parsed.error());
      timeout_ms = *parsed;
      return {};
    }
  } else if (path.size() == 2) {
    if (path[0] == "rate_limit") {
      if (path[1] == "enabled") {
        auto parsed = parseBool("rate_limit.enabled", value);
        if (!parsed) return std::unexpected(parsed.error());
        rate_limit.enabled = *parsed;
        return {};
      }
      if (path[1] == "window_ms" || path[1] == "max_requests") {
        auto parsed = parseInt("rate_limit." + path[1], value);
        if (!parsed) return std::unexpected(parsed.error());
        (path[1] == "window_ms" ? rate_limit.window_ms : rate_limit.max_requests) = *parsed;
        return {};
      }
    } else if (path[0] == "logging") {
      if (path[1] == "level") { logging.level = value; return {}; }
      if (path[1] == "file") { logging.file = value; return {}; }
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace nb::config
