#include "nb/util/xdg.hpp"

#include <cstdlib>
#include <system_error>

namespace nb::util {

std::filesystem::path Xdg::baseDir(const char* variable,
                                   const std::filesystem::path& home_relative,
                                   const char* fallback) {
  if (auto base = env(variable)) {
    return std::filesystem::path(*base) / "nb";
  }
  if (auto home = env("HOME")) {
    return std::filesystem::path(*home) / home_relative / "nb";
  }
  return std::filesystem::current_path() / fallback;
}

std::filesystem::path Xdg::configHome() {
  return baseDir("XDG_CONFIG_HOME", ".config", ".nb_config");
}

std::filesystem::path Xdg::dataHome() {
  return baseDir("XDG_DATA_HOME", std::filesystem::path(".local") / "share", ".nb_data");
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::logFile() {
  return dataHome() / "logs" / "nb.log";
}

Result<void> Xdg::ensureDirectory(const std::filesystem::path& path,
                                  std::filesystem::perms perms) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return {};
  }

  std::filesystem::create_directories(path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create " + path.string() + ": " + ec.message()));
  }

  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot set permissions on " + path.string() + ": " + ec.message()));
  }
  return {};
}

std::optional<std::string> Xdg::env(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace nb::util
