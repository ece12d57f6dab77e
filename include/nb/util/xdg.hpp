#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "nb/common.hpp"

namespace nb::util {

// Where nb keeps its files, following the XDG base directory layout.
// Without HOME the paths fall back to dot-directories under the working directory.
class Xdg {
 public:
  // $XDG_CONFIG_HOME/nb, else ~/.config/nb
  static std::filesystem::path configHome();

  // $XDG_DATA_HOME/nb, else ~/.local/share/nb
  static std::filesystem::path dataHome();

  static std::filesystem::path configFile();

  // <dataHome>/logs/nb.log
  static std::filesystem::path logFile();

  // Create path (and parents) if missing, restricting fresh directories to perms
  static Result<void> ensureDirectory(const std::filesystem::path& path,
                                      std::filesystem::perms perms = std::filesystem::perms::owner_all);

  // Unset and empty variables both read as nullopt
  static std::optional<std::string> env(const std::string& name);

 private:
  static std::filesystem::path baseDir(const char* variable,
                                       const std::filesystem::path& home_relative,
                                       const char* fallback);
};

}  // namespace nb::util
