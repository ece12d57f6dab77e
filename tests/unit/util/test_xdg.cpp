#include <gtest/gtest.h>

#include "nb/util/xdg.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace nb::util;
using namespace nb::test;

TEST(XdgTest, ExplicitBaseDirectoriesWin) {
  ScopedEnv config("XDG_CONFIG_HOME", "/tmp/cfg");
  ScopedEnv data("XDG_DATA_HOME", "/tmp/data");

  EXPECT_EQ(Xdg::configFile(), std::filesystem::path("/tmp/cfg/nb/config.toml"));
  EXPECT_EQ(Xdg::logFile(), std::filesystem::path("/tmp/data/nb/logs/nb.log"));
}

TEST(XdgTest, FallsBackToHome) {
  ScopedEnv config("XDG_CONFIG_HOME", std::nullopt);
  ScopedEnv data("XDG_DATA_HOME", "");
  ScopedEnv home("HOME", "/home/tester");

  EXPECT_EQ(Xdg::configHome(), std::filesystem::path("/home/tester/.config/nb"));
  EXPECT_EQ(Xdg::dataHome(), std::filesystem::path("/home/tester/.local/share/nb"));
}

TEST(XdgTest, EmptyVariableReadsAsUnset) {
  ScopedEnv blank("NB_TEST_BLANK", "");
  ScopedEnv set("NB_TEST_SET", "value");

  EXPECT_FALSE(Xdg::env("NB_TEST_BLANK").has_value());
  EXPECT_EQ(Xdg::env("NB_TEST_SET"), "value");
}

TEST(XdgTest, EnsureDirectoryCreatesNestedPath) {
  TempDirectory temp;
  auto nested = temp.path() / "a" / "b" / "logs";

  ASSERT_OK(Xdg::ensureDirectory(nested));
  EXPECT_TRUE(std::filesystem::is_directory(nested));

  // Existing directory is fine
  EXPECT_OK(Xdg::ensureDirectory(nested));
}

TEST(XdgTest, EnsureDirectoryFailsUnderAFile) {
  TempDirectory temp;
  auto file = temp.createFile("plain.txt", "x");

  EXPECT_ERROR(Xdg::ensureDirectory(file / "sub"), nb::ErrorCode::kFileWriteError);
}
