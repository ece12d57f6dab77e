#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nb/cli/application.hpp"
#include "fake_executor.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace nb::cli;
using namespace nb::test;
using nb::ErrorCode;

class ApplicationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    executor_ = std::make_shared<FakeExecutor>();
    writeConfig("");
  }

  void writeConfig(const std::string& extra) {
    config_path_ = temp_.createFile("config.toml",
        "account = \"Work\"\n" + extra +
        "\n[logging]\nfile = \"" + (temp_.path() / "nb.log").string() + "\"\n");
  }

  int run(std::vector<std::string> args) {
    args.insert(args.begin(), {"nb", "--config", config_path_.string()});
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    app_ = std::make_unique<Application>(executor_);
    return app_->run(static_cast<int>(argv.size()), argv.data());
  }

  TempDirectory temp_;
  std::filesystem::path config_path_;
  std::shared_ptr<FakeExecutor> executor_;
  std::unique_ptr<Application> app_;
};

TEST_F(ApplicationTest, CreatePrintsNoteAsJson) {
  executor_->thenSucceed("created");

  testing::internal::CaptureStdout();
  int code = run({"--json", "create", "Groceries", "milk", "--tags", "home,food"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 0);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["title"], "Groceries");
  EXPECT_EQ(json["tags"].size(), 2u);
  EXPECT_EQ(executor_->callCount(), 1u);
}

TEST_F(ApplicationTest, AccountComesFromConfigAndFlag) {
  executor_->otherwise(nb::script::CommandOutcome::succeeded("success"));

  testing::internal::CaptureStdout();
  EXPECT_EQ(run({"rm", "T"}), 0);
  EXPECT_NE(executor_->lastCommand().find("tell account (\"Work\")"), std::string::npos);

  EXPECT_EQ(run({"--account", "Personal", "rm", "T"}), 0);
  testing::internal::GetCapturedStdout();
  EXPECT_NE(executor_->lastCommand().find("tell account (\"Personal\")"), std::string::npos);
}

TEST_F(ApplicationTest, MissingNoteExitsWithNotFound) {
  executor_->thenSucceed("not found");

  testing::internal::CaptureStdout();
  int code = run({"--json", "rm", "Missing"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 2);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["message"], "Note not found");
}

TEST_F(ApplicationTest, ProcessFailureExitsWithFailureAndHidesDiagnostic) {
  executor_->thenFail("ENOENT: osascript");

  testing::internal::CaptureStdout();
  int code = run({"--json", "get", "Groceries"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 1);
  EXPECT_EQ(output.find("ENOENT"), std::string::npos);
  EXPECT_NE(output.find("Failed to execute command"), std::string::npos);
}

TEST_F(ApplicationTest, SearchWithoutMatchesSucceeds) {
  executor_->thenSucceed("");

  testing::internal::CaptureStdout();
  int code = run({"--json", "search", "zzz"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 0);
  EXPECT_TRUE(nlohmann::json::parse(output).empty());
}

TEST_F(ApplicationTest, InvalidConfigBlocksNoteCommands) {
  writeConfig("application = \"Note's\"\n");

  testing::internal::CaptureStdout();
  int code = run({"--json", "folders"});
  testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 1);
  EXPECT_EQ(executor_->callCount(), 0u);
}

TEST_F(ApplicationTest, RateLimitIsEnforcedPerOperation) {
  writeConfig("[rate_limit]\nmax_requests = 1\n");
  executor_->thenSucceed("iCloud");
  testing::internal::CaptureStdout();
  EXPECT_EQ(run({"accounts"}), 0);
  testing::internal::GetCapturedStdout();

  EXPECT_ERROR(app_->admit("list-accounts"), ErrorCode::kRateLimited);
  EXPECT_OK(app_->admit("list-folders"));
}

TEST_F(ApplicationTest, ConfigGetReadsLoadedFile) {
  testing::internal::CaptureStdout();
  int code = run({"config", "get", "account"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 0);
  EXPECT_EQ(output, "Work\n");
  EXPECT_EQ(executor_->callCount(), 0u);
}

TEST_F(ApplicationTest, UnknownConfigKeyFails) {
  testing::internal::CaptureStdout();
  int code = run({"config", "get", "nope"});
  testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 1);
}

TEST_F(ApplicationTest, MissingConfigFileIsReportedAsJson) {
  config_path_ = temp_.path() / "absent.toml";

  testing::internal::CaptureStdout();
  int code = run({"--json", "folders"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 1);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["code"], "file_not_found");
  EXPECT_EQ(json["severity"], "error");
  EXPECT_EQ(executor_->callCount(), 0u);
}

TEST_F(ApplicationTest, NotFoundJsonCarriesSubject) {
  executor_->thenSucceed("folder not found");

  testing::internal::CaptureStdout();
  int code = run({"--json", "mv", "Groceries", "Archive"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, 2);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["code"], "not_found");
  EXPECT_EQ(json["subject"], "Archive");
  EXPECT_EQ(json["message"], "Specified folder not found");
}
