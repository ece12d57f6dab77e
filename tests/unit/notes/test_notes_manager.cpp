#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <iterator>

#include "nb/notes/notes_manager.hpp"
#include "nb/script/command_executor.hpp"
#include "applescript_double.hpp"
#include "fake_executor.hpp"
#include "temp_directory.hpp"

using namespace nb::notes;
using nb::test::FakeExecutor;

class NotesManagerTest : public ::testing::Test {
 protected:
  NotesManagerTest() : manager_(executor_, NotesManagerOptions{"Notes", "iCloud", ','}) {}

  FakeExecutor executor_;
  NotesManager manager_;
};

TEST_F(NotesManagerTest, CreateWithoutFolderSucceeds) {
  executor_.thenSucceed("created");

  auto result = manager_.createNote("My \"Note\"", "line one\nline two", {"home"});

  ASSERT_TRUE(result.isOk()) << result.message();
  EXPECT_EQ(result.value().title, "My \"Note\"");
  EXPECT_EQ(result.value().content, "line one\nline two");
  EXPECT_EQ(result.value().tags, std::vector<std::string>{"home"});
  EXPECT_TRUE(result.value().id.isValid());

  auto command = executor_.lastCommand();
  EXPECT_NE(command.find("name:(\"My \\\"Note\\\"\")"), std::string::npos) << command;
  EXPECT_NE(command.find("body:(\"line one<br>line two\")"), std::string::npos) << command;
}

TEST_F(NotesManagerTest, CreateFallsBackToAccountVariant) {
  executor_.thenFail("-1728").thenSucceed("created");

  auto result = manager_.createNote("T", "B");

  EXPECT_TRUE(result.isOk());
  ASSERT_EQ(executor_.callCount(), 2u);
  EXPECT_NE(executor_.lastCommand().find("tell account (\"iCloud\")"), std::string::npos);
}

TEST_F(NotesManagerTest, CreateFailureHidesDiagnostics) {
  executor_.otherwise(nb::script::CommandOutcome::failed("Notes got an error: secret detail"));

  auto result = manager_.createNote("T", "B");

  EXPECT_EQ(result.status(), OperationStatus::kFailed);
  EXPECT_EQ(result.message(), "Failed to create note");
}

TEST_F(NotesManagerTest, CreateInMissingFolder) {
  executor_.thenSucceed("folder not found");

  auto result = manager_.createNote("T", "B", {}, std::string("Nope"));

  EXPECT_EQ(result.status(), OperationStatus::kFolderNotFound);
  EXPECT_EQ(executor_.callCount(), 1u);
}

TEST_F(NotesManagerTest, CreateWithUnexpectedAnswerFails) {
  executor_.thenSucceed("something else");

  auto result = manager_.createNote("T", "B");

  EXPECT_EQ(result.status(), OperationStatus::kFailed);
  EXPECT_EQ(result.message(), "Failed to create note");
}

TEST_F(NotesManagerTest, SearchWithNoMatchesIsEmpty) {
  executor_.thenSucceed("");

  auto result = manager_.searchNotes("nothing matches this");

  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(result.value().empty());
}

TEST_F(NotesManagerTest, SearchSplitsTitles) {
  executor_.thenSucceed("Groceries, Recipes ,Work");

  auto result = manager_.searchNotes("eggs");

  ASSERT_TRUE(result.isOk());
  ASSERT_EQ(result.value().size(), 3u);
  EXPECT_EQ(result.value()[0].title, "Groceries");
  EXPECT_EQ(result.value()[1].title, "Recipes");
  EXPECT_EQ(result.value()[2].title, "Work");
  EXPECT_NE(result.value()[0].id, result.value()[1].id);
  EXPECT_NE(executor_.lastCommand().find("notes whose body contains (\"eggs\")"), std::string::npos);
}

TEST_F(NotesManagerTest, GetReturnsBody) {
  executor_.thenSucceed("<div>milk</div>");

  auto result = manager_.getNoteContent("Groceries");

  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value(), "<div>milk</div>");
}

TEST_F(NotesManagerTest, GetMissingNote) {
  executor_.thenSucceed("not found");

  auto result = manager_.getNoteContent("Nope");

  EXPECT_EQ(result.status(), OperationStatus::kNotFound);
  EXPECT_EQ(result.message(), "Note not found");
}

TEST_F(NotesManagerTest, EditSucceeds) {
  executor_.thenSucceed("success");

  auto result = manager_.editNote("Groceries", "a\nb");

  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value().content, "a\nb");
  EXPECT_NE(executor_.lastCommand().find("set body of aNote to (\"a<br>b\")"), std::string::npos);
}

TEST_F(NotesManagerTest, EditMissingNote) {
  executor_.thenSucceed("not found");
  EXPECT_EQ(manager_.editNote("Nope", "x").status(), OperationStatus::kNotFound);
}

TEST_F(NotesManagerTest, EditUnexpectedAnswerFailsGenerically) {
  executor_.thenSucceed("maybe");

  auto result = manager_.editNote("T", "x");

  EXPECT_EQ(result.status(), OperationStatus::kFailed);
  EXPECT_EQ(result.message(), "Failed to update note");
}

TEST_F(NotesManagerTest, DeleteMissingNoteIsNotFound) {
  executor_.thenSucceed("not found");

  auto result = manager_.deleteNote("Missing");

  EXPECT_EQ(result.status(), OperationStatus::kNotFound);
  EXPECT_EQ(result.message(), "Note not found");
}

TEST_F(NotesManagerTest, DeleteSucceeds) {
  executor_.thenSucceed("success");
  EXPECT_TRUE(manager_.deleteNote("Groceries").isOk());
}

TEST_F(NotesManagerTest, SpawnFailureIsGeneric) {
  executor_.thenFail("ENOENT");

  auto result = manager_.deleteNote("Groceries");

  EXPECT_EQ(result.status(), OperationStatus::kFailed);
  EXPECT_EQ(result.message(), "Failed to execute command");
  EXPECT_EQ(result.message().find("ENOENT"), std::string::npos);
}

TEST_F(NotesManagerTest, EveryOperationHidesProcessDiagnostics) {
  executor_.otherwise(nb::script::CommandOutcome::failed("ENOENT"));

  EXPECT_EQ(manager_.listAccounts().message(), "Failed to execute command");
  EXPECT_EQ(manager_.searchNotes("q").message(), "Failed to execute command");
  EXPECT_EQ(manager_.getNoteContent("t").message(), "Failed to execute command");
  EXPECT_EQ(manager_.editNote("t", "c").message(), "Failed to execute command");
  EXPECT_EQ(manager_.listFolders().message(), "Failed to execute command");
  EXPECT_EQ(manager_.moveNote("t", "f").message(), "Failed to execute command");
}

TEST_F(NotesManagerTest, ListFoldersCarriesAccount) {
  executor_.thenSucceed("Notes, Recipes");

  auto result = manager_.listFolders();

  ASSERT_TRUE(result.isOk());
  ASSERT_EQ(result.value().size(), 2u);
  EXPECT_EQ(result.value()[1].name, "Recipes");
  EXPECT_EQ(result.value()[1].account, "iCloud");
}

TEST_F(NotesManagerTest, ListAccounts) {
  executor_.thenSucceed("iCloud,On My Mac");

  auto result = manager_.listAccounts();

  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value(), (std::vector<std::string>{"iCloud", "On My Mac"}));
}

TEST_F(NotesManagerTest, MoveFolderMissingWins) {
  executor_.thenSucceed("folder not found");
  EXPECT_EQ(manager_.moveNote("T", "Nope").status(), OperationStatus::kFolderNotFound);
}

TEST_F(NotesManagerTest, MoveNoteMissing) {
  executor_.thenSucceed("note not found");
  EXPECT_EQ(manager_.moveNote("Nope", "Archive").status(), OperationStatus::kNotFound);
}

TEST_F(NotesManagerTest, MoveSucceeds) {
  executor_.thenSucceed("success");
  EXPECT_TRUE(manager_.moveNote("T", "Archive").isOk());
}

TEST_F(NotesManagerTest, InjectionTitleStaysOneStatement) {
  executor_.thenSucceed("success").thenSucceed("success");
  const std::string attack = "abc\" & do shell script \"rm -rf /\" & \"";

  ASSERT_TRUE(manager_.deleteNote(attack).isOk());
  ASSERT_TRUE(manager_.deleteNote("plain").isOk());

  auto commands = executor_.commands();
  ASSERT_EQ(commands.size(), 2u);
  EXPECT_EQ(nb::test::scriptSkeleton(commands[0]), nb::test::scriptSkeleton(commands[1]));
}

namespace {

// /bin/sh stands in for the interpreter: it records the script it was handed
// in $0 and prints a fixed reply
nb::script::ExecutorOptions recordingShell(const std::filesystem::path& capture,
                                           const std::string& reply) {
  nb::script::ExecutorOptions options;
  options.interpreter = "/bin/sh";
  options.leading_args = {"-c", "printf '%s' \"$1\" > \"$0\"; printf '%s' '" + reply + "'",
                          capture.string()};
  return options;
}

std::string readAll(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

TEST(NotesManagerProcessTest, ControlCharacterTitleReachesInterpreterIntact) {
  nb::test::TempDirectory temp;
  auto capture = temp.path() / "script.applescript";
  nb::script::ProcessCommandExecutor executor(recordingShell(capture, "success"));
  NotesManager manager(executor, NotesManagerOptions{"Notes", "iCloud", ','});
  const std::string title = "vt\x0b" "ff\x0c" "esc\x1b[31m bell\a";

  auto result = manager.deleteNote(title);

  ASSERT_TRUE(result.isOk()) << result.message();
  auto script = readAll(capture);
  ASSERT_FALSE(script.empty());
  auto literals = nb::test::stringLiterals(script);
  EXPECT_NE(std::find(literals.begin(), literals.end(), title), literals.end()) << script;
}

TEST(NotesManagerProcessTest, ControlCharacterBodyComesBackIntact) {
  nb::test::TempDirectory temp;
  auto capture = temp.path() / "script.applescript";
  nb::script::ProcessCommandExecutor executor(recordingShell(capture, "page\x0c" "two"));
  NotesManager manager(executor, NotesManagerOptions{"Notes", "iCloud", ','});

  auto result = manager.getNoteContent("vt\x0b" "title");

  ASSERT_TRUE(result.isOk()) << result.message();
  EXPECT_EQ(result.value(), "page\x0c" "two");
}

TEST(FormatContentTest, NewlinesBecomeLineBreaks) {
  EXPECT_EQ(formatContent(""), "");
  EXPECT_EQ(formatContent("a\nb\n"), "a<br>b<br>");
  EXPECT_EQ(formatContent("no breaks"), "no breaks");
}
