#include <gtest/gtest.h>

#include "nb/notes/note_scripts.hpp"
#include "applescript_double.hpp"
#include "test_helpers.hpp"

using namespace nb::notes;
using namespace nb::test;

namespace {

const scripts::Target kTarget{"Notes", "iCloud", ','};

const std::string kInjection = "abc\" & do shell script \"rm -rf /\" & \"";

// Value compared against `name of <var>` in the first matching loop
std::optional<std::string> comparedName(const std::string& script, const std::string& var) {
  std::string marker = "if name of " + var + " is ";
  auto start = script.find(marker);
  if (start == std::string::npos) return std::nullopt;
  start += marker.size();
  auto end = script.find(" then\n", start);
  if (end == std::string::npos) return std::nullopt;
  return evaluateStringExpression(script.substr(start, end - start));
}

}  // namespace

TEST(NoteScriptsTest, EveryCommandStartsWithApplicationTell) {
  for (const auto& script : {scripts::listAccounts(kTarget),
                             scripts::searchNotes(kTarget, "x"),
                             scripts::listFolders(kTarget),
                             scripts::deleteNote(kTarget, "x")}) {
    EXPECT_EQ(script.rfind("tell application \"Notes\"\n", 0), 0u) << script;
    EXPECT_EQ(script.substr(script.size() - 9), "end tell\n");
  }
}

TEST(NoteScriptsTest, AccountScopedCommandsTellTheAccount) {
  auto script = scripts::deleteNote(kTarget, "Groceries");
  EXPECT_NE(script.find("  tell account (\"iCloud\")\n"), std::string::npos);

  auto accounts = scripts::listAccounts(kTarget);
  EXPECT_EQ(accounts.find("tell account"), std::string::npos);
}

TEST(NoteScriptsTest, DefaultAccountCreateHasNoAccountTell) {
  auto script = scripts::createNoteInDefaultAccount(kTarget, "T", "B");
  EXPECT_EQ(script.find("tell account"), std::string::npos);
  EXPECT_NE(script.find("make new note with properties {name:(\"T\"), body:(\"B\")}"),
            std::string::npos);
  EXPECT_NE(script.find("return \"created\""), std::string::npos);

  auto in_account = scripts::createNoteInAccount(kTarget, "T", "B");
  EXPECT_NE(in_account.find("tell account (\"iCloud\")"), std::string::npos);
}

TEST(NoteScriptsTest, FolderCreateReportsMissingFolder) {
  auto script = scripts::createNoteInFolder(kTarget, "Recipes", "T", "B");
  EXPECT_NE(script.find("return \"folder not found\""), std::string::npos);
  EXPECT_NE(script.find("tell targetFolder"), std::string::npos);
  EXPECT_EQ(comparedName(script, "aFolder"), "Recipes");
}

TEST(NoteScriptsTest, LookupsReturnSentinelOnBothPaths) {
  auto edit = scripts::editNoteBody(kTarget, "T", "new");
  EXPECT_NE(edit.find("return \"success\""), std::string::npos);
  EXPECT_NE(edit.find("return \"not found\""), std::string::npos);

  auto get = scripts::getNoteBody(kTarget, "T");
  EXPECT_NE(get.find("return body of aNote"), std::string::npos);
  EXPECT_NE(get.find("return \"not found\""), std::string::npos);
}

TEST(NoteScriptsTest, MoveChecksFolderBeforeNote) {
  auto script = scripts::moveNote(kTarget, "T", "Archive");
  auto folder_check = script.find("return \"folder not found\"");
  auto note_check = script.find("return \"note not found\"");

  ASSERT_NE(folder_check, std::string::npos);
  ASSERT_NE(note_check, std::string::npos);
  EXPECT_LT(folder_check, note_check);
  EXPECT_NE(script.find("move aNote to targetFolder"), std::string::npos);
}

TEST(NoteScriptsTest, ListCommandsJoinWithSeparator) {
  scripts::Target pipe_target{"Notes", "iCloud", '|'};
  for (const auto& script : {scripts::listAccounts(pipe_target),
                             scripts::listFolders(pipe_target),
                             scripts::searchNotes(pipe_target, "q")}) {
    EXPECT_NE(script.find("set AppleScript's text item delimiters to (\"|\")"), std::string::npos);
    EXPECT_NE(script.find(" as text"), std::string::npos);
  }
}

TEST(NoteScriptsTest, InjectionInTitleDoesNotChangeStatements) {
  auto benign = scripts::deleteNote(kTarget, "Groceries");
  auto hostile = scripts::deleteNote(kTarget, kInjection);

  EXPECT_EQ(scriptSkeleton(hostile), scriptSkeleton(benign));
  EXPECT_EQ(comparedName(hostile, "aNote"), kInjection);
  EXPECT_EQ(hostile.find("\ndo shell script"), std::string::npos);
}

TEST(NoteScriptsTest, InjectionInEveryFieldDoesNotChangeStatements) {
  EXPECT_EQ(scriptSkeleton(scripts::createNoteInFolder(kTarget, kInjection, kInjection, kInjection)),
            scriptSkeleton(scripts::createNoteInFolder(kTarget, "F", "T", "B")));
  EXPECT_EQ(scriptSkeleton(scripts::editNoteBody(kTarget, kInjection, kInjection)),
            scriptSkeleton(scripts::editNoteBody(kTarget, "T", "B")));
  EXPECT_EQ(scriptSkeleton(scripts::moveNote(kTarget, kInjection, kInjection)),
            scriptSkeleton(scripts::moveNote(kTarget, "T", "F")));
  EXPECT_EQ(scriptSkeleton(scripts::searchNotes(kTarget, kInjection)),
            scriptSkeleton(scripts::searchNotes(kTarget, "q")));

  scripts::Target hostile_account{"Notes", kInjection, ','};
  EXPECT_EQ(scriptSkeleton(scripts::listFolders(hostile_account)),
            scriptSkeleton(scripts::listFolders(kTarget)));
}

TEST(NoteScriptsTest, HostileTitlesSurviveComparison) {
  for (const auto& title : hostileStrings()) {
    auto script = scripts::getNoteBody(kTarget, title);
    ASSERT_TRUE(tokenizeScript(script).has_value()) << title;
    EXPECT_EQ(comparedName(script, "aNote"), title);
  }
}
