#include "nb/notes/note_scripts.hpp"

#include "nb/script/script_builder.hpp"
#include "nb/script/sentinels.hpp"

namespace nb::notes::scripts {

using nb::script::ScriptBuilder;
namespace sentinel = nb::script::sentinel;

namespace {

std::string makeNoteStatement(std::string_view title, std::string_view body) {
  return "make new note with properties {name:" + ScriptBuilder::quote(title) +
         ", body:" + ScriptBuilder::quote(body) + "}";
}

// Emits a loop binding `targetFolder` to the folder named `folder`, returning
// the folder sentinel when there is none
void findFolder(ScriptBuilder& script, std::string_view folder) {
  script.add("set targetFolder to missing value")
      .begin("repeat with aFolder in folders", "end repeat")
      .begin("if name of aFolder is " + ScriptBuilder::quote(folder) + " then", "end if")
      .add("set targetFolder to aFolder")
      .add("exit repeat")
      .end()
      .end()
      .begin("if targetFolder is missing value then", "end if")
      .returnSentinel(sentinel::kFolderNotFound)
      .end();
}

// Emits a loop over every note that runs `action` on the note named `title`
// and sets `foundNote`
void forNoteNamed(ScriptBuilder& script, std::string_view title, std::string_view action) {
  script.add("set foundNote to false")
      .begin("repeat with aNote in every note", "end repeat")
      .begin("if name of aNote is " + ScriptBuilder::quote(title) + " then", "end if")
      .add(action)
      .add("set foundNote to true")
      .add("exit repeat")
      .end()
      .end();
}

void returnFoundOr(ScriptBuilder& script, std::string_view missing) {
  script.begin("if foundNote then", "end if")
      .returnSentinel(sentinel::kSuccess)
      .add("else")
      .returnSentinel(missing)
      .end();
}

}  // namespace

std::string listAccounts(const Target& target) {
  ScriptBuilder script(target.application);
  script.useListSeparator(target.list_separator)
      .add("set accountList to {}")
      .begin("repeat with anAccount in accounts", "end repeat")
      .add("set end of accountList to name of anAccount")
      .end()
      .add("return accountList as text");
  return script.build();
}

std::string createNoteInDefaultAccount(const Target& target, std::string_view title,
                                       std::string_view body) {
  ScriptBuilder script(target.application);
  script.add(makeNoteStatement(title, body))
      .returnSentinel(sentinel::kCreated);
  return script.build();
}

std::string createNoteInAccount(const Target& target, std::string_view title,
                                std::string_view body) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account)
      .add(makeNoteStatement(title, body))
      .returnSentinel(sentinel::kCreated);
  return script.build();
}

std::string createNoteInFolder(const Target& target, std::string_view folder,
                               std::string_view title, std::string_view body) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account);
  findFolder(script, folder);
  script.tellVariable("targetFolder")
      .add(makeNoteStatement(title, body))
      .end()
      .returnSentinel(sentinel::kCreated);
  return script.build();
}

std::string searchNotes(const Target& target, std::string_view query) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account)
      .useListSeparator(target.list_separator)
      .add("set matchingNotes to notes whose body contains " + ScriptBuilder::quote(query))
      .add("set resultList to {}")
      .begin("repeat with currentNote in matchingNotes", "end repeat")
      .add("set end of resultList to name of currentNote")
      .end()
      .add("return resultList as text");
  return script.build();
}

std::string getNoteBody(const Target& target, std::string_view title) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account)
      .begin("repeat with aNote in every note", "end repeat")
      .begin("if name of aNote is " + ScriptBuilder::quote(title) + " then", "end if")
      .add("return body of aNote")
      .end()
      .end()
      .returnSentinel(sentinel::kNotFound);
  return script.build();
}

std::string editNoteBody(const Target& target, std::string_view title, std::string_view body) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account);
  forNoteNamed(script, title, "set body of aNote to " + ScriptBuilder::quote(body));
  returnFoundOr(script, sentinel::kNotFound);
  return script.build();
}

std::string deleteNote(const Target& target, std::string_view title) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account);
  forNoteNamed(script, title, "delete aNote");
  returnFoundOr(script, sentinel::kNotFound);
  return script.build();
}

std::string listFolders(const Target& target) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account)
      .useListSeparator(target.list_separator)
      .add("set folderList to {}")
      .begin("repeat with aFolder in folders", "end repeat")
      .add("set end of folderList to name of aFolder")
      .end()
      .add("return folderList as text");
  return script.build();
}

std::string moveNote(const Target& target, std::string_view title, std::string_view folder) {
  ScriptBuilder script(target.application);
  script.tellAccount(target.account);
  findFolder(script, folder);
  forNoteNamed(script, title, "move aNote to targetFolder");
  returnFoundOr(script, sentinel::kNoteNotFound);
  return script.build();
}

}  // namespace nb::notes::scripts
