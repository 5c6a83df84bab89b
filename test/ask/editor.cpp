#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "ask/prompts/editor.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
using Lines = std::vector<std::string>;

namespace {

bool exists(const std::string& path)
{
  return ::access(path.c_str(), F_OK) == 0;
}

// `sh -c script path` runs the script with the file as $0
Editor writing(const std::string& script)
{
  return Editor { "Notes:" }
    .withRenderConfig(RenderConfig::empty())
    .withEditorCommand("sh")
    .withArgs({ "-c", script });
}

} // namespace

TEST_CASE("ask::TempFile", "[editor]")
{
  std::string path;
  {
    TempFile file { "tmp-", ".md" };
    path = file.path();
    CHECK(exists(path));
    CHECK(path.size() > 3);
    CHECK(path.compare(path.size() - 3, 3, ".md") == 0);
    CHECK(file.read().empty());

    file.write("some\ntext");
    CHECK(file.read() == "some\ntext");

    TempFile moved { std::move(file) };
    CHECK(moved.path() == path);
    CHECK(exists(path));
  }
  CHECK_FALSE(exists(path));
}

TEST_CASE("ask::Editor", "[editor]")
{
  ScriptedTerminal term;

  SECTION("text written by the editor") {
    term.type("e").submit();
    CHECK(writing("printf 'hello\\n' > \"$0\"").promptWith(term) == "hello");
    CHECK(term.lines() == Lines { "? Notes: <received>" });
  }

  SECTION("prompt names the editor") {
    term.submit();
    writing("true").promptWith(term);
    CHECK(term.snapshots().front() == Lines { "? Notes: [(e) to open sh, (enter) to submit]" });
  }

  SECTION("predefined text without opening the editor") {
    term.submit();
    CHECK(writing("true").withPredefinedText("draft\r\n").promptWith(term) == "draft");
  }

  SECTION("only one line ending is removed") {
    term.type("e").submit();
    CHECK(writing("printf 'a\\n\\n' > \"$0\"").promptWith(term) == "a\n");
  }

  SECTION("editor sees the file extension") {
    term.type("e").submit();
    auto answer = writing("case \"$0\" in *.toml) echo yes > \"$0\";; *) echo no > \"$0\";; esac")
      .withFileExtension(".toml")
      .promptWith(term);
    CHECK(answer == "yes");
  }

  SECTION("validator") {
    term.submit().type("e").submit();
    auto answer = writing("echo done > \"$0\"").withValidator(required()).promptWith(term);
    CHECK(answer == "done");
    CHECK(term.shown("# A response is required."));
  }

  SECTION("missing editor") {
    term.type("e");
    auto editor = Editor { "Notes:" }
      .withRenderConfig(RenderConfig::empty())
      .withEditorCommand("ask-test-no-such-editor");
    CHECK_THROWS_AS(editor.promptWith(term), IOError);
  }

  SECTION("empty command") {
    CHECK_THROWS_AS(
      Editor { "Notes:" }.withEditorCommand("").promptWith(term), InvalidConfigurationError);
  }
}

TEST_CASE("ask::defaultEditorCommand", "[editor]")
{
  ::unsetenv("VISUAL");
  ::setenv("EDITOR", "vim", 1);
  CHECK(defaultEditorCommand() == "vim");
  ::setenv("VISUAL", "code", 1);
  CHECK(defaultEditorCommand() == "code");
  ::setenv("VISUAL", "", 1);
  CHECK(defaultEditorCommand() == "vim");
  ::unsetenv("EDITOR");
  ::unsetenv("VISUAL");
  CHECK(defaultEditorCommand() == kDefaultEditor);
}
