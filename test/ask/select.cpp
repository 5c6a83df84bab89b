#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "ask/prompts/select.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
using Lines = std::vector<std::string>;

namespace {

Select<std::string> fruits()
{
  return Select<std::string> { "Fruit?", { "Banana", "Apple", "Cherry" } }
    .withRenderConfig(RenderConfig::empty())
    .withoutHelpMessage();
}

std::vector<int> numbers(int n)
{
  std::vector<int> out;
  for (int i = 1; i <= n; ++i)
    out.push_back(i);
  return out;
}

} // namespace

TEST_CASE("ask::Select", "[select]")
{
  ScriptedTerminal term;

  SECTION("arrows move the cursor") {
    term.press(kDown).submit();
    CHECK(fruits().promptWith(term) == ListOption<std::string> { 1, "Apple" });
    CHECK(term.lines() == Lines { "? Fruit? Apple" });
  }

  SECTION("options are listed with the cursor") {
    term.submit();
    fruits().promptWith(term);
    CHECK(term.snapshots().front() == Lines { "? Fruit?", "> Banana", "  Apple", "  Cherry" });
  }

  SECTION("cursor wraps around") {
    term.press(kUp).submit();
    CHECK(fruits().promptWith(term).mIndex == 2);

    term.press(kDown).press(kDown).press(kDown).submit();
    CHECK(fruits().promptWith(term).mIndex == 0);
  }

  SECTION("typing filters the options") {
    term.type("che").submit();
    CHECK(fruits().promptWith(term) == ListOption<std::string> { 2, "Cherry" });
    CHECK(term.shown("? Fruit? che"));
    CHECK(term.snapshots()[3] == Lines { "? Fruit? che", "> Cherry" });
  }

  SECTION("best fuzzy match comes first") {
    term.type("ap").submit();
    auto answer = Select<std::string> { "Fruit?", { "Banana", "Apple", "Strawberry" } }
      .withRenderConfig(RenderConfig::empty())
      .promptWith(term);
    CHECK(answer == ListOption<std::string> { 1, "Apple" });
  }

  SECTION("nothing to submit when no option matches") {
    term.type("zzz").submit().press(kBackspace).press(kBackspace).press(kBackspace).submit();
    CHECK(fruits().promptWith(term).mValue == "Banana");
  }

  SECTION("without filtering typed text is ignored") {
    term.type("che").submit();
    CHECK(fruits().withoutFiltering().promptWith(term).mValue == "Banana");
  }

  SECTION("vim mode") {
    term.type("jjk").submit();
    CHECK(fruits().withVimMode(true).promptWith(term).mValue == "Apple");
  }

  SECTION("starting cursor") {
    term.submit();
    CHECK(fruits().withStartingCursor(2).promptWith(term).mValue == "Cherry");
  }

  SECTION("formatter") {
    term.submit();
    fruits()
      .withFormatter([](const ListOption<std::string>& o) { return std::to_string(o.mIndex) + ":" + o.mValue; })
      .promptWith(term);
    CHECK(term.lines() == Lines { "? Fruit? 0:Banana" });
  }

  SECTION("invalid configuration") {
    CHECK_THROWS_AS(Select<std::string>("Empty", {}).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(fruits().withStartingCursor(3).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(fruits().withPageSize(0).promptWith(term), InvalidConfigurationError);
  }

  SECTION("escape cancels") {
    term.cancel();
    CHECK_THROWS_AS(fruits().promptWith(term), CanceledError);
    CHECK(term.lines() == Lines { "? Fruit? <canceled>" });
  }
}

TEST_CASE("ask::Select pages", "[select]")
{
  ScriptedTerminal term;
  auto select = Select<int> { "Number", numbers(10) }
    .withRenderConfig(RenderConfig::empty())
    .withoutHelpMessage()
    .withPageSize(3);

  SECTION("first page shows a scroll marker") {
    term.submit();
    CHECK(select.promptWith(term) == ListOption<int> { 0, 1 });
    CHECK(term.snapshots().front() == Lines { "? Number", "> 1", "  2", "v 3" });
  }

  SECTION("end jumps to the last option") {
    term.press(kEnd).submit();
    CHECK(select.promptWith(term) == ListOption<int> { 9, 10 });
    CHECK(term.shown("^ 8"));
    CHECK(term.shown("> 10"));
  }

  SECTION("page down doesn't wrap") {
    term.press(kPageDown).press(kPageDown).press(kPageDown).press(kPageDown).submit();
    CHECK(select.promptWith(term).mValue == 10);
  }
}
