#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "ask/prompts/multi_select.hpp"
#include "ask/validator.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
using Lines = std::vector<std::string>;
using Answer = std::vector<ListOption<std::string>>;

namespace {

MultiSelect<std::string> letters()
{
  return MultiSelect<std::string> { "Letters:", { "a", "b", "c", "d" } }
    .withRenderConfig(RenderConfig::empty())
    .withoutHelpMessage();
}

} // namespace

TEST_CASE("ask::MultiSelect", "[multi_select]")
{
  ScriptedTerminal term;

  SECTION("space toggles the option under the cursor") {
    term.press(kDown).type(" ").press(kDown).press(kDown).type(" ").submit();
    CHECK(letters().promptWith(term) == Answer { { 1, "b" }, { 3, "d" } });
    CHECK(term.lines() == Lines { "? Letters: b, d" });
    CHECK(term.shown("> [x] d"));
    CHECK(term.shown("  [x] b"));
  }

  SECTION("toggling twice unchecks") {
    term.type("  ").submit();
    CHECK(letters().promptWith(term).empty());
  }

  SECTION("nothing checked") {
    term.submit();
    CHECK(letters().promptWith(term).empty());
    CHECK(term.snapshots().front() == Lines { "? Letters:", "> [ ] a", "  [ ] b", "  [ ] c", "  [ ] d" });
  }

  SECTION("right checks everything, left clears") {
    term.press(kRight).submit();
    CHECK(letters().promptWith(term).size() == 4);

    term.press(kRight).press(kLeft).submit();
    CHECK(letters().promptWith(term).empty());
  }

  SECTION("select all only checks the filtered options") {
    term.type("c").press(kRight).submit();
    CHECK(letters().promptWith(term) == Answer { { 2, "c" } });
  }

  SECTION("defaults") {
    term.submit();
    CHECK(letters().withDefault({ 0, 2 }).promptWith(term) == Answer { { 0, "a" }, { 2, "c" } });

    term.submit();
    CHECK(letters().withAllSelectedByDefault().promptWith(term).size() == 4);
  }

  SECTION("answers are in list order") {
    term.press(kEnd).type(" ").press(kHome).type(" ").submit();
    CHECK(letters().promptWith(term) == Answer { { 0, "a" }, { 3, "d" } });
  }

  SECTION("validator") {
    term.submit().type(" ").submit();
    auto answer = letters()
      .withValidator(minLength<Answer>(1, std::string { "pick one" }))
      .promptWith(term);
    CHECK(answer == Answer { { 0, "a" } });
    CHECK(term.shown("# pick one"));
  }

  SECTION("filter is cleared after toggling unless kept") {
    term.type("c ").press(kDown).type(" ").submit();
    CHECK(letters().withKeepFilter(false).promptWith(term) == Answer { { 1, "b" }, { 2, "c" } });
  }

  SECTION("vim mode") {
    term.type("jj l").submit();
    CHECK(letters().withVimMode(true).promptWith(term).size() == 4);
  }

  SECTION("formatter") {
    term.type(" ").submit();
    letters().withFormatter([](const Answer& a) { return std::to_string(a.size()) + " picked"; }).promptWith(term);
    CHECK(term.lines() == Lines { "? Letters: 1 picked" });
  }

  SECTION("invalid configuration") {
    CHECK_THROWS_AS(letters().withDefault({ 4 }).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(letters().withStartingCursor(7).promptWith(term), InvalidConfigurationError);
  }
}
