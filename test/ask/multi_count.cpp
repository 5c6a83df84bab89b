#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "ask/prompts/multi_count.hpp"
#include "ask/validator.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
using Lines = std::vector<std::string>;
using Answer = std::vector<CountedListOption<std::string>>;

namespace {

MultiCount<std::string> fruits()
{
  return MultiCount<std::string> { "Fruits:", { "one", "two", "three" } }
    .withRenderConfig(RenderConfig::empty())
    .withoutHelpMessage();
}

} // namespace

TEST_CASE("ask::MultiCount", "[multi_count]")
{
  ScriptedTerminal term;

  SECTION("right adds one to the option under the cursor") {
    term.press(kRight).submit();
    CHECK(fruits().promptWith(term) == Answer { { 1, { 0, "one" } } });
    CHECK(term.lines() == Lines { "? Fruits: one x1" });
  }

  SECTION("shift moves by ten") {
    term.press(kDown).press(kRight).press(kDown).press(kRight, kShift).submit();
    CHECK(fruits().promptWith(term) == Answer { { 1, { 1, "two" } }, { 10, { 2, "three" } } });
  }

  SECTION("counts never go below zero") {
    term.press(kRight, kShift).press(kLeft).press(kLeft, kShift).press(kDown).press(kLeft).press(kRight).submit();
    CHECK(fruits().promptWith(term) == Answer { { 1, { 1, "two" } } });
  }

  SECTION("options left at zero are not answered") {
    term.press(kRight).press(kLeft).submit();
    CHECK(fruits().promptWith(term).empty());
  }

  SECTION("starting cursor") {
    term.press(kRight).submit();
    CHECK(fruits().withStartingCursor(2).promptWith(term) == Answer { { 1, { 2, "three" } } });
  }

  SECTION("counts are padded to the widest on the page") {
    term.press(kDown).press(kRight, kShift).submit();
    fruits().promptWith(term);
    CHECK(term.snapshots().front() == Lines { "? Fruits:", "> [0] one", "  [0] two", "  [0] three" });
    CHECK(term.shown("  [ 0] one"));
    CHECK(term.shown("> [10] two"));
  }

  SECTION("moving down with nothing matching the filter") {
    term.type("zzz").press(kDown).press(kRight).press(kBackspace).press(kBackspace).press(kBackspace).press(kRight).submit();
    CHECK(fruits().promptWith(term) == Answer { { 1, { 0, "one" } } });
  }

  SECTION("defaults") {
    term.press(kDown).press(kDown).press(kLeft).submit();
    CHECK(fruits().withDefault({ { 0, 3 }, { 2, 1 } }).promptWith(term) == Answer { { 3, { 0, "one" } } });
  }

  SECTION("validator sees the counts") {
    auto atMostFive = [](const Answer& answer) {
      uint32_t total = 0;
      for (const auto& option : answer)
        total += option.mCount;
      if (total > 5)
        return Validation::invalid(std::string { "five at most" });
      return Validation::valid();
    };
    term.press(kRight, kShift).submit().press(kLeft, kShift).press(kRight).submit();
    CHECK(fruits().withValidator(atMostFive).promptWith(term) == Answer { { 1, { 0, "one" } } });
    CHECK(term.shown("# five at most"));
  }

  SECTION("filter is cleared after a change unless kept") {
    term.type("thr").press(kRight).press(kRight).submit();
    CHECK(fruits().withKeepFilter(false).promptWith(term) == Answer { { 1, { 0, "one" } }, { 1, { 2, "three" } } });

    term.type("thr").press(kRight).press(kRight).submit();
    CHECK(fruits().promptWith(term) == Answer { { 2, { 2, "three" } } });
  }

  SECTION("vim mode") {
    term.type("j++-j+").submit();
    CHECK(fruits().withVimMode(true).promptWith(term) == Answer { { 1, { 1, "two" } }, { 1, { 2, "three" } } });
  }

  SECTION("formatter") {
    term.press(kRight).submit();
    fruits().withFormatter([](const Answer& a) { return std::to_string(a.size()) + " kinds"; }).promptWith(term);
    CHECK(term.lines() == Lines { "? Fruits: 1 kinds" });
  }

  SECTION("invalid configuration") {
    CHECK_THROWS_AS(MultiCount<std::string>("Fruits:", {}).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(fruits().withDefault({ { 3, 1 } }).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(fruits().withStartingCursor(3).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(fruits().withPageSize(0).promptWith(term), InvalidConfigurationError);
  }
}
