#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "ask/prompts/reorder.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
using Lines = std::vector<std::string>;
using Order = std::vector<std::string>;

namespace {

Reorder<std::string> reorder(Order items)
{
  return Reorder<std::string> { "Order:", std::move(items) }
    .withRenderConfig(RenderConfig::empty())
    .withoutHelpMessage();
}

} // namespace

TEST_CASE("ask::Reorder", "[reorder]")
{
  ScriptedTerminal term;

  SECTION("ctrl-down moves the item") {
    term.press(kDown, kControl).press(kDown, kControl).submit();
    CHECK(reorder({ "x", "y", "z" }).promptWith(term) == Order { "y", "z", "x" });
    CHECK(term.lines() == Lines { "? Order: y, z, x" });
  }

  SECTION("ctrl-up moves the item") {
    term.press(kEnd).press(kUp, kControl).submit();
    CHECK(reorder({ "x", "y", "z" }).promptWith(term) == Order { "x", "z", "y" });
  }

  SECTION("items don't move past the ends") {
    term.press(kUp, kControl).press(kEnd).press(kDown, kControl).submit();
    CHECK(reorder({ "x", "y", "z" }).promptWith(term) == Order { "x", "y", "z" });
  }

  SECTION("cursor follows the moved item") {
    term.press(kDown, kControl).submit();
    reorder({ "x", "y", "z" }).promptWith(term);
    CHECK(term.shown("> x"));
    CHECK(term.snapshots()[1] == Lines { "? Order:", "  y", "> x", "  z" });
  }

  SECTION("filter hides items without changing the order") {
    term.type("ap").press(kDown, kControl).submit();
    auto order = reorder({ "apple", "banana", "apricot", "cherry" }).promptWith(term);
    CHECK(order == Order { "apricot", "banana", "apple", "cherry" });
    CHECK(term.shown("  apricot"));
    CHECK(term.snapshots()[2] == Lines { "? Order: ap", "> apple", "  apricot" });
  }

  SECTION("vim mode") {
    term.type("jK").submit();
    CHECK(reorder({ "x", "y", "z" }).withVimMode(true).promptWith(term) == Order { "y", "x", "z" });
  }

  SECTION("formatter") {
    term.submit();
    reorder({ "x", "y" })
      .withFormatter([](const Order& o) { return o.front() + " first"; })
      .promptWith(term);
    CHECK(term.lines() == Lines { "? Order: x first" });
  }

  SECTION("invalid configuration") {
    CHECK_THROWS_AS(reorder({}).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(reorder({ "x" }).withStartingCursor(1).promptWith(term), InvalidConfigurationError);
  }
}
