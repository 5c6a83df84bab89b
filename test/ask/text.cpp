#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

#include "ask/autocomplete.hpp"
#include "ask/prompts/text.hpp"
#include "ask/validator.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
using Lines = std::vector<std::string>;

namespace {

Text textPrompt()
{
  return Text { "What's your name?" }.withRenderConfig(RenderConfig::empty());
}

} // namespace

TEST_CASE("ask::Text", "[text]")
{
  ScriptedTerminal term;

  SECTION("typed answer") {
    term.type("alice").submit();
    CHECK(textPrompt().promptWith(term) == "alice");
    CHECK(term.lines() == Lines { "? What's your name? alice" });
    CHECK(term.pendingKeys() == 0);
  }

  SECTION("length limits") {
    term.type("alice").submit();
    auto answer = Text { "Name?" }
      .withRenderConfig(RenderConfig::empty())
      .withValidator(required())
      .withValidator(maxLength(140))
      .promptWith(term);
    CHECK(answer == "alice");
    CHECK(term.lines() == Lines { "? Name? alice" });
  }

  SECTION("frames show the input being typed") {
    term.type("al").submit();
    auto answer = textPrompt().promptWith(term);
    CHECK(answer == "al");
    CHECK(term.snapshots().front() == Lines { "? What's your name?" });
    CHECK(term.shown("? What's your name? al"));
  }

  SECTION("editing keys") {
    term.type("alixe").press(kLeft).press(kBackspace).type("c").press(kEnd).type("!").submit();
    CHECK(textPrompt().promptWith(term) == "alice!");
  }

  SECTION("default answer for empty input") {
    term.submit();
    CHECK(textPrompt().withDefault("bob").promptWith(term) == "bob");
    CHECK(term.lines() == Lines { "? What's your name? bob" });
  }

  SECTION("default is shown next to the prompt") {
    term.type("x").submit();
    textPrompt().withDefault("bob").promptWith(term);
    CHECK(term.snapshots().front() == Lines { "? What's your name? (bob)" });
  }

  SECTION("placeholder and initial value") {
    term.submit();
    CHECK(textPrompt().withInitialValue("carol").promptWith(term) == "carol");

    term.type("d").submit();
    auto answer = textPrompt().withPlaceholder("your name").promptWith(term);
    CHECK(answer == "d");
    CHECK(term.shown("? What's your name? your name"));
  }

  SECTION("rejected answers keep the prompt open") {
    term.submit().type("dave").submit();
    auto answer = textPrompt().withValidator(required()).withHelpMessage("first name").promptWith(term);
    CHECK(answer == "dave");
    CHECK(term.shown("# A response is required."));
    CHECK(term.shown("[first name]"));
    CHECK(term.lines() == Lines { "? What's your name? dave" });
  }

  SECTION("validators run in order") {
    term.type("ab").submit().type("c").submit();
    auto answer = textPrompt()
      .withValidator(minLength(3, std::string { "too short" }))
      .withValidator(maxLength(5))
      .promptWith(term);
    CHECK(answer == "abc");
    CHECK(term.shown("# too short"));
  }

  SECTION("formatter") {
    term.type("eve").submit();
    textPrompt().withFormatter([](const std::string& s) { return "<" + s + ">"; }).promptWith(term);
    CHECK(term.lines() == Lines { "? What's your name? <eve>" });
  }

  SECTION("escape cancels") {
    term.type("frank").cancel();
    CHECK_THROWS_AS(textPrompt().promptWith(term), CanceledError);
    CHECK(term.lines() == Lines { "? What's your name? <canceled>" });
  }

  SECTION("ctrl-c interrupts without an answer line") {
    term.type("gr").press(kInterrupt);
    CHECK_THROWS_AS(textPrompt().promptWith(term), InterruptedError);
    CHECK(term.lines() == Lines { "? What's your name? gr" });
  }

  SECTION("skipOnCancel turns cancel into no value") {
    term.cancel();
    auto answer = skipOnCancel([&] { return textPrompt().promptWith(term); });
    CHECK_FALSE(answer);

    term.press(kInterrupt);
    CHECK_THROWS_AS(skipOnCancel([&] { return textPrompt().promptWith(term); }), InterruptedError);
  }

  SECTION("running out of keys is an IO error") {
    term.type("x");
    CHECK_THROWS_AS(textPrompt().promptWith(term), IOError);
  }

  SECTION("page size must be positive") {
    CHECK_THROWS_AS(textPrompt().withPageSize(0).promptWith(term), InvalidConfigurationError);
  }
}

TEST_CASE("ask::Text suggestions", "[text]")
{
  ScriptedTerminal term;
  auto words = std::make_shared<WordListAutocomplete>(
    std::vector<std::string> { "apple", "apricot", "banana", "grape" });
  auto prompt = Text { "Fruit:" }.withRenderConfig(RenderConfig::empty()).withAutocomplete(words);

  SECTION("suggestions are listed under the input") {
    term.type("ap").submit();
    CHECK(prompt.promptWith(term) == "ap");
    CHECK(term.shown("  apple"));
    CHECK(term.shown("  apricot"));
    CHECK(term.shown("  grape"));
    CHECK_FALSE(term.shown("banana"));
  }

  SECTION("highlighted suggestion is the answer") {
    term.type("ap").press(kDown).press(kDown).submit();
    CHECK(prompt.promptWith(term) == "apricot");
    CHECK(term.shown("> apricot"));
  }

  SECTION("moving up past the first suggestion goes back to the input") {
    term.type("ap").press(kDown).press(kUp).submit();
    CHECK(prompt.promptWith(term) == "ap");
  }

  SECTION("tab completes the highlighted suggestion") {
    term.type("ban").press(kDown).press(kTab).type("s").submit();
    CHECK(prompt.promptWith(term) == "bananas");
  }
}
