#include <catch2/catch_test_macros.hpp>

#include "ask/input.hpp"

using namespace ask;

static void typeInto(Input& input, std::u32string_view text)
{
  for (char32_t ch : text)
    input.handle(InputAction::write(ch));
}

TEST_CASE("ask::Input editing", "[input]")
{
  SECTION("writes at the cursor") {
    Input input;
    typeInto(input, U"helo");
    input.handle(InputAction::move(Magnitude::Char, LineDirection::Left));
    input.handle(InputAction::write('l'));
    CHECK(input.content() == "hello");
    CHECK(input.cursor() == 4);
    CHECK(input.length() == 5);
  }

  SECTION("starts with the cursor at the end") {
    Input input { "abc" };
    CHECK(input.cursor() == 3);
    CHECK(input.preCursor() == "abc");
  }

  SECTION("variation selector joins the previous grapheme") {
    Input input;
    CHECK(input.handle(InputAction::write(U'\u2764')) == InputActionResult::ContentChanged);
    CHECK(input.handle(InputAction::write(U'\uFE0F')) == InputActionResult::ContentChanged);
    CHECK(input.length() == 1);
    CHECK(input.cursor() == 1);
    CHECK(input.content() == "\u2764\uFE0F");
  }

  SECTION("combining mark is deleted together with its base") {
    Input input;
    typeInto(input, U"ae\u0301");
    CHECK(input.length() == 2);
    input.handle(InputAction::remove(Magnitude::Char, LineDirection::Left));
    CHECK(input.content() == "a");
  }

  SECTION("left then right restores the cursor") {
    Input input { "xe\u0301y" };
    input.withCursor(2);
    input.handle(InputAction::move(Magnitude::Char, LineDirection::Left));
    input.handle(InputAction::move(Magnitude::Char, LineDirection::Right));
    CHECK(input.cursor() == 2);
  }

  SECTION("moves at the edges are clean") {
    Input input { "ab" };
    CHECK(input.handle(InputAction::move(Magnitude::Char, LineDirection::Right)) == InputActionResult::Clean);
    input.withCursor(0);
    CHECK(input.handle(InputAction::move(Magnitude::Word, LineDirection::Left)) == InputActionResult::Clean);
    CHECK(input.handle(InputAction::remove(Magnitude::Char, LineDirection::Left)) == InputActionResult::Clean);
  }

  SECTION("clear") {
    Input input { "abc" };
    input.clear();
    CHECK(input.isEmpty());
    CHECK(input.cursor() == 0);
    CHECK(input.length() == 0);
  }
}

TEST_CASE("ask::Input word motion", "[input]")
{
  Input input { "hello big  world" };

  SECTION("moves to word boundaries") {
    input.withCursor(0);
    input.handle(InputAction::move(Magnitude::Word, LineDirection::Right));
    CHECK(input.cursor() == 5);
    input.handle(InputAction::move(Magnitude::Word, LineDirection::Right));
    CHECK(input.cursor() == 9);

    input.withCursor(input.length());
    input.handle(InputAction::move(Magnitude::Word, LineDirection::Left));
    CHECK(input.cursor() == 11);
    input.handle(InputAction::move(Magnitude::Word, LineDirection::Left));
    CHECK(input.cursor() == 6);
  }

  SECTION("left then right never ends before the start") {
    for (size_t start = 0; start <= input.length(); ++start) {
      CAPTURE(start);
      input.withCursor(start);
      input.handle(InputAction::move(Magnitude::Word, LineDirection::Left));
      input.handle(InputAction::move(Magnitude::Word, LineDirection::Right));
      CHECK(input.cursor() >= start);
    }
  }

  SECTION("line motion") {
    input.withCursor(3);
    input.handle(InputAction::move(Magnitude::Line, LineDirection::Left));
    CHECK(input.cursor() == 0);
    input.handle(InputAction::move(Magnitude::Line, LineDirection::Right));
    CHECK(input.cursor() == input.length());
  }
}

TEST_CASE("ask::Input deletion", "[input]")
{
  SECTION("backwards delete removes up to where the motion goes") {
    for (auto mag : { Magnitude::Char, Magnitude::Word, Magnitude::Line }) {
      Input moved { "one two three" };
      moved.withCursor(9);
      moved.handle(InputAction::move(mag, LineDirection::Left));
      const size_t target = moved.cursor();

      Input input { "one two three" };
      input.withCursor(9);
      CHECK(input.handle(InputAction::remove(mag, LineDirection::Left)) == InputActionResult::ContentChanged);
      CHECK(input.cursor() == target);

      std::string expected = "one two three";
      expected.erase(target, 9 - target);
      CHECK(input.content() == expected);
    }
  }

  SECTION("forwards delete") {
    Input input { "one two" };
    input.withCursor(0);
    input.handle(InputAction::remove(Magnitude::Char, LineDirection::Right));
    CHECK(input.content() == "ne two");
    input.handle(InputAction::remove(Magnitude::Word, LineDirection::Right));
    CHECK(input.content() == " two");
    input.handle(InputAction::remove(Magnitude::Line, LineDirection::Right));
    CHECK(input.content().empty());
    CHECK(input.handle(InputAction::remove(Magnitude::Char, LineDirection::Right)) == InputActionResult::Clean);
  }
}

TEST_CASE("ask::InputAction::fromKey", "[input]")
{
  CHECK(InputAction::fromKey(Key::character('a')) == InputAction::write('a'));
  CHECK(InputAction::fromKey(kBackspace) == InputAction::remove(Magnitude::Char, LineDirection::Left));
  CHECK(InputAction::fromKey(Key { kDelete, kControl }) == InputAction::remove(Magnitude::Word, LineDirection::Right));
  CHECK(InputAction::fromKey(Key { kLeft, kControl }) == InputAction::move(Magnitude::Word, LineDirection::Left));
  CHECK(InputAction::fromKey(kHome) == InputAction::move(Magnitude::Line, LineDirection::Left));
  CHECK(InputAction::fromKey(kEnd) == InputAction::move(Magnitude::Line, LineDirection::Right));
  CHECK_FALSE(InputAction::fromKey(Key::character('h', kControl)));
  CHECK(InputAction::fromKey(Key::character('r', kControl)) == InputAction::write('r'));
  CHECK(InputAction::fromKey(Key::character(U'\u00e9', kAlt)) == InputAction::write(U'\u00e9'));
  CHECK(InputAction::fromKey(Key::character('x', kAlt)) == InputAction::write('x'));
  CHECK_FALSE(InputAction::fromKey(kUp));
}
