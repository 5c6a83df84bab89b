#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "ask/ui/frame_renderer.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
using Lines = std::vector<std::string>;

namespace {

void frame(FrameRenderer& renderer, std::string_view content)
{
  renderer.startFrame();
  renderer.write(content);
  renderer.finishFrame();
}

} // namespace

TEST_CASE("ask::AnsiPieces", "[frame_renderer]")
{
  AnsiPieces pieces { "a\x1B[1m\u00e9\x1B[" };

  auto p = pieces.next();
  REQUIRE(p);
  CHECK(p->mBytes == "a");
  CHECK(p->mChar == U'a');
  CHECK_FALSE(p->mEscape);

  p = pieces.next();
  REQUIRE(p);
  CHECK(p->mBytes == "\x1B[1m");
  CHECK(p->mEscape);

  p = pieces.next();
  REQUIRE(p);
  CHECK(p->mChar == U'\u00e9');
  CHECK(p->mBytes.size() == 2);

  // Unterminated sequences are plain characters
  p = pieces.next();
  REQUIRE(p);
  CHECK(p->mChar == U'\x1B');
  p = pieces.next();
  REQUIRE(p);
  CHECK(p->mChar == U'[');

  CHECK_FALSE(pieces.next());
}

TEST_CASE("ask::FrameState", "[frame_renderer]")
{
  FrameState state { TerminalSize { 10, 5 } };

  SECTION("long lines wrap") {
    state.write(Styled { "0123456789abc" });
    state.finish();
    REQUIRE(state.height() == 2);
    CHECK(state.width() == 10);
    CHECK(state.rows()[0].mWidth == 10);
    CHECK(state.rows()[1].mWidth == 3);

    // Rows stay apart on a wider terminal
    state.resize(TerminalSize { 20, 5 });
    CHECK(state.height() == 2);

    state.resize(TerminalSize { 4, 5 });
    REQUIRE(state.height() == 4);
    CHECK(state.rows()[2].mContent.front().mContent == "89");
    CHECK(state.rows()[3].mContent.front().mContent == "abc");
  }

  SECTION("positions follow the rows when the width changes") {
    state.write(Styled { "0123456789\nab\ncd" });
    state.finish();
    CHECK(state.translate(Position { 1, 1 }, TerminalSize { 10, 5 }) == Position { 1, 1 });
    CHECK(state.translate(Position { 1, 1 }, TerminalSize { 40, 5 }) == Position { 1, 1 });
    CHECK(state.translate(Position { 1, 1 }, TerminalSize { 4, 5 }) == Position { 3, 1 });
    CHECK(state.translate(Position { 0, 6 }, TerminalSize { 4, 5 }) == Position { 1, 2 });
    CHECK(state.translate(Position { 3, 0 }, TerminalSize { 4, 5 }) == Position { 5, 0 });
  }

  SECTION("wide characters don't split") {
    state.write(Styled { "012345678\u4e16" });
    state.finish();
    REQUIRE(state.height() == 2);
    CHECK(state.rows()[0].mContent.front().mContent == "012345678");
  }

  SECTION("cursor mark past the edge moves to the next row") {
    state.write(Styled { "0123456789" });
    state.markCursor();
    state.finish();
    REQUIRE(state.cursor());
    CHECK(*state.cursor() == Position { 1, 0 });
  }

  SECTION("escape sequences take no space") {
    state.write(Styled { "\x1B[1mab\x1B[0m" });
    state.finish();
    CHECK(state.width() == 2);
    CHECK(state.rows()[0].mContent.front().mContent == "ab");
  }

  SECTION("rows hash by content and style") {
    FrameState other { TerminalSize { 10, 5 } };
    state.write(Styled { "ab" });
    other.write(Styled { "ab", StyleSheet {}.withAttr(kAttrBold) });
    state.finish();
    other.finish();
    CHECK(state.rows()[0].mHash != other.rows()[0].mHash);
  }
}

TEST_CASE("ask::FrameRenderer", "[frame_renderer]")
{
  ScriptedTerminal term { 20 };

  SECTION("only changed rows are rewritten") {
    {
      FrameRenderer renderer { term };
      frame(renderer, "first\nsecond\nthird");
      CHECK(term.lines() == Lines { "first", "second", "third" });
      CHECK(term.mRewrittenLines == 0);

      frame(renderer, "first\nSECOND\nthird");
      CHECK(term.lines() == Lines { "first", "SECOND", "third" });
      CHECK(term.mRewrittenLines == 1);

      frame(renderer, "first");
      CHECK(term.lines() == Lines { "first" });
      CHECK(term.mClearedLines == 2);
    }

    // Cursor ends up below the frame
    CHECK(term.row() == 1);
    CHECK(term.col() == 0);
    CHECK(term.cursorVisible());
  }

  SECTION("shorter rows clear what was left of the old ones") {
    FrameRenderer renderer { term };
    frame(renderer, "something long");
    frame(renderer, "short");
    CHECK(term.lines() == Lines { "short" });
  }

  SECTION("cursor is placed on the mark") {
    FrameRenderer renderer { term };
    renderer.startFrame();
    renderer.write("? Name ");
    renderer.markCursor();
    renderer.write("\nhelp");
    renderer.finishFrame();

    CHECK(term.row() == 0);
    CHECK(term.col() == 7);
    CHECK(term.cursorVisible());

    renderer.startFrame();
    renderer.write("? Name a");
    renderer.markCursor(-1);
    renderer.write("\nhelp");
    renderer.finishFrame();

    CHECK(term.lines() == Lines { "? Name a", "help" });
    CHECK(term.row() == 0);
    CHECK(term.col() == 7);
  }

  SECTION("writes outside of a frame are dropped") {
    FrameRenderer renderer { term };
    renderer.write("lost");
    frame(renderer, "kept");
    renderer.write("lost");
    CHECK(term.lines() == Lines { "kept" });
  }

  SECTION("terminal gets narrower between frames") {
    ScriptedTerminal wide { 40 };
    FrameRenderer renderer { wide };
    frame(renderer, "0123456789abcdefghijKLMNO\nhelp");
    CHECK(wide.lines() == Lines { "0123456789abcdefghijKLMNO", "help" });
    CHECK(wide.mRowsUp == 0);

    // The long row now takes two rows on screen
    wide.setWidth(20);
    CHECK(wide.lines() == Lines { "0123456789abcdefghij", "KLMNO", "help" });

    frame(renderer, "0123456789abcdefghijKLMNO\nHELP");
    CHECK(wide.lines() == Lines { "0123456789abcdefghij", "KLMNO", "HELP" });
    CHECK(wide.mRowsUp == 2);
    CHECK(wide.mRewrittenLines == 1);
    CHECK(wide.mClearedLines == 0);
  }

  SECTION("terminal gets wider between frames") {
    FrameRenderer renderer { term };
    frame(renderer, "0123456789abcdefghijKLMNO\nhelp");
    CHECK(term.lines() == Lines { "0123456789abcdefghij", "KLMNO", "help" });

    // Rows the frame broke itself stay apart
    term.setWidth(40);
    CHECK(term.lines() == Lines { "0123456789abcdefghij", "KLMNO", "help" });

    frame(renderer, "0123456789abcdefghijKLMNO\nHELP");
    CHECK(term.lines() == Lines { "0123456789abcdefghijKLMNO", "HELP" });
    CHECK(term.mRowsUp == 2);
    CHECK(term.mRewrittenLines == 2);
    CHECK(term.mClearedLines == 1);
  }

  SECTION("frame shrinks after the terminal got narrower") {
    ScriptedTerminal wide { 40 };
    FrameRenderer renderer { wide };
    frame(renderer, "0123456789abcdefghijKLMNO\nhelp");
    wide.setWidth(20);
    frame(renderer, "short");
    CHECK(wide.lines() == Lines { "short" });
    CHECK(wide.mClearedLines == 2);
  }

  SECTION("each frame is flushed once") {
    FrameRenderer renderer { term };
    frame(renderer, "a");
    frame(renderer, "b");
    CHECK(term.mFlushes == 2);
    CHECK(term.snapshots().front() == Lines { "a" });
  }
}
