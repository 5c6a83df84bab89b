// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "ask/style.hpp"
#include "ask/term/terminal.hpp"
#include "ask/util.hpp"

namespace ask {

struct Position
{
  uint16_t mRow { 0 };
  uint16_t mCol { 0 };

  constexpr bool operator==(const Position& b) const noexcept { return mRow == b.mRow && mCol == b.mCol; }
  constexpr bool operator!=(const Position& b) const noexcept { return !(*this == b); }
};

/// Logical frame: rows of styled text laid out for a given terminal width.
class FrameState
{
public:
  struct Row
  {
    std::vector<Styled> mContent;
    uint64_t mHash { 0 };
    uint16_t mWidth { 0 };
  };

  explicit FrameState(TerminalSize size) noexcept : mTerminalSize(size) { }

  void write(const Styled& value);
  /// Remember the current position, moved right by offset columns
  void markCursor(int offset) noexcept;
  /// Finish the row in progress
  void finish();
  /// Lay out the same rows again for a terminal of a different size. Rows end
  /// with a hard line break on screen, so they are never joined, only rows
  /// wider than the terminal are split.
  void resize(TerminalSize size);
  /// Where a position in this layout ends up once the terminal has rewrapped
  /// the rows for the new width
  [[nodiscard]] Position translate(Position pos, TerminalSize size) const noexcept;

  [[nodiscard]] TerminalSize terminalSize() const noexcept { return mTerminalSize; }
  [[nodiscard]] const std::vector<Row>& rows() const noexcept { return mRows; }
  [[nodiscard]] const std::optional<Position>& cursor() const noexcept { return mCursor; }
  [[nodiscard]] uint16_t height() const noexcept { return static_cast<uint16_t>(mRows.size()); }
  [[nodiscard]] uint16_t width() const noexcept { return mWidth; }

private:
  void finishLine();

  TerminalSize mTerminalSize;
  std::vector<Row> mRows;
  uint16_t mWidth { 0 };
  std::optional<Position> mCursor;
  Styled mPiece;
  std::vector<Styled> mLine;
  uint16_t mLineWidth { 0 };
  Hasher mLineHasher;
};

/// Draws frames on a terminal, rewriting only the rows that changed since the
/// previous frame. The terminal cursor is tracked relative to the top left
/// corner of the frame.
class FrameRenderer
{
public:
  explicit FrameRenderer(Terminal& terminal) noexcept : mTerminal(terminal) { }
  /// Leaves the terminal cursor below the last frame
  ~FrameRenderer() noexcept;

  FrameRenderer(const FrameRenderer&) = delete;
  FrameRenderer& operator=(const FrameRenderer&) = delete;

  void startFrame();
  void finishFrame();

  /// Ignored outside of startFrame/finishFrame
  void write(std::string_view s);
  void writeStyled(const Styled& s);
  void markCursor(int offset = 0);

  [[nodiscard]] Terminal& terminal() noexcept { return mTerminal; }

private:
  enum class State : uint8_t { Initial, Active, Rendered };

  void moveCursorTo(Position pos);
  void moveCursorToEnd();
  TerminalSize refreshTerminalSize();
  void writeRow(const FrameState::Row& row);

  Terminal& mTerminal;
  State mState { State::Initial };
  Position mPosition;
  std::optional<FrameState> mLast;
  std::optional<FrameState> mCurrent;
};

/// Splits a string into pieces that are either a single UTF-8 code point or a
/// whole CSI escape sequence.
class AnsiPieces
{
public:
  struct Piece
  {
    std::string_view mBytes;
    char32_t mChar { 0 };
    bool mEscape { false };
  };

  explicit AnsiPieces(std::string_view s) noexcept : mStr(s) { }

  /// No value at the end of the string
  std::optional<Piece> next() noexcept;

private:
  std::string_view mStr;
  size_t mPos { 0 };
};

} // namespace ask
