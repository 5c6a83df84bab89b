// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/ui/frame_renderer.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <utility>

#include "ask/config.hpp"
#include "ask/strings.hpp"
#include "ask/unicode.hpp"

using namespace std::string_view_literals;

namespace ask {

std::optional<AnsiPieces::Piece> AnsiPieces::next() noexcept
{
  if (mPos >= mStr.size())
    return std::nullopt;

  const size_t start = mPos;

  // ESC [ params* intermediates* final
  if (mStr[mPos] == '\x1B' && mPos + 1 < mStr.size() && mStr[mPos + 1] == '[') {
    size_t i = mPos + 2;
    while (i < mStr.size() && mStr[i] >= '0' && mStr[i] <= '?')
      ++i;
    while (i < mStr.size() && mStr[i] >= ' ' && mStr[i] <= '/')
      ++i;
    if (i < mStr.size() && mStr[i] >= '@' && mStr[i] <= '~') {
      mPos = i + 1;
      return Piece { mStr.substr(start, mPos - start), 0, true };
    }
  }

  const char32_t ch = decodeUtf8(mStr, mPos);
  return Piece { mStr.substr(start, mPos - start), ch, false };
}

void FrameState::write(const Styled& value)
{
  mPiece.mStyle = value.mStyle;

  AnsiPieces pieces { value.mContent };
  while (auto piece = pieces.next()) {
    if (!piece->mEscape && piece->mChar == '\n') {
      finishLine();
      continue;
    }

    // Escape sequences only count towards the hash, they are not printed
    if (!piece->mEscape) {
      const auto charWidth = static_cast<uint16_t>(unicode::width(piece->mChar));
      const uint16_t remaining = mTerminalSize.mWidth > mLineWidth ? mTerminalSize.mWidth - mLineWidth : 0;
      if (charWidth > remaining)
        finishLine();
      mLineWidth = static_cast<uint16_t>(std::min<int>(mLineWidth + charWidth, UINT16_MAX));
      mPiece.mContent.append(piece->mBytes);
    }

    mLineHasher.feed(piece->mBytes);
    value.mStyle.hash(mLineHasher);
  }

  if (!mPiece.mContent.empty())
    mLine.push_back(std::exchange(mPiece, Styled { std::string {}, value.mStyle }));
}

void FrameState::markCursor(int offset) noexcept
{
  auto row = static_cast<uint16_t>(mRows.size());
  int col = std::max(0, mLineWidth + offset);

  if (mTerminalSize.mWidth > 0 && col >= mTerminalSize.mWidth) {
    col -= mTerminalSize.mWidth;
    ++row;
  }

  mCursor = Position { row, static_cast<uint16_t>(col) };
}

void FrameState::finish()
{
  finishLine();
}

void FrameState::finishLine()
{
  const StyleSheet style = mPiece.mStyle;
  if (!mPiece.mContent.empty())
    mLine.push_back(std::exchange(mPiece, Styled { std::string {}, style }));

  if (mLine.empty()) {
    mLineHasher.reset();
    mLineWidth = 0;
    return;
  }

  mRows.push_back(Row { std::move(mLine), mLineHasher.finish(), mLineWidth });
  mLine.clear();
  mWidth = std::max(mWidth, mLineWidth);

  mLineHasher.reset();
  mLineWidth = 0;
}

void FrameState::resize(TerminalSize size)
{
  if (size == mTerminalSize)
    return;

  FrameState state { size };
  for (const auto& row : mRows) {
    for (const auto& styled : row.mContent)
      state.write(styled);
    state.finishLine();
  }
  for (const auto& styled : mLine)
    state.write(styled);
  state.finishLine();

  *this = std::move(state);
}

Position FrameState::translate(Position pos, TerminalSize size) const noexcept
{
  if (size.mWidth == 0 || size.mWidth == mTerminalSize.mWidth)
    return pos;

  const uint32_t width = size.mWidth;
  uint32_t row = 0;
  for (size_t i = 0; i < mRows.size(); ++i) {
    if (i == pos.mRow)
      return Position { static_cast<uint16_t>(row + pos.mCol / width), static_cast<uint16_t>(pos.mCol % width) };
    row += std::max<uint32_t>(1, (mRows[i].mWidth + width - 1) / width);
  }

  // Below the frame
  return Position {
    static_cast<uint16_t>(row + pos.mRow - mRows.size()),
    static_cast<uint16_t>(std::min<uint32_t>(pos.mCol, width - 1)),
  };
}

FrameRenderer::~FrameRenderer() noexcept
{
  try {
    moveCursorToEnd();
    mTerminal.cursorShow();
    mTerminal.flush();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "ask: %s\n", e.what());
  }
}

void FrameRenderer::startFrame()
{
  const TerminalSize size = refreshTerminalSize();

  switch (mState) {
  case State::Initial:
    mLast.emplace(size);
    mCurrent.emplace(size);
    break;
  case State::Rendered:
    mCurrent.emplace(size);
    break;
  case State::Active:
    break;
  }
  mState = State::Active;
}

void FrameRenderer::write(std::string_view s)
{
  writeStyled(Styled { s });
}

void FrameRenderer::writeStyled(const Styled& s)
{
  if (mState == State::Active)
    mCurrent->write(s);
}

void FrameRenderer::markCursor(int offset)
{
  if (mState == State::Active)
    mCurrent->markCursor(offset);
}

void FrameRenderer::writeRow(const FrameState::Row& row)
{
  for (const auto& styled : row.mContent)
    mTerminal.writeStyled(styled);
}

void FrameRenderer::finishFrame()
{
  if (mState != State::Active)
    return;

  FrameState& last = *mLast;
  FrameState& current = *mCurrent;
  current.finish();

  const uint16_t rows = std::max(last.height(), current.height());

  mTerminal.cursorHide();
  moveCursorTo({ 0, 0 });

  for (uint16_t i = 0; i < rows; ++i) {
    const bool hasLast = i < last.height();
    const bool hasCurrent = i < current.height();

    if (hasLast && hasCurrent) {
      if (last.rows()[i].mHash != current.rows()[i].mHash) {
        writeRow(current.rows()[i]);
        mTerminal.clearUntilNewLine();
      }
    } else if (hasLast) {
      mTerminal.clearLine();
    } else {
      writeRow(current.rows()[i]);
    }

    mTerminal.write("\r"sv);
    mPosition.mCol = 0;
    if (i + 1 < rows) {
      mTerminal.write("\n"sv);
      ++mPosition.mRow;
    }
  }

  if (current.cursor())
    moveCursorTo(*current.cursor());

  mTerminal.cursorShow();
  mTerminal.flush();

  mLast = std::move(mCurrent);
  mCurrent.reset();
  mState = State::Rendered;
}

void FrameRenderer::moveCursorToEnd()
{
  if (mState == State::Initial)
    return;
  refreshTerminalSize();

  const uint16_t height = mLast->height();
  if (height == 0)
    return;

  // Cursor motion doesn't scroll, a new line does when the frame ends at the
  // bottom of the screen
  moveCursorTo({ static_cast<uint16_t>(height - 1), 0 });
  mTerminal.write("\n"sv);
  mPosition = { height, 0 };
}

void FrameRenderer::moveCursorTo(Position pos)
{
  if (mPosition.mRow > pos.mRow)
    mTerminal.cursorUp(mPosition.mRow - pos.mRow);
  else if (mPosition.mRow < pos.mRow)
    mTerminal.cursorDown(pos.mRow - mPosition.mRow);

  if (mPosition.mCol > pos.mCol)
    mTerminal.cursorLeft(mPosition.mCol - pos.mCol);
  else if (mPosition.mCol < pos.mCol)
    mTerminal.cursorRight(pos.mCol - mPosition.mCol);

  mPosition = pos;
}

TerminalSize FrameRenderer::refreshTerminalSize()
{
  // When the size is unknown assume nothing ever wraps
  TerminalSize size = mTerminal.size().value_or(
    TerminalSize { kFallbackTerminalWidth, kFallbackTerminalHeight });
  if (size.mWidth == 0)
    size.mWidth = kFallbackTerminalWidth;

  if (mLast) {
    mPosition = mLast->translate(mPosition, size);
    mLast->resize(size);
  }
  if (mCurrent)
    mCurrent->resize(size);

  return size;
}

} // namespace ask
