#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "ask/error.hpp"
#include "ask/key.hpp"
#include "ask/strings.hpp"
#include "ask/term/terminal.hpp"
#include "ask/unicode.hpp"

/// Terminal replaying a list of keys and drawing into a grid of cells.
/// New lines behave like a tty with output processing: "\n" also returns
/// the cursor to the first column.
class ScriptedTerminal final : public ask::Terminal
{
public:
  explicit ScriptedTerminal(uint16_t width = 80) : mWidth(width) { }

  ScriptedTerminal& press(ask::Key key)
  {
    mKeys.push_back(key);
    return *this;
  }

  ScriptedTerminal& press(ask::KeyCode code, ask::KeyModifiers mods = ask::kNone)
  {
    return press(ask::Key { code, mods });
  }

  /// One key per code point
  ScriptedTerminal& type(std::string_view s)
  {
    size_t pos = 0;
    while (pos < s.size())
      mKeys.push_back(ask::Key::character(ask::decodeUtf8(s, pos)));
    return *this;
  }

  ScriptedTerminal& submit() { return press(ask::kSubmit); }
  ScriptedTerminal& cancel() { return press(ask::kCancel); }

  ask::Key readKey() override
  {
    if (mKeys.empty())
      throw ask::IOError { "no more scripted keys" };
    ask::Key key = mKeys.front();
    mKeys.pop_front();
    return key;
  }

  [[nodiscard]] std::optional<ask::TerminalSize> size() const override
  {
    return ask::TerminalSize { mWidth, 1000 };
  }

  void cursorUp(uint16_t n) override
  {
    mRowsUp += n;
    mRow = mRow > n ? mRow - n : 0;
    mCol = std::min<size_t>(mCol, mWidth - 1);
  }

  void cursorDown(uint16_t n) override
  {
    mRow += n;
    mCol = std::min<size_t>(mCol, mWidth - 1);
  }

  void cursorLeft(uint16_t n) override
  {
    mCol = std::min<size_t>(mCol, mWidth - 1);
    mCol = mCol > n ? mCol - n : 0;
  }

  void cursorRight(uint16_t n) override
  {
    mCol = std::min<size_t>(mCol + n, mWidth - 1);
  }

  void cursorMoveToColumn(uint16_t col) override
  {
    mCol = std::min<size_t>(col, mWidth - 1);
  }

  void cursorHide() override { mCursorVisible = false; }
  void cursorShow() override { mCursorVisible = true; }

  void write(std::string_view s) override
  {
    size_t pos = 0;
    while (pos < s.size()) {
      const size_t start = pos;
      const char32_t ch = ask::decodeUtf8(s, pos);
      put(ch, s.substr(start, pos - start));
    }
  }

  void writeStyled(const ask::Styled& s) override
  {
    mStyled.push_back(s);
    write(s.mContent);
  }

  void clearLine() override
  {
    ++mClearedLines;
    row(mRow).clear();
    mWrapped[mRow] = false;
  }

  void clearUntilNewLine() override
  {
    ++mRewrittenLines;
    auto& r = row(mRow);
    if (mCol < r.size()) {
      r.resize(mCol);
      mWrapped[mRow] = false;
    }
  }

  /// Changes the width and rewraps the screen the way terminals with reflow
  /// do: soft-wrapped rows are joined and split again, the cursor moves along
  /// with the cell it was on.
  void setWidth(uint16_t width)
  {
    std::vector<std::vector<std::string>> grid;
    std::vector<bool> wrapped;
    std::optional<std::pair<size_t, size_t>> cursor;

    size_t i = 0;
    while (i < mGrid.size()) {
      std::vector<std::string> line;
      std::optional<size_t> offset;
      for (;;) {
        if (i == mRow)
          offset = line.size() + mCol;
        line.insert(line.end(), mGrid[i].begin(), mGrid[i].end());
        const bool more = mWrapped[i] && i + 1 < mGrid.size();
        ++i;
        if (!more)
          break;
      }

      const size_t start = grid.size();
      if (offset)
        cursor = std::make_pair(start + *offset / width, *offset % width);
      for (size_t pos = 0; pos == 0 || pos < line.size(); pos += width) {
        const size_t end = std::min(line.size(), pos + width);
        grid.emplace_back(line.begin() + static_cast<ptrdiff_t>(pos), line.begin() + static_cast<ptrdiff_t>(end));
        wrapped.push_back(end < line.size());
      }
    }

    if (!cursor)
      cursor = std::make_pair(grid.size() + (mRow - mGrid.size()), std::min<size_t>(mCol, width - 1));

    mGrid = std::move(grid);
    mWrapped = std::move(wrapped);
    std::tie(mRow, mCol) = *cursor;
    mWidth = width;
  }

  void flush() override
  {
    ++mFlushes;
    mSnapshots.push_back(lines());
  }

  /// Screen contents, one string per row, trailing blanks removed
  [[nodiscard]] std::vector<std::string> lines() const
  {
    std::vector<std::string> out;
    for (const auto& r : mGrid) {
      std::string line;
      for (const auto& cell : r) {
        if (cell != kContinuation)
          line.append(cell.empty() ? " " : cell);
      }
      while (!line.empty() && line.back() == ' ')
        line.pop_back();
      out.push_back(std::move(line));
    }
    while (!out.empty() && out.back().empty())
      out.pop_back();
    return out;
  }

  [[nodiscard]] std::string line(size_t i) const
  {
    auto l = lines();
    return i < l.size() ? l[i] : std::string {};
  }

  [[nodiscard]] bool contains(std::string_view s) const
  {
    for (const auto& l : lines())
      if (l.find(s) != std::string::npos)
        return true;
    return false;
  }

  /// Whether any flushed frame had a row containing s
  [[nodiscard]] bool shown(std::string_view s) const
  {
    for (const auto& snapshot : mSnapshots)
      for (const auto& l : snapshot)
        if (l.find(s) != std::string::npos)
          return true;
    return false;
  }

  [[nodiscard]] size_t row() const noexcept { return mRow; }
  [[nodiscard]] size_t col() const noexcept { return mCol; }
  [[nodiscard]] bool cursorVisible() const noexcept { return mCursorVisible; }
  [[nodiscard]] size_t pendingKeys() const noexcept { return mKeys.size(); }
  [[nodiscard]] const std::vector<std::vector<std::string>>& snapshots() const noexcept { return mSnapshots; }
  [[nodiscard]] const std::vector<ask::Styled>& styled() const noexcept { return mStyled; }

  size_t mRewrittenLines { 0 };
  size_t mClearedLines { 0 };
  size_t mFlushes { 0 };
  size_t mRowsUp { 0 };

private:
  /// Second cell of a wide character
  static constexpr std::string_view kContinuation = "\x01";

  std::vector<std::string>& row(size_t i)
  {
    if (mGrid.size() <= i) {
      mGrid.resize(i + 1);
      mWrapped.resize(i + 1, false);
    }
    return mGrid[i];
  }

  void put(char32_t ch, std::string_view bytes)
  {
    if (ch == '\r') {
      mCol = 0;
      return;
    }
    if (ch == '\n') {
      ++mRow;
      mCol = 0;
      return;
    }

    const int w = ask::unicode::width(ch);
    if (w == 0) {
      // Combining marks join the previous cell
      auto& r = row(mRow);
      if (mCol > 0 && mCol - 1 < r.size())
        r[mCol - 1].append(bytes);
      return;
    }

    // Deferred wrap, like a real terminal
    if (mCol + w > mWidth) {
      row(mRow);
      mWrapped[mRow] = true;
      ++mRow;
      mCol = 0;
    }

    auto& r = row(mRow);
    if (r.size() < mCol + w)
      r.resize(mCol + w);
    r[mCol] = std::string { bytes };
    if (w == 2)
      r[mCol + 1] = kContinuation;
    mCol += w;
  }

  uint16_t mWidth;
  std::deque<ask::Key> mKeys;
  std::vector<std::vector<std::string>> mGrid;
  /// Row continues on the next one
  std::vector<bool> mWrapped;
  std::vector<std::vector<std::string>> mSnapshots;
  std::vector<ask::Styled> mStyled;
  size_t mRow { 0 };
  size_t mCol { 0 };
  bool mCursorVisible { true };
};
