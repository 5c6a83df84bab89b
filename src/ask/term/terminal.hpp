// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "ask/key.hpp"
#include "ask/style.hpp"

namespace ask {

struct TerminalSize
{
  uint16_t mWidth { 0 };
  uint16_t mHeight { 0 };

  constexpr bool operator==(const TerminalSize& b) const noexcept
  {
    return mWidth == b.mWidth && mHeight == b.mHeight;
  }
  constexpr bool operator!=(const TerminalSize& b) const noexcept { return !(*this == b); }
};

/// Everything prompts need from a terminal. Raw mode is entered and left by
/// the implementation's constructor/open and destructor/close.
/// Failures are thrown as ask::IOError.
class Terminal
{
public:
  virtual ~Terminal() = default;

  /// Blocks until a key is pressed
  virtual Key readKey() = 0;

  /// No value if the size can't be queried
  [[nodiscard]] virtual std::optional<TerminalSize> size() const = 0;

  virtual void cursorUp(uint16_t n) = 0;
  virtual void cursorDown(uint16_t n) = 0;
  virtual void cursorLeft(uint16_t n) = 0;
  virtual void cursorRight(uint16_t n) = 0;
  virtual void cursorMoveToColumn(uint16_t col) = 0;
  virtual void cursorHide() = 0;
  virtual void cursorShow() = 0;

  virtual void write(std::string_view s) = 0;
  virtual void writeStyled(const Styled& s) = 0;

  /// Erase the whole line the cursor is on
  virtual void clearLine() = 0;
  /// Erase from the cursor to the end of the line
  virtual void clearUntilNewLine() = 0;

  virtual void flush() = 0;
};

} // namespace ask
