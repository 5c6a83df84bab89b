// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "ask/term/key_decoder.hpp"
#include "ask/term/terminal.hpp"

namespace ask {

/// Controlling terminal in raw mode.
///
/// Output is buffered until flush(). Input is read byte by byte and decoded
/// into keys. The terminal attributes saved by open() are restored by close()
/// and by the destructor.
class TTY final : public Terminal
{
public:
  static constexpr int kInvalidFd = -1;
  /// How long to wait for the rest of an escape sequence
  static constexpr int kEscapeTimeoutMs = 30;

  TTY() = default;
  ~TTY() noexcept override;
  TTY(TTY&& b) noexcept;
  TTY& operator=(TTY&& b) noexcept;
  TTY(const TTY&) = delete;
  TTY& operator=(const TTY&) = delete;

  /// Throws NotTTYError when there is no controlling terminal, IOError otherwise
  void open();
  void close() noexcept;
  [[nodiscard]] int fd() const noexcept { return mFd; }
  [[nodiscard]] bool isOpen() const noexcept { return mFd != kInvalidFd; }

  Key readKey() override;
  [[nodiscard]] std::optional<TerminalSize> size() const override;

  void cursorUp(uint16_t n) override;
  void cursorDown(uint16_t n) override;
  void cursorLeft(uint16_t n) override;
  void cursorRight(uint16_t n) override;
  void cursorMoveToColumn(uint16_t col) override;
  void cursorHide() override;
  void cursorShow() override;

  void write(std::string_view s) override;
  void writeStyled(const Styled& s) override;
  void clearLine() override;
  void clearUntilNewLine() override;
  void flush() override;

  void put(char c);
  void put(std::string_view s);

  template <typename... Ts>
  void put(fmt::format_string<Ts...> fmt, Ts&&... ts)
  {
    fmt::format_to(std::back_inserter(mBuffer), fmt, std::forward<Ts>(ts)...);
  }

private:
  /// Blocking read of one byte. No value if nothing arrived within timeoutMs (-1 waits forever).
  std::optional<uint8_t> readByte(int timeoutMs);

  int mFd { kInvalidFd };
  std::vector<char> mBuffer;
  KeyDecoder mDecoder;
};

} // namespace ask
