// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

#include "ask/key.hpp"

namespace ask {

/// Raw control bytes
enum Ascii : uint8_t {
  kAsciiCtrlSpace = 0x00,
  kAsciiCtrlC = 0x03,
  kAsciiCtrlH = 0x08,
  kAsciiTab = 0x09,
  kAsciiNewLine = 0x0A,
  kAsciiEnter = 0x0D,
  kAsciiCtrlZ = 0x1A,
  kAsciiEscape = 0x1B,
  kAsciiCtrlBackslash = 0x1C,
  kAsciiCtrlUnderscore = 0x1F,
  kAsciiBackspace = 0x7F,
};

/// Turns the byte stream of a terminal in raw mode into keys.
///
/// Understands UTF-8, control bytes, CSI and SS3 sequences with xterm style
/// modifier parameters, and Esc followed by a character as Alt+character.
/// A lone Esc can't be told apart from the start of a sequence, so the
/// reader calls timeout() when no more bytes arrive shortly after one.
class KeyDecoder
{
public:
  void feed(uint8_t byte);
  /// Input went quiet, finish whatever is pending
  void timeout();

  [[nodiscard]] bool hasKey() const noexcept { return !mKeys.empty(); }
  /// Partially decoded sequence waiting for more bytes
  [[nodiscard]] bool pending() const noexcept { return mState != State::Ground; }
  Key pop();

private:
  enum class State : uint8_t { Ground, Utf8, Escape, Csi, Ss3 };

  void ground(uint8_t byte, KeyModifiers mods);
  void csi(uint8_t final);
  void ss3(uint8_t final);
  void emit(Key key) { mKeys.push_back(key); }

  State mState { State::Ground };
  std::string mSequence;
  size_t mUtf8Needed { 0 };
  KeyModifiers mUtf8Mods { kNone };
  std::deque<Key> mKeys;
};

} // namespace ask
