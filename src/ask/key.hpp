// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>

namespace ask {

enum KeyCode : uint8_t {
  kEnter,
  kTab,
  kBackspace,
  kDelete,
  kHome,
  kEnd,
  kPageUp,
  kPageDown,
  kUp,
  kDown,
  kLeft,
  kRight,
  kChar,
  kEscape,
  kInterrupt,
  kSubmit,
  kCancel,
  kAny,
};

enum KeyModifiers : uint8_t {
  kNone = 0,
  kShift = 1 << 0,
  kControl = 1 << 1,
  kAlt = 1 << 2,
};

constexpr KeyModifiers operator|(KeyModifiers a, KeyModifiers b) noexcept
{
  return static_cast<KeyModifiers>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

/// One logical key event. Submit, Cancel and Interrupt are what the terminal
/// reports for Enter, Esc and Ctrl-C.
struct Key
{
  KeyCode mCode { kAny };
  KeyModifiers mMods { kNone };
  char32_t mChar { 0 };

  constexpr Key() = default;
  constexpr Key(KeyCode code, KeyModifiers mods = kNone) noexcept // NOLINT(google-explicit-constructor)
    : mCode(code), mMods(mods) { }

  static constexpr Key character(char32_t ch, KeyModifiers mods = kNone) noexcept
  {
    Key key { kChar, mods };
    key.mChar = ch;
    return key;
  }

  [[nodiscard]] constexpr bool has(KeyModifiers mods) const noexcept
  {
    return (mMods & mods) == mods;
  }

  [[nodiscard]] constexpr bool is(KeyCode code, KeyModifiers mods = kNone) const noexcept
  {
    return mCode == code && mMods == mods;
  }

  [[nodiscard]] constexpr bool isChar(char32_t ch, KeyModifiers mods = kNone) const noexcept
  {
    return mCode == kChar && mChar == ch && mMods == mods;
  }

  constexpr bool operator==(const Key& b) const noexcept
  {
    return mCode == b.mCode && mMods == b.mMods && mChar == b.mChar;
  }
  constexpr bool operator!=(const Key& b) const noexcept { return !(*this == b); }
};

} // namespace ask
