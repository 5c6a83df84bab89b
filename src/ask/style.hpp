// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "ask/util.hpp"

namespace ask {

enum TermColorCode : uint8_t {
  Black = 0,
  Red = 1,
  Green = 2,
  Yellow = 3,
  Blue = 4,
  Purple = 5,
  Cyan = 6,
  White = 7,
  Default = 9,
};

/// One of the 16 standard terminal colors
struct TermColor
{
  TermColorCode mCode;
  bool mBright;
  constexpr TermColor(TermColorCode code, bool bright) : mCode(code), mBright(bright) { }
  constexpr TermColor(TermColorCode code) : mCode(code), mBright(false) { } // NOLINT
  constexpr bool operator==(const TermColor& b) const { return mCode == b.mCode && mBright == b.mBright; }
};

/// Index into the xterm 256 color palette
struct AnsiColor
{
  uint8_t mIndex;
  constexpr bool operator==(const AnsiColor& b) const { return mIndex == b.mIndex; }
};

struct TrueColor
{
  uint8_t mRed, mGreen, mBlue;
  constexpr TrueColor(uint8_t red, uint8_t green, uint8_t blue)
    : mRed(red), mGreen(green), mBlue(blue)
  {
  }
  constexpr bool operator==(const TrueColor& b) const
  {
    return mRed == b.mRed && mGreen == b.mGreen && mBlue == b.mBlue;
  }
};

class Color
{
public:
  std::variant<TrueColor, TermColor, AnsiColor> mInner;
  constexpr Color(TermColor color) : mInner(color) { } // NOLINT
  constexpr Color(TermColorCode color, bool bright) : mInner(TermColor(color, bright)) { }
  constexpr Color(TermColorCode color) : mInner(TermColor(color)) { } // NOLINT
  constexpr Color(AnsiColor color) : mInner(color) { } // NOLINT
  constexpr Color(TrueColor color) : mInner(color) { } // NOLINT
  constexpr Color(uint8_t red, uint8_t green, uint8_t blue)
    : mInner(TrueColor(red, green, blue)) { }

  bool operator==(const Color& b) const { return mInner == b.mInner; }
  bool operator!=(const Color& b) const { return !(*this == b); }

  void hash(Hasher& h) const noexcept;
};

// Named colors used by the default theme
namespace colors {
constexpr Color kBlack { Black };
constexpr Color kDarkRed { Red };
constexpr Color kLightRed { Red, true };
constexpr Color kDarkGreen { Green };
constexpr Color kLightGreen { Green, true };
constexpr Color kDarkYellow { Yellow };
constexpr Color kLightYellow { Yellow, true };
constexpr Color kDarkBlue { Blue };
constexpr Color kLightBlue { Blue, true };
constexpr Color kDarkMagenta { Purple };
constexpr Color kLightMagenta { Purple, true };
constexpr Color kDarkCyan { Cyan };
constexpr Color kLightCyan { Cyan, true };
constexpr Color kGrey { White };
constexpr Color kDarkGrey { Black, true };
constexpr Color kWhite { White, true };
} // namespace colors

enum Attributes : uint8_t {
  kAttrNone = 0,
  kAttrBold = 1 << 0,
  kAttrItalic = 1 << 1,
};

constexpr Attributes operator|(Attributes a, Attributes b) noexcept
{
  return static_cast<Attributes>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

struct StyleSheet
{
  std::optional<Color> mFg;
  std::optional<Color> mBg;
  Attributes mAttr { kAttrNone };

  [[nodiscard]] static StyleSheet empty() noexcept { return {}; }

  [[nodiscard]] StyleSheet withFg(Color fg) const noexcept
  {
    StyleSheet r = *this;
    r.mFg = fg;
    return r;
  }

  [[nodiscard]] StyleSheet withBg(Color bg) const noexcept
  {
    StyleSheet r = *this;
    r.mBg = bg;
    return r;
  }

  [[nodiscard]] StyleSheet withAttr(Attributes attr) const noexcept
  {
    StyleSheet r = *this;
    r.mAttr = r.mAttr | attr;
    return r;
  }

  [[nodiscard]] bool isEmpty() const noexcept { return !mFg && !mBg && mAttr == kAttrNone; }

  bool operator==(const StyleSheet& b) const { return mFg == b.mFg && mBg == b.mBg && mAttr == b.mAttr; }
  bool operator!=(const StyleSheet& b) const { return !(*this == b); }

  void hash(Hasher& h) const noexcept;
};

/// Text together with the style it should be printed in
struct Styled
{
  std::string mContent;
  StyleSheet mStyle;

  Styled() = default;
  Styled(std::string content, StyleSheet style = {}) // NOLINT(google-explicit-constructor)
    : mContent(std::move(content)), mStyle(style) { }
  Styled(std::string_view content, StyleSheet style = {}) // NOLINT(google-explicit-constructor)
    : mContent(content), mStyle(style) { }
  Styled(const char* content, StyleSheet style = {}) // NOLINT(google-explicit-constructor)
    : mContent(content), mStyle(style) { }
};

/// SGR sequence that switches the terminal to the given style.
/// Empty for an empty style sheet.
[[nodiscard]] std::string sgr(const StyleSheet& style);

/// SGR sequence that resets every attribute
static constexpr std::string_view kSgrReset = "\x1B[0m";

} // namespace ask
