// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ask/key.hpp"

namespace ask {

enum class Magnitude : uint8_t { Char, Word, Line };
enum class LineDirection : uint8_t { Left, Right };

struct InputAction
{
  enum Kind : uint8_t { kDelete, kMoveCursor, kWrite };

  Kind mKind { kWrite };
  Magnitude mMagnitude { Magnitude::Char };
  LineDirection mDirection { LineDirection::Left };
  char32_t mChar { 0 };

  static constexpr InputAction remove(Magnitude mag, LineDirection dir) noexcept
  {
    return { kDelete, mag, dir, 0 };
  }

  static constexpr InputAction move(Magnitude mag, LineDirection dir) noexcept
  {
    return { kMoveCursor, mag, dir, 0 };
  }

  static constexpr InputAction write(char32_t ch) noexcept
  {
    return { kWrite, Magnitude::Char, LineDirection::Left, ch };
  }

  /// Keys understood by every text input: editing, cursor motion and plain characters
  static std::optional<InputAction> fromKey(const Key& key) noexcept;

  constexpr bool operator==(const InputAction& b) const noexcept
  {
    return mKind == b.mKind && mMagnitude == b.mMagnitude
        && mDirection == b.mDirection && mChar == b.mChar;
  }
};

enum class InputActionResult : uint8_t {
  ContentChanged,
  PositionChanged,
  Clean,
};

[[nodiscard]] constexpr bool needsRedraw(InputActionResult r) noexcept
{
  return r != InputActionResult::Clean;
}

/// Single line of UTF-8 text with a cursor.
///
/// The cursor and the length are counted in extended grapheme clusters, so a
/// base character followed by combining marks or a variation selector is
/// edited and traversed as one unit. Byte offsets are derived from the cached
/// cluster boundaries, which are recomputed after every edit.
struct Input
{
  Input();
  explicit Input(std::string content);

  Input& withPlaceholder(std::string placeholder);
  /// Cursor past the end is a programming error
  Input& withCursor(size_t cursor);

  InputActionResult handle(const InputAction& action);

  void clear() noexcept;

  [[nodiscard]] const std::string& content() const noexcept { return mContent; }
  [[nodiscard]] std::string_view preCursor() const noexcept;
  [[nodiscard]] size_t length() const noexcept { return mBreaks.size() - 1; }
  [[nodiscard]] size_t cursor() const noexcept { return mCursor; }
  [[nodiscard]] bool isEmpty() const noexcept { return mContent.empty(); }
  [[nodiscard]] const std::optional<std::string>& placeholder() const noexcept { return mPlaceholder; }

  /// Grapheme at index i
  [[nodiscard]] std::string_view grapheme(size_t i) const noexcept;

private:
  InputActionResult moveLeft(Magnitude mag) noexcept;
  InputActionResult moveRight(Magnitude mag) noexcept;
  InputActionResult insert(char32_t ch);
  InputActionResult backwardsDelete(Magnitude mag);
  InputActionResult forwardsDelete(Magnitude mag);
  InputActionResult deleteRight(size_t count);

  [[nodiscard]] size_t nextWordIndex() const noexcept;
  [[nodiscard]] size_t prevWordIndex() const noexcept;
  /// Returns true if the grapheme count changed
  bool updateBreaks();

  std::string mContent;
  std::optional<std::string> mPlaceholder;
  std::vector<size_t> mBreaks;
  size_t mCursor { 0 };
};

} // namespace ask
