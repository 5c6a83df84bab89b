// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/input.hpp"

#include <algorithm>
#include <utility>

#include "ask/macros.hpp"
#include "ask/strings.hpp"
#include "ask/unicode.hpp"

namespace ask {

std::optional<InputAction> InputAction::fromKey(const Key& key) noexcept
{
  switch (key.mCode) {
  case kBackspace:
    return remove(Magnitude::Char, LineDirection::Left);
  case kDelete:
    if (key.has(kControl))
      return remove(Magnitude::Word, LineDirection::Right);
    return remove(Magnitude::Char, LineDirection::Right);
  case kHome:
    return move(Magnitude::Line, LineDirection::Left);
  case kEnd:
    return move(Magnitude::Line, LineDirection::Right);
  case kLeft:
    if (key.has(kControl))
      return move(Magnitude::Word, LineDirection::Left);
    return move(Magnitude::Char, LineDirection::Left);
  case kRight:
    if (key.has(kControl))
      return move(Magnitude::Word, LineDirection::Right);
    return move(Magnitude::Char, LineDirection::Right);
  case kChar:
    // Ctrl-H is what some terminals send for Ctrl-Backspace, don't type an 'h'
    if (key.has(kControl) && (key.mChar == 'h' || key.mChar == 'H'))
      return std::nullopt;
    return write(key.mChar);
  default:
    return std::nullopt;
  }
}

Input::Input()
  : mBreaks { 0 }
{
}

Input::Input(std::string content)
  : mContent(std::move(content))
{
  updateBreaks();
  mCursor = length();
}

Input& Input::withPlaceholder(std::string placeholder)
{
  mPlaceholder = std::move(placeholder);
  return *this;
}

Input& Input::withCursor(size_t cursor)
{
  ASSERT(cursor <= length());
  mCursor = cursor;
  return *this;
}

void Input::clear() noexcept
{
  mContent.clear();
  mBreaks.assign(1, 0);
  mCursor = 0;
}

std::string_view Input::preCursor() const noexcept
{
  return std::string_view { mContent }.substr(0, mBreaks[mCursor]);
}

std::string_view Input::grapheme(size_t i) const noexcept
{
  DEBUG_ASSERT(i < length());
  return std::string_view { mContent }.substr(mBreaks[i], mBreaks[i + 1] - mBreaks[i]);
}

InputActionResult Input::handle(const InputAction& action)
{
  switch (action.mKind) {
  case InputAction::kMoveCursor:
    return action.mDirection == LineDirection::Left
      ? moveLeft(action.mMagnitude)
      : moveRight(action.mMagnitude);
  case InputAction::kDelete:
    return action.mDirection == LineDirection::Left
      ? backwardsDelete(action.mMagnitude)
      : forwardsDelete(action.mMagnitude);
  case InputAction::kWrite:
    return insert(action.mChar);
  }
  UNREACHABLE();
}

InputActionResult Input::moveLeft(Magnitude mag) noexcept
{
  if (mCursor == 0)
    return InputActionResult::Clean;
  switch (mag) {
  case Magnitude::Char: mCursor -= 1; break;
  case Magnitude::Word: mCursor = prevWordIndex(); break;
  case Magnitude::Line: mCursor = 0; break;
  }
  return InputActionResult::PositionChanged;
}

InputActionResult Input::moveRight(Magnitude mag) noexcept
{
  if (mCursor >= length())
    return InputActionResult::Clean;
  switch (mag) {
  case Magnitude::Char: mCursor += 1; break;
  case Magnitude::Word: mCursor = nextWordIndex(); break;
  case Magnitude::Line: mCursor = length(); break;
  }
  return InputActionResult::PositionChanged;
}

size_t Input::nextWordIndex() const noexcept
{
  bool seenWord = false;
  for (size_t i = mCursor; i < length(); ++i) {
    if (unicode::isWord(grapheme(i)))
      seenWord = true;
    else if (seenWord)
      return i;
  }
  return length();
}

size_t Input::prevWordIndex() const noexcept
{
  bool seenWord = false;
  for (size_t i = mCursor; i > 0; --i) {
    if (unicode::isWord(grapheme(i - 1)))
      seenWord = true;
    else if (seenWord)
      return i;
  }
  return 0;
}

InputActionResult Input::insert(char32_t ch)
{
  std::string encoded = encodeUtf8(ch);
  mContent.insert(mBreaks[mCursor], encoded);
  // A combining mark or variation selector may merge with the previous grapheme
  if (updateBreaks())
    mCursor += 1;
  if (mCursor > length())
    mCursor = length();
  return InputActionResult::ContentChanged;
}

InputActionResult Input::backwardsDelete(Magnitude mag)
{
  if (mCursor == 0)
    return InputActionResult::Clean;

  const size_t current = mCursor;
  size_t target = 0;
  switch (mag) {
  case Magnitude::Char: target = current - 1; break;
  case Magnitude::Word: target = prevWordIndex(); break;
  case Magnitude::Line: target = 0; break;
  }
  if (target == current)
    return InputActionResult::Clean;

  mCursor = target;
  return deleteRight(current - target);
}

InputActionResult Input::forwardsDelete(Magnitude mag)
{
  size_t end = mCursor;
  switch (mag) {
  case Magnitude::Char: end = mCursor + 1; break;
  case Magnitude::Word: end = nextWordIndex(); break;
  case Magnitude::Line: end = length(); break;
  }
  return deleteRight(end - mCursor);
}

InputActionResult Input::deleteRight(size_t count)
{
  const size_t start = mCursor;
  const size_t end = std::min(start + count, length());
  if (start >= end)
    return InputActionResult::Clean;
  mContent.erase(mBreaks[start], mBreaks[end] - mBreaks[start]);
  updateBreaks();
  if (mCursor > length())
    mCursor = length();
  return InputActionResult::ContentChanged;
}

bool Input::updateBreaks()
{
  const size_t oldLength = mBreaks.empty() ? 0 : length();
  mBreaks = unicode::graphemeBreaks(mContent);
  return length() != oldLength;
}

} // namespace ask
