// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/unicode.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>

#include <fmt/core.h>

#include <unicode/ubrk.h>
#include <unicode/uchar.h>
#include <unicode/utext.h>

#include "ask/strings.hpp"

namespace ask::unicode {

namespace {

struct BreakIteratorCloser
{
  void operator()(UBreakIterator* it) const noexcept { ubrk_close(it); }
};

struct TextCloser
{
  void operator()(UText* text) const noexcept { utext_close(text); }
};

using BreakIteratorPtr = std::unique_ptr<UBreakIterator, BreakIteratorCloser>;
using TextPtr = std::unique_ptr<UText, TextCloser>;

[[noreturn]] void icuFail(const char* what, UErrorCode status)
{
  throw std::runtime_error(fmt::format("ask: {}: {}", what, u_errorName(status)));
}

/// Opening a break iterator loads the rule data, so keep one per thread.
UBreakIterator* characterIterator()
{
  thread_local BreakIteratorPtr gIterator;
  if (!gIterator) {
    UErrorCode status = U_ZERO_ERROR;
    gIterator.reset(ubrk_open(UBRK_CHARACTER, nullptr, nullptr, 0, &status));
    if (U_FAILURE(status))
      icuFail("ubrk_open", status);
  }
  return gIterator.get();
}

} // namespace

std::vector<size_t> graphemeBreaks(std::string_view s)
{
  std::vector<size_t> breaks;
  if (s.empty()) {
    breaks.push_back(0);
    return breaks;
  }

  UErrorCode status = U_ZERO_ERROR;
  TextPtr text { utext_openUTF8(nullptr, s.data(), static_cast<int64_t>(s.size()), &status) };
  if (U_FAILURE(status))
    icuFail("utext_openUTF8", status);

  UBreakIterator* it = characterIterator();
  ubrk_setUText(it, text.get(), &status);
  if (U_FAILURE(status))
    icuFail("ubrk_setUText", status);

  // With a UTF-8 UText the iterator reports native (byte) indexes
  for (int32_t pos = ubrk_first(it); pos != UBRK_DONE; pos = ubrk_next(it))
    breaks.push_back(static_cast<size_t>(pos));

  // Don't keep a dangling pointer to the text around
  ubrk_setText(it, nullptr, 0, &status);
  return breaks;
}

bool isWord(std::string_view grapheme) noexcept
{
  for (size_t pos = 0; pos < grapheme.size();) {
    const auto cp = static_cast<UChar32>(decodeUtf8(grapheme, pos));
    if (u_hasBinaryProperty(cp, UCHAR_ALPHABETIC))
      return true;
    switch (u_charType(cp)) {
    case U_DECIMAL_DIGIT_NUMBER:
    case U_LETTER_NUMBER:
    case U_OTHER_NUMBER:
      return true;
    default:
      break;
    }
  }
  return false;
}

int width(char32_t c) noexcept
{
  const auto cp = static_cast<UChar32>(c);
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0))
    return 0;
  if (cp == 0xAD) // soft hyphen
    return 1;

  switch (u_charType(cp)) {
  case U_NON_SPACING_MARK:
  case U_ENCLOSING_MARK:
  case U_FORMAT_CHAR:
    return 0;
  default:
    break;
  }

  // Medial vowels and final consonants attach to the preceding jamo
  switch (u_getIntPropertyValue(cp, UCHAR_HANGUL_SYLLABLE_TYPE)) {
  case U_HST_VOWEL_JAMO:
  case U_HST_TRAILING_JAMO:
    return 0;
  default:
    break;
  }

  switch (u_getIntPropertyValue(cp, UCHAR_EAST_ASIAN_WIDTH)) {
  case U_EA_WIDE:
  case U_EA_FULLWIDTH:
    return 2;
  default:
    break;
  }

  return u_hasBinaryProperty(cp, UCHAR_EMOJI_PRESENTATION) ? 2 : 1;
}

int width(std::string_view s) noexcept
{
  int w = 0;
  for (size_t pos = 0; pos < s.size();)
    w += width(decodeUtf8(s, pos));
  return w;
}

} // namespace ask::unicode
