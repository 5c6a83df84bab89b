// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ask {

[[nodiscard]] constexpr uint8_t toUpper(uint8_t ch) noexcept
{
  return ch >= 'a' && ch <= 'z' ? ch - 32 : ch;
}

[[nodiscard]] constexpr uint8_t toLower(uint8_t ch) noexcept
{
  return ch >= 'A' && ch <= 'Z' ? ch + 32 : ch;
}

[[nodiscard]] constexpr bool isDigit(char ch) noexcept
{
  return ch >= '0' && ch <= '9';
}

inline void toLower(char* out, const char* in, size_t len) noexcept
{
  for (size_t i = 0; i < len; ++i)
    out[i] = static_cast<char>(toLower(in[i]));
}

/// ASCII lowercase copy. Bytes outside of A-Z are left untouched.
[[nodiscard]] inline std::string toLower(std::string_view s)
{
  std::string r { s };
  toLower(r.data(), r.data(), r.size());
  return r;
}

static constexpr char32_t kReplacementChar = 0xFFFD;

/// Length of the UTF-8 sequence started by `lead`, 0 for a continuation or invalid byte.
[[nodiscard]] constexpr size_t utf8Length(uint8_t lead) noexcept
{
  if (lead < 0x80)
    return 1;
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 0;
}

/// Decode the code point at `pos` and advance `pos` past it.
/// Malformed input decodes to U+FFFD and advances by one byte.
[[nodiscard]] inline char32_t decodeUtf8(std::string_view s, size_t& pos) noexcept
{
  const auto lead = static_cast<uint8_t>(s[pos]);
  const size_t len = utf8Length(lead);
  if (len == 0 || pos + len > s.size()) {
    ++pos;
    return kReplacementChar;
  }
  if (len == 1) {
    ++pos;
    return lead;
  }
  char32_t cp = lead & (0x7F >> len);
  for (size_t i = 1; i < len; ++i) {
    const auto ch = static_cast<uint8_t>(s[pos + i]);
    if ((ch & 0xC0) != 0x80) {
      ++pos;
      return kReplacementChar;
    }
    cp = (cp << 6) | (ch & 0x3F);
  }
  pos += len;
  return cp;
}

inline void encodeUtf8(char32_t cp, std::string& out)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x110000) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    encodeUtf8(kReplacementChar, out);
  }
}

[[nodiscard]] inline std::string encodeUtf8(char32_t cp)
{
  std::string r;
  encodeUtf8(cp, r);
  return r;
}

/// Number of code points in a UTF-8 string.
[[nodiscard]] inline size_t countCodePoints(std::string_view s) noexcept
{
  size_t n = 0;
  for (char ch : s)
    if ((static_cast<uint8_t>(ch) & 0xC0) != 0x80)
      ++n;
  return n;
}

} // namespace ask
