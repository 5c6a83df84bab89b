// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace ask::unicode {

/// Byte offsets of the extended grapheme cluster boundaries in a UTF-8 string.
/// The result always starts with 0 and ends with s.size().
[[nodiscard]] std::vector<size_t> graphemeBreaks(std::string_view s);

/// Whether a grapheme belongs to a word, i.e. contains an alphabetic or numeric code point.
[[nodiscard]] bool isWord(std::string_view grapheme) noexcept;

/// Number of terminal columns a code point occupies: 0, 1 or 2.
[[nodiscard]] int width(char32_t cp) noexcept;

/// Number of terminal columns a UTF-8 string occupies.
[[nodiscard]] int width(std::string_view s) noexcept;

} // namespace ask::unicode
