// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ask {

/// Case-insensitive (ASCII) substring search
[[nodiscard]] bool matchSubstr(std::string_view needle, std::string_view haystack) noexcept;

/// Ranks a value against a filter with the fzy algorithm.
/// Empty filter matches everything with score 0, non-matching values get no score.
[[nodiscard]] std::optional<int64_t> scoreFuzzy(std::string_view filter, std::string_view value) noexcept;

/// Every value containing the filter gets the same score
[[nodiscard]] std::optional<int64_t> scoreSubstr(std::string_view filter, std::string_view value) noexcept;

} // namespace ask
