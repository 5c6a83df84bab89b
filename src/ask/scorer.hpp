// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ask/match.hpp"

namespace ask {

/// Ranks one option against the filter text. No score hides the option,
/// otherwise higher scores are listed first.
template <typename T>
using Scorer = std::function<std::optional<int64_t>(
  std::string_view filter, const T& value, std::string_view stringValue, size_t index)>;

template <typename T>
Scorer<T> fuzzyScorer()
{
  return [](std::string_view filter, const T&, std::string_view str, size_t) {
    return scoreFuzzy(filter, str);
  };
}

template <typename T>
Scorer<T> substringScorer()
{
  return [](std::string_view filter, const T&, std::string_view str, size_t) {
    return scoreSubstr(filter, str);
  };
}

/// Original indices of the options that got a score, best first.
/// Options with equal scores keep their original order.
template <typename T>
std::vector<size_t> scoreOptions(
  std::string_view filter,
  const std::vector<T>& values,
  const std::vector<std::string>& strings,
  const Scorer<T>& scorer)
{
  std::vector<std::pair<int64_t, size_t>> scored;
  scored.reserve(values.size());
  for (size_t i = 0; i < values.size(); ++i)
    if (auto score = scorer(filter, values[i], strings[i], i))
      scored.emplace_back(*score, i);

  std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
    return a.first > b.first;
  });

  std::vector<size_t> view;
  view.reserve(scored.size());
  for (const auto& [score, index] : scored)
    view.push_back(index);
  return view;
}

/// Where the cursor goes when the list under it changed
[[nodiscard]] constexpr size_t cursorAfterFilter(size_t cursor, size_t viewSize, bool reset) noexcept
{
  if (reset || viewSize == 0)
    return 0;
  return std::min(cursor, viewSize - 1);
}

} // namespace ask
