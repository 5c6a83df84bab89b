// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/match.hpp"

#include <algorithm>
#include <limits>

#include "ask/match/fzy.hpp"
#include "ask/strings.hpp"

namespace ask {

bool matchSubstr(std::string_view needle, std::string_view haystack) noexcept
{
  if (needle.empty())
    return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                        [](char a, char b) { return toLower(a) == toLower(b); });
  return it != haystack.end();
}

std::optional<int64_t> scoreFuzzy(std::string_view filter, std::string_view value) noexcept
{
  if (filter.empty())
    return 0;
  if (!fzy::hasMatch(filter, value))
    return std::nullopt;

  const fzy::Score score = fzy::score(filter, value);
  if (score == fzy::kScoreMax)
    return std::numeric_limits<int64_t>::max();
  if (score == fzy::kScoreMin)
    return std::numeric_limits<int64_t>::min();
  return static_cast<int64_t>(score);
}

std::optional<int64_t> scoreSubstr(std::string_view filter, std::string_view value) noexcept
{
  if (matchSubstr(filter, value))
    return 0;
  return std::nullopt;
}

} // namespace ask
