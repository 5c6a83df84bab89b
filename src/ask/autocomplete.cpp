// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/autocomplete.hpp"

#include <algorithm>

#include "ask/match.hpp"

namespace ask {

std::vector<std::string> WordListAutocomplete::suggestions(const std::string& input)
{
  mLast.clear();
  for (const auto& word : mWords)
    if (matchSubstr(input, word))
      mLast.push_back(word);
  return mLast;
}

std::optional<std::string> WordListAutocomplete::completion(
  const std::string& input, const std::optional<std::string>& highlighted)
{
  if (highlighted)
    return *highlighted;
  if (mLast.empty())
    return std::nullopt;

  std::string prefix = mLast.front();
  for (const auto& word : mLast) {
    const auto [a, b] = std::mismatch(prefix.begin(), prefix.end(), word.begin(), word.end());
    prefix.erase(a, prefix.end());
  }

  if (prefix.size() <= input.size())
    return std::nullopt;
  return prefix;
}

} // namespace ask
