// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ask {

/// Suggestions for the text prompt
class Autocomplete
{
public:
  virtual ~Autocomplete() = default;

  /// Called every time the input changes
  virtual std::vector<std::string> suggestions(const std::string& input) = 0;

  /// Called on Tab with the highlighted suggestion, if any.
  /// The returned text replaces the input, no value leaves it as it is.
  virtual std::optional<std::string> completion(
    const std::string& input, const std::optional<std::string>& highlighted) = 0;
};

/// Suggests the given words that contain the input, ignoring case.
/// Tab completes to the highlighted word, or to the longest prefix the
/// suggestions share.
class WordListAutocomplete final : public Autocomplete
{
public:
  explicit WordListAutocomplete(std::vector<std::string> words) : mWords(std::move(words)) { }

  std::vector<std::string> suggestions(const std::string& input) override;
  std::optional<std::string> completion(
    const std::string& input, const std::optional<std::string>& highlighted) override;

private:
  std::vector<std::string> mWords;
  std::vector<std::string> mLast;
};

} // namespace ask
