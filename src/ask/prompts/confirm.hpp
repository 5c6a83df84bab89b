// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ask/prompts/custom_type.hpp"

namespace ask {

/// y, yes, n or no in any case
[[nodiscard]] std::optional<bool> parseBool(std::string_view s);
/// "Y/n" or "y/N", the capital letter being the default
[[nodiscard]] std::string formatBoolDefault(const bool& value);

/// Yes or no question
class Confirm
{
public:
  static constexpr const char* kDefaultErrorMessage = "Invalid answer, try typing 'y' for yes or 'n' for no";

  explicit Confirm(std::string message);

  Confirm& withDefault(bool value);
  Confirm& withPlaceholder(std::string placeholder);
  Confirm& withStartingInput(std::string input);
  Confirm& withHelpMessage(std::string help);
  Confirm& withParser(Parser<bool> parser);
  Confirm& withFormatter(Formatter<bool> formatter);
  Confirm& withDefaultValueFormatter(Formatter<bool> formatter);
  Confirm& withErrorMessage(std::string message);
  Confirm& withRenderConfig(RenderConfig config);

  bool prompt();
  std::optional<bool> promptSkippable();
  bool promptWith(Terminal& terminal);

private:
  CustomType<bool> mPrompt;
};

} // namespace ask
