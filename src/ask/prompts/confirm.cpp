// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/prompts/confirm.hpp"

#include <utility>

#include "ask/strings.hpp"

namespace ask {

std::optional<bool> parseBool(std::string_view s)
{
  if (s.size() > 3)
    return std::nullopt;

  const auto lower = toLower(s);
  if (lower == "y" || lower == "yes")
    return true;
  if (lower == "n" || lower == "no")
    return false;
  return std::nullopt;
}

std::string formatBoolDefault(const bool& value)
{
  return value ? "Y/n" : "y/N";
}

Confirm::Confirm(std::string message)
  : mPrompt(std::move(message))
{
  mPrompt
    .withParser(parseBool)
    .withFormatter(formatBool)
    .withDefaultValueFormatter(formatBoolDefault)
    .withErrorMessage(kDefaultErrorMessage);
}

Confirm& Confirm::withDefault(bool value)
{
  mPrompt.withDefault(value);
  return *this;
}

Confirm& Confirm::withPlaceholder(std::string placeholder)
{
  mPrompt.withPlaceholder(std::move(placeholder));
  return *this;
}

Confirm& Confirm::withStartingInput(std::string input)
{
  mPrompt.withStartingInput(std::move(input));
  return *this;
}

Confirm& Confirm::withHelpMessage(std::string help)
{
  mPrompt.withHelpMessage(std::move(help));
  return *this;
}

Confirm& Confirm::withParser(Parser<bool> parser)
{
  mPrompt.withParser(std::move(parser));
  return *this;
}

Confirm& Confirm::withFormatter(Formatter<bool> formatter)
{
  mPrompt.withFormatter(std::move(formatter));
  return *this;
}

Confirm& Confirm::withDefaultValueFormatter(Formatter<bool> formatter)
{
  mPrompt.withDefaultValueFormatter(std::move(formatter));
  return *this;
}

Confirm& Confirm::withErrorMessage(std::string message)
{
  mPrompt.withErrorMessage(std::move(message));
  return *this;
}

Confirm& Confirm::withRenderConfig(RenderConfig config)
{
  mPrompt.withRenderConfig(std::move(config));
  return *this;
}

bool Confirm::prompt()
{
  return mPrompt.prompt();
}

std::optional<bool> Confirm::promptSkippable()
{
  return mPrompt.promptSkippable();
}

bool Confirm::promptWith(Terminal& terminal)
{
  return mPrompt.promptWith(terminal);
}

} // namespace ask
