// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <charconv>
#include <locale>
#include <sstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "ask/formatter.hpp"
#include "ask/input.hpp"
#include "ask/prompt.hpp"
#include "ask/render_config.hpp"
#include "ask/strings.hpp"
#include "ask/validator.hpp"

namespace ask {

/// Turns the typed text into a value, no value when the text is not understood
template <typename T>
using Parser = std::function<std::optional<T>(std::string_view)>;

/// Parser for strings, integers and floating point numbers
template <typename T>
std::optional<T> parseValue(std::string_view s)
{
  if constexpr (std::is_same_v<T, std::string>) {
    return std::string { s };
  } else if constexpr (std::is_integral_v<T>) {
    T value {};
    const auto* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc {} || ptr != end)
      return std::nullopt;
    return value;
  } else {
    static_assert(std::is_floating_point_v<T>, "no default parser for this type");
    // from_chars for floating point is missing from older standard libraries.
    // Leading blanks are rejected and the C locale decides the decimal point.
    if (s.empty() || !(isDigit(s.front()) || s.front() == '+' || s.front() == '-' || s.front() == '.'))
      return std::nullopt;
    std::istringstream in { std::string { s } };
    in.imbue(std::locale::classic());
    long double value {};
    in >> value;
    if (in.fail() || in.peek() != std::char_traits<char>::eof())
      return std::nullopt;
    return static_cast<T>(value);
  }
}

struct CustomTypeConfig { };

struct CustomTypeAction
{
  InputAction mInput;

  static std::optional<CustomTypeAction> fromKey(const Key& key, const CustomTypeConfig&)
  {
    if (auto input = InputAction::fromKey(key))
      return CustomTypeAction { *input };
    return std::nullopt;
  }
};

template <typename T>
class CustomTypePrompt;

/// Text parsed into a value of type T
template <typename T>
class CustomType
{
public:
  explicit CustomType(std::string message)
    : mMessage(std::move(message))
    , mRenderConfig(getRenderConfig())
  {
    if constexpr ((std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) || std::is_same_v<T, std::string>)
      mParser = parseValue<T>;
  }

  /// Answer when the input is left empty
  CustomType& withDefault(T value) { mDefault = std::move(value); return *this; }
  CustomType& withPlaceholder(std::string placeholder) { mPlaceholder = std::move(placeholder); return *this; }
  CustomType& withStartingInput(std::string input) { mStartingInput = std::move(input); return *this; }
  CustomType& withHelpMessage(std::string help) { mHelpMessage = std::move(help); return *this; }
  CustomType& withParser(Parser<T> parser) { mParser = std::move(parser); return *this; }
  CustomType& withFormatter(Formatter<T> formatter) { mFormatter = std::move(formatter); return *this; }
  /// How the default is shown next to the prompt
  CustomType& withDefaultValueFormatter(Formatter<T> formatter) { mDefaultFormatter = std::move(formatter); return *this; }
  /// Shown when the parser rejects the input
  CustomType& withErrorMessage(std::string message) { mErrorMessage = std::move(message); return *this; }
  CustomType& withValidator(Validator<T> validator) { mValidators.push_back(std::move(validator)); return *this; }
  CustomType& withRenderConfig(RenderConfig config) { mRenderConfig = std::move(config); return *this; }

  T prompt()
  {
    return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
  }

  std::optional<T> promptSkippable()
  {
    return skipOnCancel([this] { return prompt(); });
  }

  T promptWith(Terminal& terminal)
  {
    CustomTypePrompt<T> state { *this };
    Backend backend { terminal, mRenderConfig };
    return runPrompt(state, backend);
  }

private:
  friend class CustomTypePrompt<T>;

  std::string mMessage;
  std::optional<T> mDefault;
  std::optional<std::string> mPlaceholder;
  std::optional<std::string> mStartingInput;
  std::optional<std::string> mHelpMessage;
  Parser<T> mParser;
  Formatter<T> mFormatter { [](const T& v) { return fmt::to_string(v); } };
  Formatter<T> mDefaultFormatter { [](const T& v) { return fmt::to_string(v); } };
  std::string mErrorMessage { "Invalid input" };
  std::vector<Validator<T>> mValidators;
  RenderConfig mRenderConfig;
};

template <typename T>
class CustomTypePrompt
{
public:
  using Answer = T;
  using Action = CustomTypeAction;
  using Config = CustomTypeConfig;

  /// Throws InvalidConfigurationError without a parser
  explicit CustomTypePrompt(const CustomType<T>& opts)
    : mMessage(opts.mMessage)
    , mDefault(opts.mDefault)
    , mHelpMessage(opts.mHelpMessage)
    , mInput(opts.mStartingInput.value_or(std::string {}))
    , mParser(opts.mParser)
    , mFormatter(opts.mFormatter)
    , mDefaultFormatter(opts.mDefaultFormatter)
    , mErrorMessage(opts.mErrorMessage)
    , mValidators(opts.mValidators)
  {
    if (!mParser)
      throw InvalidConfigurationError { "A parser is required" };
    if (opts.mPlaceholder)
      mInput.withPlaceholder(*opts.mPlaceholder);
  }

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const CustomTypeConfig& config() const noexcept { return mConfig; }
  [[nodiscard]] std::string formatAnswer(const T& answer) const { return mFormatter(answer); }

  void setup() { }
  bool preCancel() noexcept { return true; }

  std::optional<T> submit()
  {
    std::optional<T> value;
    if (mInput.isEmpty() && mDefault) {
      value = mDefault;
    } else {
      value = mParser(mInput.content());
      if (!value) {
        mError = ErrorMessage { mErrorMessage };
        return std::nullopt;
      }
    }

    if (auto error = runValidators(mValidators, *value)) {
      mError = std::move(error);
      return std::nullopt;
    }
    return value;
  }

  ActionResult handle(const CustomTypeAction& action)
  {
    return toActionResult(mInput.handle(action.mInput));
  }

  void render(Backend& backend) const
  {
    if (mError)
      backend.renderErrorMessage(*mError);

    std::optional<std::string> defaultValue;
    if (mDefault)
      defaultValue = mDefaultFormatter(*mDefault);
    backend.renderPromptWithInput(
      mMessage,
      defaultValue ? std::optional<std::string_view> { *defaultValue } : std::nullopt,
      mInput);

    if (mHelpMessage)
      backend.renderHelpMessage(*mHelpMessage);
  }

  [[nodiscard]] const Input& input() const noexcept { return mInput; }
  [[nodiscard]] const std::optional<ErrorMessage>& error() const noexcept { return mError; }

private:
  std::string mMessage;
  CustomTypeConfig mConfig;
  std::optional<T> mDefault;
  std::optional<std::string> mHelpMessage;
  Input mInput;
  Parser<T> mParser;
  Formatter<T> mFormatter;
  Formatter<T> mDefaultFormatter;
  std::string mErrorMessage;
  std::vector<Validator<T>> mValidators;
  std::optional<ErrorMessage> mError;
};

} // namespace ask
