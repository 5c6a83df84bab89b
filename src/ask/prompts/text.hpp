// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ask/autocomplete.hpp"
#include "ask/config.hpp"
#include "ask/formatter.hpp"
#include "ask/input.hpp"
#include "ask/prompt.hpp"
#include "ask/render_config.hpp"
#include "ask/validator.hpp"

namespace ask {

struct TextConfig
{
  size_t mPageSize { kDefaultPageSize };
};

struct TextAction
{
  enum Kind : uint8_t {
    kValueInput,
    kSuggestionAbove,
    kSuggestionBelow,
    kSuggestionPageUp,
    kSuggestionPageDown,
    kUseSuggestion,
  };

  Kind mKind { kValueInput };
  InputAction mInput;

  static std::optional<TextAction> fromKey(const Key& key, const TextConfig& config);
};

/// Single line of text, optionally with suggestions from an Autocomplete
class Text
{
public:
  explicit Text(std::string message);

  Text& withInitialValue(std::string value);
  Text& withPlaceholder(std::string placeholder);
  /// Answer when the input is left empty
  Text& withDefault(std::string value);
  Text& withHelpMessage(std::string help);
  Text& withPageSize(size_t pageSize);
  Text& withFormatter(StringFormatter formatter);
  Text& withValidator(StringValidator validator);
  Text& withAutocomplete(std::shared_ptr<Autocomplete> autocomplete);
  Text& withRenderConfig(RenderConfig config);

  std::string prompt();
  /// No value when canceled
  std::optional<std::string> promptSkippable();
  std::string promptWith(Terminal& terminal);

private:
  friend class TextPrompt;

  std::string mMessage;
  std::optional<std::string> mInitialValue;
  std::optional<std::string> mPlaceholder;
  std::optional<std::string> mDefault;
  std::optional<std::string> mHelpMessage;
  size_t mPageSize { kDefaultPageSize };
  StringFormatter mFormatter { formatString };
  std::vector<StringValidator> mValidators;
  std::shared_ptr<Autocomplete> mAutocomplete;
  RenderConfig mRenderConfig;
};

class TextPrompt
{
public:
  using Answer = std::string;
  using Action = TextAction;
  using Config = TextConfig;

  explicit TextPrompt(const Text& opts);

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const TextConfig& config() const noexcept { return mConfig; }
  [[nodiscard]] std::string formatAnswer(const std::string& answer) const { return mFormatter(answer); }

  void setup() { updateSuggestions(); }
  bool preCancel() noexcept { return true; }
  std::optional<std::string> submit();
  ActionResult handle(const TextAction& action);
  void render(Backend& backend) const;

  [[nodiscard]] const Input& input() const noexcept { return mInput; }
  [[nodiscard]] const std::vector<std::string>& suggestions() const noexcept { return mSuggestions; }
  [[nodiscard]] std::optional<size_t> suggestionCursor() const noexcept { return mSuggestionCursor; }

private:
  void updateSuggestions();
  [[nodiscard]] const std::string* highlighted() const noexcept;
  [[nodiscard]] const std::string& currentAnswer() const noexcept;
  ActionResult moveUp(size_t n);
  ActionResult moveDown(size_t n);
  ActionResult setSuggestionCursor(std::optional<size_t> cursor);
  ActionResult useSuggestion();

  std::string mMessage;
  TextConfig mConfig;
  std::optional<std::string> mDefault;
  std::optional<std::string> mHelpMessage;
  Input mInput;
  StringFormatter mFormatter;
  std::vector<StringValidator> mValidators;
  std::shared_ptr<Autocomplete> mAutocomplete;
  std::optional<ErrorMessage> mError;
  std::vector<std::string> mSuggestions;
  std::optional<size_t> mSuggestionCursor;
};

} // namespace ask
