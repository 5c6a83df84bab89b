// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/prompts/text.hpp"

#include <algorithm>
#include <utility>

#include "ask/macros.hpp"

namespace ask {

std::optional<TextAction> TextAction::fromKey(const Key& key, const TextConfig&)
{
  switch (key.mCode) {
  case kUp:
    if (key.mMods == kNone)
      return TextAction { kSuggestionAbove, {} };
    break;
  case kDown:
    if (key.mMods == kNone)
      return TextAction { kSuggestionBelow, {} };
    break;
  case kPageUp:
    return TextAction { kSuggestionPageUp, {} };
  case kPageDown:
    return TextAction { kSuggestionPageDown, {} };
  case kTab:
    return TextAction { kUseSuggestion, {} };
  default:
    break;
  }

  if (auto input = InputAction::fromKey(key))
    return TextAction { kValueInput, *input };
  return std::nullopt;
}

Text::Text(std::string message)
  : mMessage(std::move(message))
  , mRenderConfig(getRenderConfig())
{
}

Text& Text::withInitialValue(std::string value)
{
  mInitialValue = std::move(value);
  return *this;
}

Text& Text::withPlaceholder(std::string placeholder)
{
  mPlaceholder = std::move(placeholder);
  return *this;
}

Text& Text::withDefault(std::string value)
{
  mDefault = std::move(value);
  return *this;
}

Text& Text::withHelpMessage(std::string help)
{
  mHelpMessage = std::move(help);
  return *this;
}

Text& Text::withPageSize(size_t pageSize)
{
  mPageSize = pageSize;
  return *this;
}

Text& Text::withFormatter(StringFormatter formatter)
{
  mFormatter = std::move(formatter);
  return *this;
}

Text& Text::withValidator(StringValidator validator)
{
  mValidators.push_back(std::move(validator));
  return *this;
}

Text& Text::withAutocomplete(std::shared_ptr<Autocomplete> autocomplete)
{
  mAutocomplete = std::move(autocomplete);
  return *this;
}

Text& Text::withRenderConfig(RenderConfig config)
{
  mRenderConfig = std::move(config);
  return *this;
}

std::string Text::prompt()
{
  return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
}

std::optional<std::string> Text::promptSkippable()
{
  return skipOnCancel([this] { return prompt(); });
}

std::string Text::promptWith(Terminal& terminal)
{
  if (mPageSize == 0)
    throw InvalidConfigurationError { "page size must be greater than zero" };

  TextPrompt state { *this };
  Backend backend { terminal, mRenderConfig };
  return runPrompt(state, backend);
}

TextPrompt::TextPrompt(const Text& opts)
  : mMessage(opts.mMessage)
  , mConfig { opts.mPageSize }
  , mDefault(opts.mDefault)
  , mHelpMessage(opts.mHelpMessage)
  , mInput(opts.mInitialValue.value_or(std::string {}))
  , mFormatter(opts.mFormatter)
  , mValidators(opts.mValidators)
  , mAutocomplete(opts.mAutocomplete)
{
  if (opts.mPlaceholder)
    mInput.withPlaceholder(*opts.mPlaceholder);
  if (!mHelpMessage && mAutocomplete)
    mHelpMessage = "↑↓ to move, tab to autocomplete, enter to submit";
}

void TextPrompt::updateSuggestions()
{
  if (!mAutocomplete)
    return;
  mSuggestions = mAutocomplete->suggestions(mInput.content());
  mSuggestionCursor.reset();
}

const std::string* TextPrompt::highlighted() const noexcept
{
  if (!mSuggestionCursor)
    return nullptr;
  return &mSuggestions[*mSuggestionCursor];
}

const std::string& TextPrompt::currentAnswer() const noexcept
{
  if (const auto* suggestion = highlighted())
    return *suggestion;
  if (mInput.isEmpty() && mDefault)
    return *mDefault;
  return mInput.content();
}

ActionResult TextPrompt::setSuggestionCursor(std::optional<size_t> cursor)
{
  if (cursor == mSuggestionCursor)
    return ActionResult::Clean;
  mSuggestionCursor = cursor;
  return ActionResult::NeedsRedraw;
}

// Above the first suggestion is the typed text itself

ActionResult TextPrompt::moveUp(size_t n)
{
  if (!mSuggestionCursor || *mSuggestionCursor < n)
    return setSuggestionCursor(std::nullopt);
  return setSuggestionCursor(*mSuggestionCursor - n);
}

ActionResult TextPrompt::moveDown(size_t n)
{
  if (mSuggestions.empty() || (!mSuggestionCursor && n == 0))
    return setSuggestionCursor(std::nullopt);
  const size_t last = mSuggestions.size() - 1;
  const size_t target = mSuggestionCursor ? *mSuggestionCursor + n : n - 1;
  return setSuggestionCursor(std::min(target, last));
}

ActionResult TextPrompt::useSuggestion()
{
  if (!mAutocomplete)
    return ActionResult::Clean;

  std::optional<std::string> suggestion;
  if (const auto* s = highlighted())
    suggestion = *s;

  auto replacement = mAutocomplete->completion(mInput.content(), suggestion);
  if (!replacement)
    return ActionResult::Clean;

  auto placeholder = mInput.placeholder();
  mInput = Input { std::move(*replacement) };
  if (placeholder)
    mInput.withPlaceholder(std::move(*placeholder));
  updateSuggestions();
  return ActionResult::NeedsRedraw;
}

std::optional<std::string> TextPrompt::submit()
{
  const std::string& answer = currentAnswer();
  if (auto error = runValidators(mValidators, answer)) {
    mError = std::move(error);
    return std::nullopt;
  }
  return answer;
}

ActionResult TextPrompt::handle(const TextAction& action)
{
  switch (action.mKind) {
  case TextAction::kValueInput: {
    const auto res = mInput.handle(action.mInput);
    if (res == InputActionResult::ContentChanged)
      updateSuggestions();
    return toActionResult(res);
  }
  case TextAction::kSuggestionAbove:
    return moveUp(1);
  case TextAction::kSuggestionBelow:
    return moveDown(1);
  case TextAction::kSuggestionPageUp:
    return moveUp(mConfig.mPageSize);
  case TextAction::kSuggestionPageDown:
    return moveDown(mConfig.mPageSize);
  case TextAction::kUseSuggestion:
    return useSuggestion();
  }
  UNREACHABLE();
}

void TextPrompt::render(Backend& backend) const
{
  if (mError)
    backend.renderErrorMessage(*mError);

  backend.renderPromptWithInput(mMessage, mDefault, mInput);

  const Page page = paginate(mConfig.mPageSize, mSuggestions.size(), mSuggestionCursor);
  std::vector<ListOption<std::string_view>> options;
  options.reserve(page.mSize);
  for (size_t i = page.mStart; i < page.end(); ++i)
    options.emplace_back(i, mSuggestions[i]);
  backend.renderSuggestions(page, options);

  if (mHelpMessage)
    backend.renderHelpMessage(*mHelpMessage);
}

} // namespace ask
