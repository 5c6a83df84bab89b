// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "ask/config.hpp"
#include "ask/formatter.hpp"
#include "ask/input.hpp"
#include "ask/list_option.hpp"
#include "ask/prompt.hpp"
#include "ask/prompts/option_list.hpp"
#include "ask/render_config.hpp"
#include "ask/scorer.hpp"
#include "ask/validator.hpp"

namespace ask {

struct MultiSelectConfig
{
  bool mVimMode { kDefaultVimMode };
  size_t mPageSize { kDefaultPageSize };
  bool mKeepFilter { true };
};

struct MultiSelectAction
{
  enum Kind : uint8_t {
    kFilterInput,
    kMoveUp,
    kMoveDown,
    kMovePageUp,
    kMovePageDown,
    kMoveToStart,
    kMoveToEnd,
    kToggleCurrent,
    kSelectAll,
    kClearSelections,
  };

  Kind mKind { kFilterInput };
  InputAction mInput;

  static std::optional<MultiSelectAction> fromKey(const Key& key, const MultiSelectConfig& config)
  {
    if (config.mVimMode) {
      if (key.isChar('k'))
        return MultiSelectAction { kMoveUp, {} };
      if (key.isChar('j'))
        return MultiSelectAction { kMoveDown, {} };
      if (key.isChar('h'))
        return MultiSelectAction { kClearSelections, {} };
      if (key.isChar('l'))
        return MultiSelectAction { kSelectAll, {} };
    }

    if (key.is(kUp))
      return MultiSelectAction { kMoveUp, {} };
    if (key.is(kDown))
      return MultiSelectAction { kMoveDown, {} };
    if (key.mCode == kPageUp)
      return MultiSelectAction { kMovePageUp, {} };
    if (key.mCode == kPageDown)
      return MultiSelectAction { kMovePageDown, {} };
    if (key.mCode == kHome)
      return MultiSelectAction { kMoveToStart, {} };
    if (key.mCode == kEnd)
      return MultiSelectAction { kMoveToEnd, {} };
    if (key.isChar(' '))
      return MultiSelectAction { kToggleCurrent, {} };
    if (key.is(kRight))
      return MultiSelectAction { kSelectAll, {} };
    if (key.is(kLeft))
      return MultiSelectAction { kClearSelections, {} };

    if (auto input = InputAction::fromKey(key))
      return MultiSelectAction { kFilterInput, *input };
    return std::nullopt;
  }
};

template <typename T>
class MultiSelectPrompt;

/// Check any number of options from a list
template <typename T>
class MultiSelect
{
public:
  static constexpr const char* kDefaultHelpMessage =
    "↑↓ to move, space to select one, → to all, ← to none, type to filter";

  MultiSelect(std::string message, std::vector<T> options)
    : mMessage(std::move(message))
    , mOptions(std::move(options))
    , mRenderConfig(getRenderConfig())
  {
  }

  MultiSelect& withHelpMessage(std::string help) { mHelpMessage = std::move(help); return *this; }
  MultiSelect& withoutHelpMessage() { mHelpMessage.reset(); return *this; }
  MultiSelect& withPageSize(size_t pageSize) { mPageSize = pageSize; return *this; }
  MultiSelect& withVimMode(bool enabled) { mVimMode = enabled; return *this; }
  MultiSelect& withStartingCursor(size_t cursor) { mStartingCursor = cursor; return *this; }
  MultiSelect& withStartingFilterInput(std::string filter) { mStartingFilter = std::move(filter); return *this; }
  MultiSelect& withResetCursor(bool reset) { mResetCursor = reset; return *this; }
  MultiSelect& withKeepFilter(bool keep) { mKeepFilter = keep; return *this; }
  MultiSelect& withoutFiltering() { mFilterInputEnabled = false; return *this; }
  /// Indices of the options checked from the start
  MultiSelect& withDefault(std::vector<size_t> indices) { mDefault = std::move(indices); return *this; }
  MultiSelect& withAllSelectedByDefault() { mAllSelected = true; return *this; }
  MultiSelect& withFormatter(MultiOptionFormatter<T> formatter) { mFormatter = std::move(formatter); return *this; }
  MultiSelect& withValidator(MultiOptionValidator<T> validator) { mValidator = std::move(validator); return *this; }
  MultiSelect& withScorer(Scorer<T> scorer) { mScorer = std::move(scorer); return *this; }
  MultiSelect& withRenderConfig(RenderConfig config) { mRenderConfig = std::move(config); return *this; }

  std::vector<T> prompt()
  {
    std::vector<T> values;
    for (auto& option : rawPrompt())
      values.push_back(std::move(option.mValue));
    return values;
  }

  std::optional<std::vector<T>> promptSkippable()
  {
    return skipOnCancel([this] { return prompt(); });
  }

  /// Checked options in list order, with their indices
  std::vector<ListOption<T>> rawPrompt()
  {
    return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
  }

  std::vector<ListOption<T>> promptWith(Terminal& terminal)
  {
    MultiSelectPrompt<T> state { *this };
    Backend backend { terminal, mRenderConfig };
    return runPrompt(state, backend);
  }

private:
  friend class MultiSelectPrompt<T>;

  std::string mMessage;
  std::vector<T> mOptions;
  std::optional<std::string> mHelpMessage { kDefaultHelpMessage };
  size_t mPageSize { kDefaultPageSize };
  bool mVimMode { kDefaultVimMode };
  size_t mStartingCursor { 0 };
  std::optional<std::string> mStartingFilter;
  bool mResetCursor { true };
  bool mKeepFilter { true };
  bool mFilterInputEnabled { true };
  std::vector<size_t> mDefault;
  bool mAllSelected { false };
  MultiOptionFormatter<T> mFormatter;
  MultiOptionValidator<T> mValidator;
  Scorer<T> mScorer { fuzzyScorer<T>() };
  RenderConfig mRenderConfig;
};

template <typename T>
class MultiSelectPrompt
{
public:
  using Answer = std::vector<ListOption<T>>;
  using Action = MultiSelectAction;
  using Config = MultiSelectConfig;

  /// Throws InvalidConfigurationError for an empty list or out of range indices
  explicit MultiSelectPrompt(const MultiSelect<T>& opts)
    : mMessage(opts.mMessage)
    , mConfig { opts.mVimMode, opts.mPageSize, opts.mKeepFilter }
    , mHelpMessage(opts.mHelpMessage)
    , mList(validated(opts), opts.mScorer, opts.mResetCursor, opts.mStartingCursor)
    , mChecked(opts.mOptions.size(), opts.mAllSelected)
    , mFormatter(opts.mFormatter)
    , mValidator(opts.mValidator)
  {
    for (size_t i : opts.mDefault)
      mChecked[i] = true;
    if (opts.mFilterInputEnabled)
      mFilter.emplace(opts.mStartingFilter.value_or(std::string {}));
  }

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const MultiSelectConfig& config() const noexcept { return mConfig; }

  [[nodiscard]] std::string formatAnswer(const Answer& answer) const
  {
    if (mFormatter)
      return mFormatter(answer);
    return joinOptions(answer, [&](const T& value) { return fmt::to_string(value); });
  }

  void setup() { rescore(); }
  bool preCancel() noexcept { return true; }

  std::optional<Answer> submit()
  {
    Answer answer;
    for (size_t i = 0; i < mChecked.size(); ++i)
      if (mChecked[i])
        answer.emplace_back(i, mList.options()[i]);

    if (mValidator) {
      Validation res = mValidator(answer);
      if (!res.isValid()) {
        mError = std::move(res.mMessage);
        return std::nullopt;
      }
    }
    return answer;
  }

  ActionResult handle(const MultiSelectAction& action)
  {
    switch (action.mKind) {
    case MultiSelectAction::kMoveUp:
      return mList.moveUp(1, true);
    case MultiSelectAction::kMoveDown:
      return mList.moveDown(1, true);
    case MultiSelectAction::kMovePageUp:
      return mList.moveUp(mConfig.mPageSize, false);
    case MultiSelectAction::kMovePageDown:
      return mList.moveDown(mConfig.mPageSize, false);
    case MultiSelectAction::kMoveToStart:
      return mList.moveUp(SIZE_MAX, false);
    case MultiSelectAction::kMoveToEnd:
      return mList.moveDown(SIZE_MAX, false);

    case MultiSelectAction::kToggleCurrent: {
      const auto index = mList.current();
      if (!index)
        return ActionResult::Clean;
      mChecked[*index] = !mChecked[*index];
      clearFilterUnlessKept();
      return ActionResult::NeedsRedraw;
    }

    case MultiSelectAction::kSelectAll:
      for (size_t i : mList.view())
        mChecked[i] = true;
      clearFilterUnlessKept();
      return ActionResult::NeedsRedraw;

    case MultiSelectAction::kClearSelections:
      mChecked.assign(mChecked.size(), false);
      clearFilterUnlessKept();
      return ActionResult::NeedsRedraw;

    case MultiSelectAction::kFilterInput: {
      if (!mFilter)
        return ActionResult::Clean;
      const auto res = mFilter->handle(action.mInput);
      if (res == InputActionResult::ContentChanged)
        rescore();
      return toActionResult(res);
    }
    }
    return ActionResult::Clean;
  }

  void render(Backend& backend) const
  {
    if (mError)
      backend.renderErrorMessage(*mError);

    backend.renderSelectPrompt(mMessage, mFilter ? &*mFilter : nullptr);

    const Page page = mList.page(mConfig.mPageSize);
    backend.renderOptions(page, mList.window(page), &mChecked);

    if (mHelpMessage)
      backend.renderHelpMessage(*mHelpMessage);
  }

  [[nodiscard]] const ScoredList<T>& list() const noexcept { return mList; }
  [[nodiscard]] bool isChecked(size_t index) const noexcept { return mChecked[index]; }
  [[nodiscard]] const std::optional<Input>& filter() const noexcept { return mFilter; }

private:
  static std::vector<T> validated(const MultiSelect<T>& opts)
  {
    if (opts.mOptions.empty())
      throw InvalidConfigurationError { "Available options can not be empty" };
    for (size_t i : opts.mDefault)
      if (i >= opts.mOptions.size())
        throw InvalidConfigurationError { fmt::format(
          "Index {} is out-of-bounds for length {} of options", i, opts.mOptions.size()) };
    if (opts.mStartingCursor >= opts.mOptions.size())
      throw InvalidConfigurationError { fmt::format(
        "Starting cursor index {} is out-of-bounds for length {} of options",
        opts.mStartingCursor, opts.mOptions.size()) };
    if (opts.mPageSize == 0)
      throw InvalidConfigurationError { "Page size must be greater than zero" };
    return opts.mOptions;
  }

  void rescore()
  {
    if (mFilter)
      mList.rescore(mFilter->content());
  }

  void clearFilterUnlessKept()
  {
    if (mConfig.mKeepFilter || !mFilter || mFilter->isEmpty())
      return;
    mFilter->clear();
    rescore();
  }

  std::string mMessage;
  MultiSelectConfig mConfig;
  std::optional<std::string> mHelpMessage;
  ScoredList<T> mList;
  std::vector<bool> mChecked;
  std::optional<Input> mFilter;
  MultiOptionFormatter<T> mFormatter;
  MultiOptionValidator<T> mValidator;
  std::optional<ErrorMessage> mError;
};

} // namespace ask
