// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
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

/// Step of shift+arrows
static constexpr uint32_t kMultiCountStep = 10;

struct MultiCountConfig
{
  bool mVimMode { kDefaultVimMode };
  size_t mPageSize { kDefaultPageSize };
  bool mKeepFilter { true };
};

struct MultiCountAction
{
  enum Kind : uint8_t {
    kFilterInput,
    kMoveUp,
    kMoveDown,
    kMovePageUp,
    kMovePageDown,
    kMoveToStart,
    kMoveToEnd,
    kIncrement,
    kDecrement,
  };

  Kind mKind { kFilterInput };
  uint32_t mAmount { 0 };
  InputAction mInput;

  static std::optional<MultiCountAction> fromKey(const Key& key, const MultiCountConfig& config)
  {
    if (config.mVimMode) {
      if (key.isChar('k'))
        return MultiCountAction { kMoveUp, 0, {} };
      if (key.isChar('j'))
        return MultiCountAction { kMoveDown, 0, {} };
      if (key.isChar('+'))
        return MultiCountAction { kIncrement, 1, {} };
      if (key.isChar('-'))
        return MultiCountAction { kDecrement, 1, {} };
    }

    if (key.is(kUp) || key.isChar('p', kControl))
      return MultiCountAction { kMoveUp, 0, {} };
    if (key.is(kDown) || key.isChar('n', kControl))
      return MultiCountAction { kMoveDown, 0, {} };
    if (key.mCode == kPageUp)
      return MultiCountAction { kMovePageUp, 0, {} };
    if (key.mCode == kPageDown)
      return MultiCountAction { kMovePageDown, 0, {} };
    if (key.mCode == kHome)
      return MultiCountAction { kMoveToStart, 0, {} };
    if (key.mCode == kEnd)
      return MultiCountAction { kMoveToEnd, 0, {} };
    if (key.is(kRight))
      return MultiCountAction { kIncrement, 1, {} };
    if (key.is(kLeft))
      return MultiCountAction { kDecrement, 1, {} };
    if (key.is(kRight, kShift))
      return MultiCountAction { kIncrement, kMultiCountStep, {} };
    if (key.is(kLeft, kShift))
      return MultiCountAction { kDecrement, kMultiCountStep, {} };

    if (auto input = InputAction::fromKey(key))
      return MultiCountAction { kFilterInput, 0, *input };
    return std::nullopt;
  }
};

template <typename T>
class MultiCountPrompt;

/// Pick how many of each option
template <typename T>
class MultiCount
{
public:
  static constexpr const char* kDefaultHelpMessage =
    "↑↓ to move, → to add one, ← to remove one, with shift by ten, type to filter";

  MultiCount(std::string message, std::vector<T> options)
    : mMessage(std::move(message))
    , mOptions(std::move(options))
    , mRenderConfig(getRenderConfig())
  {
  }

  MultiCount& withHelpMessage(std::string help) { mHelpMessage = std::move(help); return *this; }
  MultiCount& withoutHelpMessage() { mHelpMessage.reset(); return *this; }
  MultiCount& withPageSize(size_t pageSize) { mPageSize = pageSize; return *this; }
  MultiCount& withVimMode(bool enabled) { mVimMode = enabled; return *this; }
  MultiCount& withStartingCursor(size_t cursor) { mStartingCursor = cursor; return *this; }
  MultiCount& withStartingFilterInput(std::string filter) { mStartingFilter = std::move(filter); return *this; }
  MultiCount& withResetCursor(bool reset) { mResetCursor = reset; return *this; }
  MultiCount& withKeepFilter(bool keep) { mKeepFilter = keep; return *this; }
  MultiCount& withoutFiltering() { mFilterInputEnabled = false; return *this; }
  /// Starting counts as (option index, count) pairs
  MultiCount& withDefault(std::vector<std::pair<size_t, uint32_t>> counts) { mDefault = std::move(counts); return *this; }
  MultiCount& withFormatter(MultiCountFormatter<T> formatter) { mFormatter = std::move(formatter); return *this; }
  MultiCount& withValidator(MultiCountValidator<T> validator) { mValidator = std::move(validator); return *this; }
  MultiCount& withScorer(Scorer<T> scorer) { mScorer = std::move(scorer); return *this; }
  MultiCount& withRenderConfig(RenderConfig config) { mRenderConfig = std::move(config); return *this; }

  /// Options picked at least once in list order, with their counts and indices
  std::vector<CountedListOption<T>> prompt()
  {
    return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
  }

  std::optional<std::vector<CountedListOption<T>>> promptSkippable()
  {
    return skipOnCancel([this] { return prompt(); });
  }

  std::vector<CountedListOption<T>> promptWith(Terminal& terminal)
  {
    MultiCountPrompt<T> state { *this };
    Backend backend { terminal, mRenderConfig };
    return runPrompt(state, backend);
  }

private:
  friend class MultiCountPrompt<T>;

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
  std::vector<std::pair<size_t, uint32_t>> mDefault;
  MultiCountFormatter<T> mFormatter;
  MultiCountValidator<T> mValidator;
  Scorer<T> mScorer { fuzzyScorer<T>() };
  RenderConfig mRenderConfig;
};

template <typename T>
class MultiCountPrompt
{
public:
  using Answer = std::vector<CountedListOption<T>>;
  using Action = MultiCountAction;
  using Config = MultiCountConfig;

  /// Throws InvalidConfigurationError for an empty list or out of range indices
  explicit MultiCountPrompt(const MultiCount<T>& opts)
    : mMessage(opts.mMessage)
    , mConfig { opts.mVimMode, opts.mPageSize, opts.mKeepFilter }
    , mHelpMessage(opts.mHelpMessage)
    , mList(validated(opts), opts.mScorer, opts.mResetCursor, opts.mStartingCursor)
    , mCounts(opts.mOptions.size(), 0)
    , mFormatter(opts.mFormatter)
    , mValidator(opts.mValidator)
  {
    for (const auto& [index, count] : opts.mDefault)
      mCounts[index] = count;
    if (opts.mFilterInputEnabled)
      mFilter.emplace(opts.mStartingFilter.value_or(std::string {}));
  }

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const MultiCountConfig& config() const noexcept { return mConfig; }

  /// "apple x2, pear x1" unless a formatter is set
  [[nodiscard]] std::string formatAnswer(const Answer& answer) const
  {
    if (mFormatter)
      return mFormatter(answer);
    std::string out;
    for (const auto& option : answer) {
      if (!out.empty())
        out.append(", ");
      out.append(fmt::format("{} x{}", option.mOption.mValue, option.mCount));
    }
    return out;
  }

  void setup() { rescore(); }
  bool preCancel() noexcept { return true; }

  std::optional<Answer> submit()
  {
    Answer answer;
    for (size_t i = 0; i < mCounts.size(); ++i)
      if (mCounts[i] > 0)
        answer.emplace_back(mCounts[i], ListOption<T> { i, mList.options()[i] });

    if (mValidator) {
      Validation res = mValidator(answer);
      if (!res.isValid()) {
        mError = std::move(res.mMessage);
        return std::nullopt;
      }
    }
    return answer;
  }

  ActionResult handle(const MultiCountAction& action)
  {
    switch (action.mKind) {
    case MultiCountAction::kMoveUp:
      return mList.moveUp(1, true);
    case MultiCountAction::kMoveDown:
      return mList.moveDown(1, true);
    case MultiCountAction::kMovePageUp:
      return mList.moveUp(mConfig.mPageSize, false);
    case MultiCountAction::kMovePageDown:
      return mList.moveDown(mConfig.mPageSize, false);
    case MultiCountAction::kMoveToStart:
      return mList.moveUp(SIZE_MAX, false);
    case MultiCountAction::kMoveToEnd:
      return mList.moveDown(SIZE_MAX, false);

    case MultiCountAction::kIncrement:
    case MultiCountAction::kDecrement: {
      const auto index = mList.current();
      if (!index)
        return ActionResult::Clean;
      uint32_t& count = mCounts[*index];
      const uint32_t before = count;
      if (action.mKind == MultiCountAction::kIncrement)
        count = action.mAmount > UINT32_MAX - count ? UINT32_MAX : count + action.mAmount;
      else
        count = action.mAmount > count ? 0 : count - action.mAmount;
      if (count == before)
        return ActionResult::Clean;
      clearFilterUnlessKept();
      return ActionResult::NeedsRedraw;
    }

    case MultiCountAction::kFilterInput: {
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
    backend.renderCountedOptions(page, mList.window(page), mCounts);

    if (mHelpMessage)
      backend.renderHelpMessage(*mHelpMessage);
  }

  [[nodiscard]] const ScoredList<T>& list() const noexcept { return mList; }
  [[nodiscard]] uint32_t count(size_t index) const noexcept { return mCounts[index]; }

private:
  static std::vector<T> validated(const MultiCount<T>& opts)
  {
    if (opts.mOptions.empty())
      throw InvalidConfigurationError { "Available options can not be empty" };
    for (const auto& entry : opts.mDefault)
      if (entry.first >= opts.mOptions.size())
        throw InvalidConfigurationError { fmt::format(
          "Index {} is out-of-bounds for length {} of options", entry.first, opts.mOptions.size()) };
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
  MultiCountConfig mConfig;
  std::optional<std::string> mHelpMessage;
  ScoredList<T> mList;
  std::vector<uint32_t> mCounts;
  std::optional<Input> mFilter;
  MultiCountFormatter<T> mFormatter;
  MultiCountValidator<T> mValidator;
  std::optional<ErrorMessage> mError;
};

} // namespace ask
