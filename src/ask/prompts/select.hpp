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

namespace ask {

struct SelectConfig
{
  bool mVimMode { kDefaultVimMode };
  size_t mPageSize { kDefaultPageSize };
};

struct SelectAction
{
  enum Kind : uint8_t {
    kFilterInput,
    kMoveUp,
    kMoveDown,
    kMovePageUp,
    kMovePageDown,
    kMoveToStart,
    kMoveToEnd,
  };

  Kind mKind { kFilterInput };
  InputAction mInput;

  static std::optional<SelectAction> fromKey(const Key& key, const SelectConfig& config)
  {
    if (config.mVimMode) {
      if (key.isChar('k'))
        return SelectAction { kMoveUp, {} };
      if (key.isChar('j'))
        return SelectAction { kMoveDown, {} };
    }

    if (key.is(kUp))
      return SelectAction { kMoveUp, {} };
    if (key.is(kDown))
      return SelectAction { kMoveDown, {} };
    if (key.mCode == kPageUp)
      return SelectAction { kMovePageUp, {} };
    if (key.mCode == kPageDown)
      return SelectAction { kMovePageDown, {} };
    if (key.mCode == kHome)
      return SelectAction { kMoveToStart, {} };
    if (key.mCode == kEnd)
      return SelectAction { kMoveToEnd, {} };

    if (auto input = InputAction::fromKey(key))
      return SelectAction { kFilterInput, *input };
    return std::nullopt;
  }
};

template <typename T>
class SelectPrompt;

/// Pick one option from a list
template <typename T>
class Select
{
public:
  static constexpr const char* kDefaultHelpMessage = "↑↓ to move, enter to select, type to filter";

  Select(std::string message, std::vector<T> options)
    : mMessage(std::move(message))
    , mOptions(std::move(options))
    , mRenderConfig(getRenderConfig())
  {
  }

  Select& withHelpMessage(std::string help) { mHelpMessage = std::move(help); return *this; }
  Select& withoutHelpMessage() { mHelpMessage.reset(); return *this; }
  Select& withPageSize(size_t pageSize) { mPageSize = pageSize; return *this; }
  Select& withVimMode(bool enabled) { mVimMode = enabled; return *this; }
  Select& withStartingCursor(size_t cursor) { mStartingCursor = cursor; return *this; }
  Select& withStartingFilterInput(std::string filter) { mStartingFilter = std::move(filter); return *this; }
  Select& withResetCursor(bool reset) { mResetCursor = reset; return *this; }
  /// Typing doesn't filter the options
  Select& withoutFiltering() { mFilterInputEnabled = false; return *this; }
  Select& withFormatter(Formatter<ListOption<T>> formatter) { mFormatter = std::move(formatter); return *this; }
  Select& withScorer(Scorer<T> scorer) { mScorer = std::move(scorer); return *this; }
  Select& withRenderConfig(RenderConfig config) { mRenderConfig = std::move(config); return *this; }

  T prompt() { return rawPrompt().mValue; }

  std::optional<T> promptSkippable()
  {
    return skipOnCancel([this] { return prompt(); });
  }

  /// The answer together with its index in the option list
  ListOption<T> rawPrompt()
  {
    return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
  }

  ListOption<T> promptWith(Terminal& terminal)
  {
    SelectPrompt<T> state { *this };
    Backend backend { terminal, mRenderConfig };
    return runPrompt(state, backend);
  }

private:
  friend class SelectPrompt<T>;

  std::string mMessage;
  std::vector<T> mOptions;
  std::optional<std::string> mHelpMessage { kDefaultHelpMessage };
  size_t mPageSize { kDefaultPageSize };
  bool mVimMode { kDefaultVimMode };
  size_t mStartingCursor { 0 };
  std::optional<std::string> mStartingFilter;
  bool mResetCursor { true };
  bool mFilterInputEnabled { true };
  Formatter<ListOption<T>> mFormatter;
  Scorer<T> mScorer { fuzzyScorer<T>() };
  RenderConfig mRenderConfig;
};

template <typename T>
class SelectPrompt
{
public:
  using Answer = ListOption<T>;
  using Action = SelectAction;
  using Config = SelectConfig;

  /// Throws InvalidConfigurationError for an empty list or a starting cursor past its end
  explicit SelectPrompt(const Select<T>& opts)
    : mMessage(opts.mMessage)
    , mConfig { opts.mVimMode, opts.mPageSize }
    , mHelpMessage(opts.mHelpMessage)
    , mList(validated(opts), opts.mScorer, opts.mResetCursor, opts.mStartingCursor)
    , mFormatter(opts.mFormatter)
  {
    if (opts.mFilterInputEnabled)
      mFilter.emplace(opts.mStartingFilter.value_or(std::string {}));
  }

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const SelectConfig& config() const noexcept { return mConfig; }

  [[nodiscard]] std::string formatAnswer(const ListOption<T>& answer) const
  {
    if (mFormatter)
      return mFormatter(answer);
    return mList.strings()[answer.mIndex];
  }

  void setup()
  {
    if (mFilter)
      mList.rescore(mFilter->content());
  }

  bool preCancel() noexcept { return true; }

  std::optional<ListOption<T>> submit()
  {
    if (auto index = mList.current())
      return ListOption<T> { *index, mList.options()[*index] };
    return std::nullopt;
  }

  ActionResult handle(const SelectAction& action)
  {
    switch (action.mKind) {
    case SelectAction::kMoveUp:
      return mList.moveUp(1, true);
    case SelectAction::kMoveDown:
      return mList.moveDown(1, true);
    case SelectAction::kMovePageUp:
      return mList.moveUp(mConfig.mPageSize, false);
    case SelectAction::kMovePageDown:
      return mList.moveDown(mConfig.mPageSize, false);
    case SelectAction::kMoveToStart:
      return mList.moveUp(SIZE_MAX, false);
    case SelectAction::kMoveToEnd:
      return mList.moveDown(SIZE_MAX, false);
    case SelectAction::kFilterInput: {
      if (!mFilter)
        return ActionResult::Clean;
      const auto res = mFilter->handle(action.mInput);
      if (res == InputActionResult::ContentChanged)
        mList.rescore(mFilter->content());
      return toActionResult(res);
    }
    }
    return ActionResult::Clean;
  }

  void render(Backend& backend) const
  {
    backend.renderSelectPrompt(mMessage, mFilter ? &*mFilter : nullptr);

    const Page page = mList.page(mConfig.mPageSize);
    backend.renderOptions(page, mList.window(page));

    if (mHelpMessage)
      backend.renderHelpMessage(*mHelpMessage);
  }

  [[nodiscard]] const ScoredList<T>& list() const noexcept { return mList; }

private:
  static std::vector<T> validated(const Select<T>& opts)
  {
    if (opts.mOptions.empty())
      throw InvalidConfigurationError { "Available options can not be empty" };
    if (opts.mStartingCursor >= opts.mOptions.size())
      throw InvalidConfigurationError { fmt::format(
        "Starting cursor index {} is out-of-bounds for length {} of options",
        opts.mStartingCursor, opts.mOptions.size()) };
    if (opts.mPageSize == 0)
      throw InvalidConfigurationError { "Page size must be greater than zero" };
    return opts.mOptions;
  }

  std::string mMessage;
  SelectConfig mConfig;
  std::optional<std::string> mHelpMessage;
  ScoredList<T> mList;
  std::optional<Input> mFilter;
  Formatter<ListOption<T>> mFormatter;
};

} // namespace ask
