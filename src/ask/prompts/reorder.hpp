// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ask/config.hpp"
#include "ask/formatter.hpp"
#include "ask/input.hpp"
#include "ask/list_option.hpp"
#include "ask/prompt.hpp"
#include "ask/prompts/option_list.hpp"
#include "ask/render_config.hpp"
#include "ask/scorer.hpp"

namespace ask {

struct ReorderConfig
{
  bool mVimMode { kDefaultVimMode };
  size_t mPageSize { kDefaultPageSize };
};

struct ReorderAction
{
  enum Kind : uint8_t {
    kFilterInput,
    kMoveUp,
    kMoveDown,
    kMovePageUp,
    kMovePageDown,
    kMoveToStart,
    kMoveToEnd,
    kMoveItemUp,
    kMoveItemDown,
  };

  Kind mKind { kFilterInput };
  InputAction mInput;

  static std::optional<ReorderAction> fromKey(const Key& key, const ReorderConfig& config)
  {
    if (config.mVimMode) {
      if (key.isChar('k'))
        return ReorderAction { kMoveUp, {} };
      if (key.isChar('j'))
        return ReorderAction { kMoveDown, {} };
      if (key.isChar('K') || key.isChar('K', kShift))
        return ReorderAction { kMoveItemUp, {} };
      if (key.isChar('J') || key.isChar('J', kShift))
        return ReorderAction { kMoveItemDown, {} };
    }

    if (key.is(kUp) || key.isChar('p', kControl))
      return ReorderAction { kMoveUp, {} };
    if (key.is(kDown) || key.isChar('n', kControl))
      return ReorderAction { kMoveDown, {} };
    if (key.is(kUp, kControl))
      return ReorderAction { kMoveItemUp, {} };
    if (key.is(kDown, kControl))
      return ReorderAction { kMoveItemDown, {} };
    if (key.mCode == kPageUp)
      return ReorderAction { kMovePageUp, {} };
    if (key.mCode == kPageDown)
      return ReorderAction { kMovePageDown, {} };
    if (key.mCode == kHome)
      return ReorderAction { kMoveToStart, {} };
    if (key.mCode == kEnd)
      return ReorderAction { kMoveToEnd, {} };

    if (auto input = InputAction::fromKey(key))
      return ReorderAction { kFilterInput, *input };
    return std::nullopt;
  }
};

template <typename T>
class ReorderPrompt;

/// Put the options of a list in a different order
template <typename T>
class Reorder
{
public:
  static constexpr const char* kDefaultHelpMessage = "↑↓ to move cursor, Ctrl+↑↓ to move item, type to filter";

  Reorder(std::string message, std::vector<T> options)
    : mMessage(std::move(message))
    , mOptions(std::move(options))
    , mRenderConfig(getRenderConfig())
  {
  }

  Reorder& withHelpMessage(std::string help) { mHelpMessage = std::move(help); return *this; }
  Reorder& withoutHelpMessage() { mHelpMessage.reset(); return *this; }
  Reorder& withPageSize(size_t pageSize) { mPageSize = pageSize; return *this; }
  Reorder& withVimMode(bool enabled) { mVimMode = enabled; return *this; }
  Reorder& withStartingCursor(size_t cursor) { mStartingCursor = cursor; return *this; }
  Reorder& withStartingFilterInput(std::string filter) { mStartingFilter = std::move(filter); return *this; }
  Reorder& withResetCursor(bool reset) { mResetCursor = reset; return *this; }
  Reorder& withoutFiltering() { mFilterInputEnabled = false; return *this; }
  Reorder& withFormatter(Formatter<std::vector<T>> formatter) { mFormatter = std::move(formatter); return *this; }
  Reorder& withScorer(Scorer<T> scorer) { mScorer = std::move(scorer); return *this; }
  Reorder& withRenderConfig(RenderConfig config) { mRenderConfig = std::move(config); return *this; }

  std::vector<T> prompt()
  {
    return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
  }

  std::optional<std::vector<T>> promptSkippable()
  {
    return skipOnCancel([this] { return prompt(); });
  }

  std::vector<T> promptWith(Terminal& terminal)
  {
    ReorderPrompt<T> state { *this };
    Backend backend { terminal, mRenderConfig };
    return runPrompt(state, backend);
  }

private:
  friend class ReorderPrompt<T>;

  std::string mMessage;
  std::vector<T> mOptions;
  std::optional<std::string> mHelpMessage { kDefaultHelpMessage };
  size_t mPageSize { kDefaultPageSize };
  bool mVimMode { kDefaultVimMode };
  size_t mStartingCursor { 0 };
  std::optional<std::string> mStartingFilter;
  bool mResetCursor { true };
  bool mFilterInputEnabled { true };
  Formatter<std::vector<T>> mFormatter;
  Scorer<T> mScorer { substringScorer<T>() };
  RenderConfig mRenderConfig;
};

/// The order is a permutation of the option indices. The filter hides the
/// options it doesn't match without changing the order; moving an item swaps
/// it with its nearest visible neighbour.
template <typename T>
class ReorderPrompt
{
public:
  using Answer = std::vector<T>;
  using Action = ReorderAction;
  using Config = ReorderConfig;

  explicit ReorderPrompt(const Reorder<T>& opts)
    : mMessage(opts.mMessage)
    , mConfig { opts.mVimMode, opts.mPageSize }
    , mHelpMessage(opts.mHelpMessage)
    , mOptions(validated(opts))
    , mStrings(toStrings(mOptions))
    , mScorer(opts.mScorer)
    , mResetCursor(opts.mResetCursor)
    , mCursor(opts.mStartingCursor)
    , mFormatter(opts.mFormatter)
  {
    mOrder.reserve(mOptions.size());
    for (size_t i = 0; i < mOptions.size(); ++i)
      mOrder.push_back(i);
    mVisible = mOrder;
    if (opts.mFilterInputEnabled)
      mFilter.emplace(opts.mStartingFilter.value_or(std::string {}));
  }

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const ReorderConfig& config() const noexcept { return mConfig; }

  [[nodiscard]] std::string formatAnswer(const Answer& answer) const
  {
    if (mFormatter)
      return mFormatter(answer);
    std::string out;
    for (size_t index : mOrder) {
      if (!out.empty())
        out.append(", ");
      out.append(mStrings[index]);
    }
    return out;
  }

  void setup() { refilter(); }
  bool preCancel() noexcept { return true; }

  std::optional<Answer> submit()
  {
    Answer answer;
    answer.reserve(mOrder.size());
    for (size_t index : mOrder)
      answer.push_back(mOptions[index]);
    return answer;
  }

  ActionResult handle(const ReorderAction& action)
  {
    switch (action.mKind) {
    case ReorderAction::kMoveUp:
      return setCursor(cursorUp(mCursor, 1, mVisible.size(), true));
    case ReorderAction::kMoveDown:
      return setCursor(cursorDown(mCursor, 1, mVisible.size(), true));
    case ReorderAction::kMovePageUp:
      return setCursor(cursorUp(mCursor, mConfig.mPageSize, mVisible.size(), false));
    case ReorderAction::kMovePageDown:
      return setCursor(cursorDown(mCursor, mConfig.mPageSize, mVisible.size(), false));
    case ReorderAction::kMoveToStart:
      return setCursor(0);
    case ReorderAction::kMoveToEnd:
      return setCursor(mVisible.empty() ? 0 : mVisible.size() - 1);
    case ReorderAction::kMoveItemUp:
      if (mCursor == 0 || mCursor >= mVisible.size())
        return ActionResult::Clean;
      std::swap(mOrder[mVisible[mCursor]], mOrder[mVisible[mCursor - 1]]);
      --mCursor;
      return ActionResult::NeedsRedraw;
    case ReorderAction::kMoveItemDown:
      if (mCursor + 1 >= mVisible.size())
        return ActionResult::Clean;
      std::swap(mOrder[mVisible[mCursor]], mOrder[mVisible[mCursor + 1]]);
      ++mCursor;
      return ActionResult::NeedsRedraw;
    case ReorderAction::kFilterInput: {
      if (!mFilter)
        return ActionResult::Clean;
      const auto res = mFilter->handle(action.mInput);
      if (res == InputActionResult::ContentChanged)
        refilter();
      return toActionResult(res);
    }
    }
    return ActionResult::Clean;
  }

  void render(Backend& backend) const
  {
    backend.renderSelectPrompt(mMessage, mFilter ? &*mFilter : nullptr);

    const Page page = paginate(
      mConfig.mPageSize, mVisible.size(), mVisible.empty() ? std::nullopt : std::optional<size_t> { mCursor });

    std::vector<ListOption<std::string_view>> options;
    options.reserve(page.mSize);
    for (size_t i = page.mStart; i < page.end(); ++i)
      options.emplace_back(mVisible[i], mStrings[mOrder[mVisible[i]]]);
    backend.renderOptions(page, options);

    if (mHelpMessage)
      backend.renderHelpMessage(*mHelpMessage);
  }

  /// Option indices in their current order
  [[nodiscard]] const std::vector<size_t>& order() const noexcept { return mOrder; }
  /// Positions in the order that match the filter
  [[nodiscard]] const std::vector<size_t>& visible() const noexcept { return mVisible; }
  [[nodiscard]] size_t cursor() const noexcept { return mCursor; }

private:
  static std::vector<T> validated(const Reorder<T>& opts)
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

  void refilter()
  {
    if (!mFilter)
      return;

    std::vector<size_t> visible;
    visible.reserve(mOrder.size());
    for (size_t pos = 0; pos < mOrder.size(); ++pos) {
      const size_t index = mOrder[pos];
      if (mScorer(mFilter->content(), mOptions[index], mStrings[index], index))
        visible.push_back(pos);
    }

    if (visible == mVisible)
      return;
    mVisible = std::move(visible);
    mCursor = cursorAfterFilter(mCursor, mVisible.size(), mResetCursor);
  }

  ActionResult setCursor(size_t cursor) noexcept
  {
    if (cursor == mCursor)
      return ActionResult::Clean;
    mCursor = cursor;
    return ActionResult::NeedsRedraw;
  }

  std::string mMessage;
  ReorderConfig mConfig;
  std::optional<std::string> mHelpMessage;
  std::vector<T> mOptions;
  std::vector<std::string> mStrings;
  Scorer<T> mScorer;
  bool mResetCursor { true };
  std::vector<size_t> mOrder;
  std::vector<size_t> mVisible;
  size_t mCursor { 0 };
  std::optional<Input> mFilter;
  Formatter<std::vector<T>> mFormatter;
};

} // namespace ask
