// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "ask/list_option.hpp"
#include "ask/paginate.hpp"
#include "ask/prompt.hpp"
#include "ask/scorer.hpp"

namespace ask {

/// Cursor position after moving n rows up a list of the given length
[[nodiscard]] constexpr size_t cursorUp(size_t cursor, size_t n, size_t length, bool wrap) noexcept
{
  if (cursor >= n)
    return cursor - n;
  if (!wrap)
    return 0;
  const size_t afterWrap = n - cursor;
  return length > afterWrap ? length - afterWrap : 0;
}

/// Cursor position after moving n rows down a list of the given length
[[nodiscard]] constexpr size_t cursorDown(size_t cursor, size_t n, size_t length, bool wrap) noexcept
{
  const size_t target = n > SIZE_MAX - cursor ? SIZE_MAX : cursor + n;
  if (target < length)
    return target;
  if (length == 0)
    return 0;
  return wrap ? target % length : length - 1;
}

template <typename T>
std::vector<std::string> toStrings(const std::vector<T>& values)
{
  std::vector<std::string> strings;
  strings.reserve(values.size());
  for (const auto& value : values)
    strings.push_back(fmt::to_string(value));
  return strings;
}

/// Options of a select-like prompt, filtered and ranked by a scorer, with a
/// cursor over the filtered view.
template <typename T>
class ScoredList
{
public:
  ScoredList(std::vector<T> options, Scorer<T> scorer, bool resetCursor, size_t cursor)
    : mOptions(std::move(options))
    , mStrings(toStrings(mOptions))
    , mScorer(std::move(scorer))
    , mResetCursor(resetCursor)
    , mCursor(cursor)
  {
    mView.reserve(mOptions.size());
    for (size_t i = 0; i < mOptions.size(); ++i)
      mView.push_back(i);
  }

  /// Ranks the options against a new filter text
  void rescore(std::string_view filter)
  {
    auto view = scoreOptions(filter, mOptions, mStrings, mScorer);
    if (view == mView)
      return;
    mView = std::move(view);
    mCursor = cursorAfterFilter(mCursor, mView.size(), mResetCursor);
  }

  ActionResult moveUp(size_t n, bool wrap) { return setCursor(cursorUp(mCursor, n, mView.size(), wrap)); }
  ActionResult moveDown(size_t n, bool wrap) { return setCursor(cursorDown(mCursor, n, mView.size(), wrap)); }

  /// Original index of the option under the cursor, no value when nothing matches the filter
  [[nodiscard]] std::optional<size_t> current() const noexcept
  {
    if (mCursor < mView.size())
      return mView[mCursor];
    return std::nullopt;
  }

  [[nodiscard]] Page page(size_t pageSize) const noexcept
  {
    return paginate(pageSize, mView.size(), mView.empty() ? std::nullopt : std::optional<size_t> { mCursor });
  }

  /// Options visible on a page, labeled with their original index
  [[nodiscard]] std::vector<ListOption<std::string_view>> window(const Page& page) const
  {
    std::vector<ListOption<std::string_view>> options;
    options.reserve(page.mSize);
    for (size_t i = page.mStart; i < page.end(); ++i)
      options.emplace_back(mView[i], mStrings[mView[i]]);
    return options;
  }

  [[nodiscard]] const std::vector<T>& options() const noexcept { return mOptions; }
  [[nodiscard]] const std::vector<std::string>& strings() const noexcept { return mStrings; }
  [[nodiscard]] const std::vector<size_t>& view() const noexcept { return mView; }
  [[nodiscard]] size_t cursor() const noexcept { return mCursor; }

private:
  ActionResult setCursor(size_t cursor) noexcept
  {
    if (cursor == mCursor)
      return ActionResult::Clean;
    mCursor = cursor;
    return ActionResult::NeedsRedraw;
  }

  std::vector<T> mOptions;
  std::vector<std::string> mStrings;
  Scorer<T> mScorer;
  bool mResetCursor { true };
  std::vector<size_t> mView;
  size_t mCursor { 0 };
};

} // namespace ask
