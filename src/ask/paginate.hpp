// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <optional>

namespace ask {

/// Window of a list that fits on screen
struct Page
{
  size_t mStart { 0 };
  size_t mSize { 0 };
  size_t mTotal { 0 };
  /// Cursor position relative to mStart
  std::optional<size_t> mCursor;
  /// Window starts at the first item
  bool mFirst { true };
  /// Window ends at the last item
  bool mLast { true };

  [[nodiscard]] size_t end() const noexcept { return mStart + mSize; }
  [[nodiscard]] bool isCursor(size_t relative) const noexcept
  {
    return mCursor.has_value() && *mCursor == relative;
  }
};

/// Places a window of at most pageSize items over a list of total items so
/// that the selection stays visible. Near the edges the window is anchored to
/// the start or the end of the list, anywhere else it is centered.
[[nodiscard]] inline Page paginate(size_t pageSize, size_t total, std::optional<size_t> selection) noexcept
{
  const size_t sel = selection.value_or(0);
  size_t start = 0;
  size_t end = total;

  if (total <= pageSize) {
    // whole list fits
  } else if (sel < pageSize / 2) {
    end = pageSize;
  } else if (total - sel - 1 < pageSize / 2) {
    start = total - pageSize;
  } else {
    start = sel - pageSize / 2;
    end = start + pageSize;
  }

  Page page;
  page.mStart = start;
  page.mSize = end - start;
  page.mTotal = total;
  page.mFirst = start == 0;
  page.mLast = end == total;
  if (selection.has_value())
    page.mCursor = sel - start;
  return page;
}

} // namespace ask
