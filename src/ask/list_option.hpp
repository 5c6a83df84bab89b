// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

namespace ask {

/// Value picked from a list together with its position in the list the prompt was given
template <typename T>
struct ListOption
{
  size_t mIndex { 0 };
  T mValue {};

  ListOption() = default;
  ListOption(size_t index, T value) : mIndex(index), mValue(std::move(value)) { }

  bool operator==(const ListOption& b) const { return mIndex == b.mIndex && mValue == b.mValue; }
  bool operator!=(const ListOption& b) const { return !(*this == b); }
};

/// Option picked a number of times
template <typename T>
struct CountedListOption
{
  uint32_t mCount { 0 };
  ListOption<T> mOption;

  CountedListOption() = default;
  CountedListOption(uint32_t count, ListOption<T> option) : mCount(count), mOption(std::move(option)) { }

  bool operator==(const CountedListOption& b) const { return mCount == b.mCount && mOption == b.mOption; }
  bool operator!=(const CountedListOption& b) const { return !(*this == b); }
};

} // namespace ask
