// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace ask {

/// Number of decimal digits needed to print n
template <typename T>
[[nodiscard]] constexpr int intLog10(T n) noexcept
{
  static_assert(std::is_integral_v<T>);
  int digits = 1;
  while (n >= 10) {
    n /= 10;
    ++digits;
  }
  return digits;
}

/// 64-bit FNV-1a.
/// Only used to tell rendered rows apart, so it is not collision resistant.
struct Hasher
{
  static constexpr uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
  static constexpr uint64_t kPrime = 0x100000001b3ULL;

  constexpr void feed(uint8_t byte) noexcept
  {
    mState ^= byte;
    mState *= kPrime;
  }

  constexpr void feed(std::string_view s) noexcept
  {
    for (char ch : s)
      feed(static_cast<uint8_t>(ch));
  }

  template <typename T>
  constexpr void feedInt(T v) noexcept
  {
    static_assert(std::is_integral_v<T> || std::is_enum_v<T>);
    auto u = static_cast<uint64_t>(v);
    for (size_t i = 0; i < sizeof(T); ++i, u >>= 8)
      feed(static_cast<uint8_t>(u & 0xFF));
  }

  [[nodiscard]] constexpr uint64_t finish() const noexcept { return mState; }
  constexpr void reset() noexcept { mState = kOffsetBasis; }

private:
  uint64_t mState { kOffsetBasis };
};

} // namespace ask
