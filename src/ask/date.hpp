// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ask {

enum class Weekday : uint8_t {
  Monday,
  Tuesday,
  Wednesday,
  Thursday,
  Friday,
  Saturday,
  Sunday,
};

[[nodiscard]] constexpr Weekday nextWeekday(Weekday d) noexcept
{
  return static_cast<Weekday>((static_cast<int>(d) + 1) % 7);
}

/// English name, e.g. "Monday"
[[nodiscard]] std::string_view weekdayName(Weekday d) noexcept;
/// English name of a month numbered from 1
[[nodiscard]] std::string_view monthName(unsigned month) noexcept;

[[nodiscard]] constexpr bool isLeapYear(int year) noexcept
{
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] constexpr unsigned daysInMonth(int year, unsigned month) noexcept
{
  constexpr unsigned kDays[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
  if (month == 2 && isLeapYear(year))
    return 29;
  return kDays[month - 1];
}

/// Day of the proleptic Gregorian calendar
struct Date
{
  int mYear { 1970 };
  unsigned mMonth { 1 };
  unsigned mDay { 1 };

  constexpr Date() = default;
  constexpr Date(int year, unsigned month, unsigned day) noexcept
    : mYear(year), mMonth(month), mDay(day) { }

  /// Local date of the system clock
  static Date today();
  /// Days since 1970-01-01
  static Date fromDays(int64_t days) noexcept;
  /// Parses YYYY-MM-DD
  static std::optional<Date> parse(std::string_view s);

  [[nodiscard]] constexpr bool isValid() const noexcept
  {
    return mMonth >= 1 && mMonth <= 12 && mDay >= 1 && mDay <= daysInMonth(mYear, mMonth);
  }

  [[nodiscard]] int64_t toDays() const noexcept;
  [[nodiscard]] Weekday weekday() const noexcept;

  [[nodiscard]] Date addDays(int64_t days) const noexcept;
  /// Keeps the day of the month, or uses the last day when the target month is shorter
  [[nodiscard]] Date addMonths(int months) const noexcept;
  [[nodiscard]] Date firstOfMonth() const noexcept { return { mYear, mMonth, 1 }; }

  /// strftime format
  [[nodiscard]] std::string format(const char* fmt) const;
  /// YYYY-MM-DD
  [[nodiscard]] std::string toString() const;

  constexpr bool operator==(const Date& b) const noexcept
  {
    return mYear == b.mYear && mMonth == b.mMonth && mDay == b.mDay;
  }
  constexpr bool operator!=(const Date& b) const noexcept { return !(*this == b); }
  constexpr bool operator<(const Date& b) const noexcept
  {
    if (mYear != b.mYear)
      return mYear < b.mYear;
    if (mMonth != b.mMonth)
      return mMonth < b.mMonth;
    return mDay < b.mDay;
  }
  constexpr bool operator>(const Date& b) const noexcept { return b < *this; }
  constexpr bool operator<=(const Date& b) const noexcept { return !(b < *this); }
  constexpr bool operator>=(const Date& b) const noexcept { return !(*this < b); }
};

} // namespace ask
