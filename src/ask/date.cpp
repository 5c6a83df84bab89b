// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/date.hpp"

#include <charconv>
#include <ctime>

#include <fmt/core.h>

#include "ask/error.hpp"

namespace ask {

std::string_view weekdayName(Weekday d) noexcept
{
  constexpr std::string_view kNames[] = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
  };
  return kNames[static_cast<int>(d)];
}

std::string_view monthName(unsigned month) noexcept
{
  constexpr std::string_view kNames[] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December",
  };
  return kNames[month - 1];
}

// Howard Hinnant's days_from_civil / civil_from_days

int64_t Date::toDays() const noexcept
{
  const int64_t y = static_cast<int64_t>(mYear) - (mMonth <= 2 ? 1 : 0);
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (mMonth > 2 ? mMonth - 3 : mMonth + 9) + 2) / 5 + mDay - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

Date Date::fromDays(int64_t days) noexcept
{
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const auto doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const auto y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
  return { y, m, d };
}

Date Date::today()
{
  const std::time_t now = std::time(nullptr);
  std::tm tm {};
  if (localtime_r(&now, &tm) == nullptr)
    throw IOError::fromErrno("localtime_r");
  return { tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday) };
}

std::optional<Date> Date::parse(std::string_view s)
{
  if (s.size() != 10 || s[4] != '-' || s[7] != '-')
    return std::nullopt;

  auto number = [&](size_t pos, size_t len, auto& out) {
    const char* end = s.data() + pos + len;
    auto [ptr, ec] = std::from_chars(s.data() + pos, end, out);
    return ec == std::errc {} && ptr == end;
  };

  Date date;
  if (!number(0, 4, date.mYear) || !number(5, 2, date.mMonth) || !number(8, 2, date.mDay))
    return std::nullopt;
  if (!date.isValid())
    return std::nullopt;
  return date;
}

Weekday Date::weekday() const noexcept
{
  // 1970-01-01 was a Thursday
  int64_t wd = (toDays() + 3) % 7;
  if (wd < 0)
    wd += 7;
  return static_cast<Weekday>(wd);
}

Date Date::addDays(int64_t days) const noexcept
{
  return fromDays(toDays() + days);
}

Date Date::addMonths(int months) const noexcept
{
  const int64_t total = static_cast<int64_t>(mYear) * 12 + static_cast<int64_t>(mMonth) - 1 + months;
  int64_t year = total / 12;
  int64_t month0 = total % 12;
  if (month0 < 0) {
    month0 += 12;
    --year;
  }
  const auto y = static_cast<int>(year);
  const auto m = static_cast<unsigned>(month0 + 1);
  const unsigned last = daysInMonth(y, m);
  return { y, m, mDay > last ? last : mDay };
}

std::string Date::format(const char* fmt) const
{
  std::tm tm {};
  tm.tm_year = mYear - 1900;
  tm.tm_mon = static_cast<int>(mMonth) - 1;
  tm.tm_mday = static_cast<int>(mDay);
  tm.tm_wday = (static_cast<int>(weekday()) + 1) % 7;
  tm.tm_yday = static_cast<int>(toDays() - Date { mYear, 1, 1 }.toDays());

  char buf[256];
  const size_t len = std::strftime(buf, sizeof(buf), fmt, &tm);
  return { buf, len };
}

std::string Date::toString() const
{
  return fmt::format("{:04}-{:02}-{:02}", mYear, mMonth, mDay);
}

} // namespace ask
