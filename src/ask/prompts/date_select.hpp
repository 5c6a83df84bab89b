// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ask/config.hpp"
#include "ask/date.hpp"
#include "ask/formatter.hpp"
#include "ask/prompt.hpp"
#include "ask/render_config.hpp"
#include "ask/validator.hpp"

namespace ask {

struct DateSelectConfig
{
  bool mVimMode { kDefaultVimMode };
};

struct DateSelectAction
{
  enum Kind : uint8_t {
    kGoToPrevDay,
    kGoToNextDay,
    kGoToPrevWeek,
    kGoToNextWeek,
    kGoToPrevMonth,
    kGoToNextMonth,
    kGoToPrevYear,
    kGoToNextYear,
  };

  Kind mKind { kGoToNextDay };

  static std::optional<DateSelectAction> fromKey(const Key& key, const DateSelectConfig& config);
};

/// Pick a day on a calendar
class DateSelect
{
public:
  static constexpr const char* kDefaultHelpMessage =
    "arrows to move, with ctrl to move months and years, enter to select";

  explicit DateSelect(std::string message);

  /// Defaults to today
  DateSelect& withStartingDate(Date date);
  DateSelect& withMinDate(Date date);
  DateSelect& withMaxDate(Date date);
  /// First column of the calendar
  DateSelect& withWeekStart(Weekday day);
  DateSelect& withHelpMessage(std::string help);
  DateSelect& withoutHelpMessage();
  DateSelect& withVimMode(bool enabled);
  DateSelect& withFormatter(Formatter<Date> formatter);
  DateSelect& withValidator(Validator<Date> validator);
  DateSelect& withRenderConfig(RenderConfig config);

  Date prompt();
  std::optional<Date> promptSkippable();
  Date promptWith(Terminal& terminal);

private:
  friend class DateSelectPrompt;

  std::string mMessage;
  std::optional<Date> mStartingDate;
  std::optional<Date> mMinDate;
  std::optional<Date> mMaxDate;
  Weekday mWeekStart { Weekday::Sunday };
  std::optional<std::string> mHelpMessage { kDefaultHelpMessage };
  bool mVimMode { kDefaultVimMode };
  Formatter<Date> mFormatter { formatDate };
  std::vector<Validator<Date>> mValidators;
  RenderConfig mRenderConfig;
};

class DateSelectPrompt
{
public:
  using Answer = Date;
  using Action = DateSelectAction;
  using Config = DateSelectConfig;

  /// Throws InvalidConfigurationError when the starting date is outside [min, max]
  explicit DateSelectPrompt(const DateSelect& opts);

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const DateSelectConfig& config() const noexcept { return mConfig; }
  [[nodiscard]] std::string formatAnswer(const Date& answer) const { return mFormatter(answer); }

  void setup() { }
  bool preCancel() noexcept { return true; }
  std::optional<Date> submit();
  ActionResult handle(const DateSelectAction& action);
  void render(Backend& backend) const;

  [[nodiscard]] const Date& current() const noexcept { return mCurrent; }

private:
  ActionResult moveTo(Date date);

  std::string mMessage;
  DateSelectConfig mConfig;
  Date mToday;
  Date mCurrent;
  std::optional<Date> mMinDate;
  std::optional<Date> mMaxDate;
  Weekday mWeekStart;
  std::optional<std::string> mHelpMessage;
  Formatter<Date> mFormatter;
  std::vector<Validator<Date>> mValidators;
  std::optional<ErrorMessage> mError;
};

} // namespace ask
