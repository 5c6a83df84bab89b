// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/prompts/date_select.hpp"

#include <utility>

#include "ask/macros.hpp"

namespace ask {

std::optional<DateSelectAction> DateSelectAction::fromKey(const Key& key, const DateSelectConfig& config)
{
  if (config.mVimMode && key.mCode == kChar && key.mMods == kNone) {
    switch (key.mChar) {
    case 'k': return DateSelectAction { kGoToPrevWeek };
    case 'j': return DateSelectAction { kGoToNextWeek };
    case 'h': return DateSelectAction { kGoToPrevDay };
    case 'l': return DateSelectAction { kGoToNextDay };
    default: break;
    }
  }

  const bool ctrl = key.has(kControl);
  switch (key.mCode) {
  case kLeft:
    return DateSelectAction { ctrl ? kGoToPrevMonth : kGoToPrevDay };
  case kRight:
    return DateSelectAction { ctrl ? kGoToNextMonth : kGoToNextDay };
  case kUp:
    return DateSelectAction { ctrl ? kGoToPrevYear : kGoToPrevWeek };
  case kDown:
    return DateSelectAction { ctrl ? kGoToNextYear : kGoToNextWeek };
  case kTab:
    return DateSelectAction { kGoToNextWeek };
  default:
    return std::nullopt;
  }
}

DateSelect::DateSelect(std::string message)
  : mMessage(std::move(message))
  , mRenderConfig(getRenderConfig())
{
}

DateSelect& DateSelect::withStartingDate(Date date)
{
  mStartingDate = date;
  return *this;
}

DateSelect& DateSelect::withMinDate(Date date)
{
  mMinDate = date;
  return *this;
}

DateSelect& DateSelect::withMaxDate(Date date)
{
  mMaxDate = date;
  return *this;
}

DateSelect& DateSelect::withWeekStart(Weekday day)
{
  mWeekStart = day;
  return *this;
}

DateSelect& DateSelect::withHelpMessage(std::string help)
{
  mHelpMessage = std::move(help);
  return *this;
}

DateSelect& DateSelect::withoutHelpMessage()
{
  mHelpMessage.reset();
  return *this;
}

DateSelect& DateSelect::withVimMode(bool enabled)
{
  mVimMode = enabled;
  return *this;
}

DateSelect& DateSelect::withFormatter(Formatter<Date> formatter)
{
  mFormatter = std::move(formatter);
  return *this;
}

DateSelect& DateSelect::withValidator(Validator<Date> validator)
{
  mValidators.push_back(std::move(validator));
  return *this;
}

DateSelect& DateSelect::withRenderConfig(RenderConfig config)
{
  mRenderConfig = std::move(config);
  return *this;
}

Date DateSelect::prompt()
{
  return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
}

std::optional<Date> DateSelect::promptSkippable()
{
  return skipOnCancel([this] { return prompt(); });
}

Date DateSelect::promptWith(Terminal& terminal)
{
  DateSelectPrompt state { *this };
  Backend backend { terminal, mRenderConfig };
  return runPrompt(state, backend);
}

DateSelectPrompt::DateSelectPrompt(const DateSelect& opts)
  : mMessage(opts.mMessage)
  , mConfig { opts.mVimMode }
  , mToday(Date::today())
  , mCurrent(opts.mStartingDate.value_or(mToday))
  , mMinDate(opts.mMinDate)
  , mMaxDate(opts.mMaxDate)
  , mWeekStart(opts.mWeekStart)
  , mHelpMessage(opts.mHelpMessage)
  , mFormatter(opts.mFormatter)
  , mValidators(opts.mValidators)
{
  if (!mCurrent.isValid())
    throw InvalidConfigurationError { "Starting date " + mCurrent.toString() + " does not exist" };
  if (mMinDate && *mMinDate > mCurrent)
    throw InvalidConfigurationError { "Min date can not be greater than starting date" };
  if (mMaxDate && *mMaxDate < mCurrent)
    throw InvalidConfigurationError { "Max date can not be smaller than starting date" };
}

ActionResult DateSelectPrompt::moveTo(Date date)
{
  if (mMinDate && date < *mMinDate)
    date = *mMinDate;
  if (mMaxDate && date > *mMaxDate)
    date = *mMaxDate;

  if (date == mCurrent)
    return ActionResult::Clean;
  mCurrent = date;
  return ActionResult::NeedsRedraw;
}

ActionResult DateSelectPrompt::handle(const DateSelectAction& action)
{
  switch (action.mKind) {
  case DateSelectAction::kGoToPrevDay:   return moveTo(mCurrent.addDays(-1));
  case DateSelectAction::kGoToNextDay:   return moveTo(mCurrent.addDays(1));
  case DateSelectAction::kGoToPrevWeek:  return moveTo(mCurrent.addDays(-7));
  case DateSelectAction::kGoToNextWeek:  return moveTo(mCurrent.addDays(7));
  case DateSelectAction::kGoToPrevMonth: return moveTo(mCurrent.addMonths(-1));
  case DateSelectAction::kGoToNextMonth: return moveTo(mCurrent.addMonths(1));
  case DateSelectAction::kGoToPrevYear:  return moveTo(mCurrent.addMonths(-12));
  case DateSelectAction::kGoToNextYear:  return moveTo(mCurrent.addMonths(12));
  }
  UNREACHABLE();
}

std::optional<Date> DateSelectPrompt::submit()
{
  if (auto error = runValidators(mValidators, mCurrent)) {
    mError = std::move(error);
    return std::nullopt;
  }
  return mCurrent;
}

void DateSelectPrompt::render(Backend& backend) const
{
  if (mError)
    backend.renderErrorMessage(*mError);

  backend.renderPrompt(mMessage);
  backend.renderCalendar(CalendarView {
    mCurrent.mMonth,
    mCurrent.mYear,
    mWeekStart,
    mToday,
    mCurrent,
    mMinDate,
    mMaxDate,
  });

  if (mHelpMessage)
    backend.renderHelpMessage(*mHelpMessage);
}

} // namespace ask
