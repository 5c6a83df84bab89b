// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/ui/backend.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

#include "ask/strings.hpp"
#include "ask/unicode.hpp"
#include "ask/util.hpp"

using namespace std::string_view_literals;

namespace ask {

Backend::Backend(Terminal& terminal, RenderConfig config)
  : mConfig(std::move(config))
  , mRenderer(terminal)
{
}

void Backend::newLine()
{
  mRenderer.write("\n"sv);
}

void Backend::printPromptWithPrefix(const Styled& prefix, std::string_view prompt)
{
  mRenderer.writeStyled(prefix);
  mRenderer.write(" "sv);
  mRenderer.writeStyled({ prompt, mConfig.mPrompt });
}

void Backend::printInput(const Input& input)
{
  mRenderer.write(" "sv);
  mRenderer.markCursor(unicode::width(input.preCursor()));

  if (input.isEmpty()) {
    if (input.placeholder() && !input.placeholder()->empty())
      mRenderer.writeStyled({ *input.placeholder(), mConfig.mPlaceholder });
  } else {
    mRenderer.writeStyled({ input.content(), mConfig.mTextInput });
  }

  // The cursor needs a cell to sit on at the end of the input
  if (input.cursor() == input.length())
    mRenderer.write(" "sv);
}

void Backend::renderCanceledPrompt(std::string_view prompt)
{
  printPromptWithPrefix(mConfig.mPromptPrefix, prompt);
  mRenderer.write(" "sv);
  mRenderer.writeStyled(mConfig.mCanceledPromptIndicator);
  newLine();
}

void Backend::renderPromptWithAnswer(std::string_view prompt, std::string_view answer)
{
  printPromptWithPrefix(mConfig.mAnsweredPromptPrefix, prompt);
  mRenderer.write(" "sv);
  mRenderer.writeStyled({ answer, mConfig.mAnswer });
  newLine();
}

void Backend::renderErrorMessage(const ErrorMessage& error)
{
  const auto& cfg = mConfig.mErrorMessage;
  mRenderer.writeStyled(cfg.mPrefix);
  mRenderer.writeStyled({ " "sv, cfg.mSeparator });
  mRenderer.writeStyled({ error.mCustom ? *error.mCustom : cfg.mDefaultMessage, cfg.mMessage });
  newLine();
}

void Backend::renderHelpMessage(std::string_view help)
{
  mRenderer.writeStyled({ "["sv, mConfig.mHelpMessage });
  mRenderer.writeStyled({ help, mConfig.mHelpMessage });
  mRenderer.writeStyled({ "]"sv, mConfig.mHelpMessage });
  newLine();
}

void Backend::renderPrompt(std::string_view prompt)
{
  printPromptWithPrefix(mConfig.mPromptPrefix, prompt);
  newLine();
}

void Backend::renderPromptWithInput(
  std::string_view prompt, std::optional<std::string_view> defaultValue, const Input& input)
{
  printPromptWithPrefix(mConfig.mPromptPrefix, prompt);
  if (defaultValue) {
    mRenderer.write(" "sv);
    mRenderer.writeStyled({ fmt::format("({})", *defaultValue), mConfig.mDefaultValue });
  }
  printInput(input);
  newLine();
}

void Backend::renderPromptWithMaskedInput(std::string_view prompt, const Input& input)
{
  std::string masked;
  for (size_t i = 0; i < input.length(); ++i)
    encodeUtf8(mConfig.mPasswordMask, masked);
  Input maskedInput { std::move(masked) };
  maskedInput.withCursor(input.cursor());
  renderPromptWithInput(prompt, std::nullopt, maskedInput);
}

void Backend::renderSelectPrompt(std::string_view prompt, const Input* filter)
{
  if (filter != nullptr) {
    renderPromptWithInput(prompt, std::nullopt, *filter);
  } else {
    printPromptWithPrefix(mConfig.mPromptPrefix, prompt);
    newLine();
  }
}

void Backend::printOptionPrefix(size_t relative, const Page& page, size_t pageLength)
{
  if (page.isCursor(relative))
    mRenderer.writeStyled(mConfig.mHighlightedOptionPrefix);
  else if (relative == 0 && !page.mFirst)
    mRenderer.writeStyled(mConfig.mScrollUpPrefix);
  else if (relative + 1 == pageLength && !page.mLast)
    mRenderer.writeStyled(mConfig.mScrollDownPrefix);
  else
    mRenderer.write(" "sv);
}

void Backend::printOptionValue(size_t relative, std::string_view value, const Page& page)
{
  StyleSheet style = mConfig.mOption;
  if (mConfig.mSelectedOption && page.isCursor(relative))
    style = *mConfig.mSelectedOption;
  mRenderer.writeStyled({ value, style });
}

void Backend::printIndexPrefix(size_t index, size_t total)
{
  const size_t number = index + 1;
  const int width = intLog10(total + 1);

  std::string prefix;
  switch (mConfig.mOptionIndexPrefix) {
  case IndexPrefix::None:
    return;
  case IndexPrefix::Simple:
    prefix = fmt::format("{})", number);
    break;
  case IndexPrefix::SpacePadded:
    prefix = fmt::format("{:{}})", number, width);
    break;
  case IndexPrefix::ZeroPadded:
    prefix = fmt::format("{:0{}})", number, width);
    break;
  }

  mRenderer.writeStyled({ std::move(prefix), mConfig.mOption });
  mRenderer.write(" "sv);
}

void Backend::renderSuggestions(const Page& page, const std::vector<ListOption<std::string_view>>& options)
{
  for (size_t i = 0; i < options.size(); ++i) {
    printOptionPrefix(i, page, options.size());
    mRenderer.write(" "sv);
    printOptionValue(i, options[i].mValue, page);
    newLine();
  }
}

void Backend::renderOptions(
  const Page& page,
  const std::vector<ListOption<std::string_view>>& options,
  const std::vector<bool>* checked)
{
  for (size_t i = 0; i < options.size(); ++i) {
    const auto& option = options[i];

    printOptionPrefix(i, page, options.size());
    mRenderer.write(" "sv);
    printIndexPrefix(option.mIndex, page.mTotal);

    if (checked != nullptr) {
      Styled checkbox = (*checked)[option.mIndex] ? mConfig.mSelectedCheckbox : mConfig.mUnselectedCheckbox;
      if (mConfig.mSelectedOption && page.isCursor(i))
        checkbox.mStyle = *mConfig.mSelectedOption;
      mRenderer.writeStyled(checkbox);
      mRenderer.write(" "sv);
    }

    printOptionValue(i, option.mValue, page);
    newLine();
  }
}

void Backend::renderCountedOptions(
  const Page& page,
  const std::vector<ListOption<std::string_view>>& options,
  const std::vector<uint32_t>& counts)
{
  uint32_t widest = 0;
  for (const auto& option : options)
    widest = std::max(widest, counts[option.mIndex]);
  const int digits = intLog10(widest);

  for (size_t i = 0; i < options.size(); ++i) {
    const auto& option = options[i];
    const uint32_t count = counts[option.mIndex];

    printOptionPrefix(i, page, options.size());
    mRenderer.write(" "sv);
    printIndexPrefix(option.mIndex, page.mTotal);

    StyleSheet style = count > 0 ? mConfig.mSelectedCheckbox.mStyle : mConfig.mUnselectedCheckbox.mStyle;
    if (mConfig.mSelectedOption && page.isCursor(i))
      style = *mConfig.mSelectedOption;
    mRenderer.writeStyled({ fmt::format("[{:>{}}]", count, digits), style });
    mRenderer.write(" "sv);

    printOptionValue(i, option.mValue, page);
    newLine();
  }
}

void Backend::renderEditorPrompt(std::string_view prompt, std::string_view editor)
{
  printPromptWithPrefix(mConfig.mPromptPrefix, prompt);
  mRenderer.write(" "sv);
  mRenderer.writeStyled({ fmt::format("[(e) to open {}, (enter) to submit]", editor), mConfig.mEditorPrompt });
  newLine();
}

void Backend::renderCalendar(const CalendarView& view)
{
  const auto& cfg = mConfig.mCalendar;
  auto writePrefix = [&] {
    mRenderer.writeStyled(cfg.mPrefix);
    mRenderer.write(" "sv);
  };

  const auto header = fmt::format("{} {}", toLower(monthName(view.mMonth)), view.mYear);
  writePrefix();
  mRenderer.writeStyled({ fmt::format("{:^20}", header), cfg.mHeader });
  newLine();

  std::string weekHeader;
  Weekday day = view.mWeekStart;
  for (int i = 0; i < 7; ++i, day = nextWeekday(day)) {
    if (i > 0)
      weekHeader.push_back(' ');
    weekHeader.append(toLower(weekdayName(day).substr(0, 2)));
  }
  writePrefix();
  mRenderer.writeStyled({ std::move(weekHeader), cfg.mWeekHeader });
  newLine();

  // The first row starts in the previous month, a whole week earlier when
  // the month begins on the first day of the week
  Date date { view.mYear, view.mMonth, 1 };
  if (date.weekday() == view.mWeekStart) {
    date = date.addDays(-7);
  } else {
    while (date.weekday() != view.mWeekStart)
      date = date.addDays(-1);
  }

  for (int week = 0; week < 6; ++week) {
    writePrefix();
    for (int i = 0; i < 7; ++i) {
      if (i > 0)
        mRenderer.write(" "sv);

      StyleSheet style;
      if (date == view.mSelected) {
        mRenderer.markCursor(date.mDay < 10 ? 1 : 0);
        if (cfg.mSelectedDate)
          style = *cfg.mSelectedDate;
      } else if (date == view.mToday) {
        style = cfg.mTodayDate;
      } else if (date.mMonth != view.mMonth) {
        style = cfg.mDifferentMonthDate;
      }

      if ((view.mMinDate && date < *view.mMinDate) || (view.mMaxDate && date > *view.mMaxDate))
        style = cfg.mUnavailableDate;

      mRenderer.writeStyled({ fmt::format("{:2}", date.mDay), style });
      date = date.addDays(1);
    }
    newLine();
  }
}

} // namespace ask
