// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ask/style.hpp"

namespace ask {

/// How list options are numbered
enum class IndexPrefix : uint8_t {
  None,
  /// `1)`, `2)`, ..., `10)`
  Simple,
  /// ` 1)`, ` 2)`, ..., `10)`
  SpacePadded,
  /// `01)`, `02)`, ..., `10)`
  ZeroPadded,
};

struct ErrorMessageRenderConfig
{
  Styled mPrefix;
  StyleSheet mSeparator;
  StyleSheet mMessage;
  /// Shown when a validator fails without a message of its own
  std::string mDefaultMessage;
};

struct CalendarRenderConfig
{
  Styled mPrefix;
  StyleSheet mHeader;
  StyleSheet mWeekHeader;
  std::optional<StyleSheet> mSelectedDate;
  StyleSheet mTodayDate;
  StyleSheet mDifferentMonthDate;
  StyleSheet mUnavailableDate;
};

/// Glyphs and styles of every piece of a prompt
struct RenderConfig
{
  Styled mPromptPrefix;
  Styled mAnsweredPromptPrefix;
  StyleSheet mPrompt;
  StyleSheet mDefaultValue;
  StyleSheet mPlaceholder;
  StyleSheet mHelpMessage;
  StyleSheet mTextInput;
  ErrorMessageRenderConfig mErrorMessage;
  char32_t mPasswordMask { '*' };
  StyleSheet mAnswer;
  Styled mCanceledPromptIndicator;
  Styled mHighlightedOptionPrefix;
  Styled mScrollUpPrefix;
  Styled mScrollDownPrefix;
  Styled mSelectedCheckbox;
  Styled mUnselectedCheckbox;
  IndexPrefix mOptionIndexPrefix { IndexPrefix::None };
  StyleSheet mOption;
  std::optional<StyleSheet> mSelectedOption;
  StyleSheet mEditorPrompt;
  CalendarRenderConfig mCalendar;

  /// Plain glyphs, no colors
  static RenderConfig empty();
  static RenderConfig defaultColored();
};

/// Process wide default picked up by prompts when they are constructed.
/// Initialized on first use: empty() if NO_COLOR is set, defaultColored() otherwise.
RenderConfig getRenderConfig();
void setRenderConfig(RenderConfig config);

} // namespace ask
