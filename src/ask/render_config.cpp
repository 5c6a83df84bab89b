// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/render_config.hpp"

#include <cstdlib>
#include <mutex>
#include <utility>

namespace ask {

using namespace colors;

RenderConfig RenderConfig::empty()
{
  RenderConfig r;
  r.mPromptPrefix = Styled { "?" };
  r.mAnsweredPromptPrefix = Styled { "?" };
  r.mErrorMessage = { Styled { "#" }, {}, {}, "Invalid input." };
  r.mPasswordMask = '*';
  r.mCanceledPromptIndicator = Styled { "<canceled>" };
  r.mHighlightedOptionPrefix = Styled { ">" };
  r.mScrollUpPrefix = Styled { "^" };
  r.mScrollDownPrefix = Styled { "v" };
  r.mSelectedCheckbox = Styled { "[x]" };
  r.mUnselectedCheckbox = Styled { "[ ]" };
  r.mOptionIndexPrefix = IndexPrefix::None;
  r.mSelectedOption = std::nullopt;
  r.mCalendar.mPrefix = Styled { ">" };
  r.mCalendar.mSelectedDate = std::nullopt;
  return r;
}

RenderConfig RenderConfig::defaultColored()
{
  RenderConfig r = empty();
  r.mPromptPrefix = Styled { "?", StyleSheet{}.withFg(kLightGreen) };
  r.mAnsweredPromptPrefix = Styled { ">", StyleSheet{}.withFg(kLightGreen) };
  r.mPlaceholder = StyleSheet{}.withFg(kDarkGrey);
  r.mHelpMessage = StyleSheet{}.withFg(kLightCyan);
  r.mErrorMessage.mPrefix = Styled { "#", StyleSheet{}.withFg(kLightRed) };
  r.mErrorMessage.mMessage = StyleSheet{}.withFg(kLightRed);
  r.mAnswer = StyleSheet{}.withFg(kLightCyan);
  r.mCanceledPromptIndicator = Styled { "<canceled>", StyleSheet{}.withFg(kDarkRed) };
  r.mHighlightedOptionPrefix = Styled { ">", StyleSheet{}.withFg(kLightCyan) };
  r.mSelectedCheckbox = Styled { "[x]", StyleSheet{}.withFg(kLightGreen) };
  r.mSelectedOption = StyleSheet{}.withFg(kLightCyan);
  r.mEditorPrompt = StyleSheet{}.withFg(kDarkCyan);

  r.mCalendar.mPrefix = Styled { ">", StyleSheet{}.withFg(kLightGreen) };
  r.mCalendar.mSelectedDate = StyleSheet{}.withFg(kBlack).withBg(kGrey);
  r.mCalendar.mTodayDate = StyleSheet{}.withFg(kLightGreen);
  r.mCalendar.mDifferentMonthDate = StyleSheet{}.withFg(kDarkGrey);
  r.mCalendar.mUnavailableDate = StyleSheet{}.withFg(kDarkGrey);
  return r;
}

namespace {

std::mutex gMutex;
std::optional<RenderConfig> gConfig;

RenderConfig fromEnvironment()
{
  const char* noColor = std::getenv("NO_COLOR");
  if (noColor != nullptr && *noColor != '\0')
    return RenderConfig::empty();
  return RenderConfig::defaultColored();
}

} // namespace

RenderConfig getRenderConfig()
{
  std::unique_lock lk { gMutex };
  if (!gConfig)
    gConfig = fromEnvironment();
  return *gConfig;
}

void setRenderConfig(RenderConfig config)
{
  std::unique_lock lk { gMutex };
  gConfig = std::move(config);
}

} // namespace ask
