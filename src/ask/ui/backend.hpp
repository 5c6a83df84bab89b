// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "ask/date.hpp"
#include "ask/input.hpp"
#include "ask/list_option.hpp"
#include "ask/paginate.hpp"
#include "ask/render_config.hpp"
#include "ask/term/terminal.hpp"
#include "ask/ui/frame_renderer.hpp"
#include "ask/validator.hpp"

namespace ask {

/// Everything the date prompt needs to draw a month
struct CalendarView
{
  unsigned mMonth { 1 };
  int mYear { 1970 };
  Weekday mWeekStart { Weekday::Sunday };
  Date mToday;
  Date mSelected;
  std::optional<Date> mMinDate;
  std::optional<Date> mMaxDate;
};

/// Prompt building blocks drawn into frames with the given render config
class Backend
{
public:
  Backend(Terminal& terminal, RenderConfig config);

  Key readKey() { return mRenderer.terminal().readKey(); }

  void frameSetup() { mRenderer.startFrame(); }
  void frameFinish() { mRenderer.finishFrame(); }

  void renderCanceledPrompt(std::string_view prompt);
  void renderPromptWithAnswer(std::string_view prompt, std::string_view answer);
  void renderErrorMessage(const ErrorMessage& error);
  void renderHelpMessage(std::string_view help);

  /// Prompt alone on its line
  void renderPrompt(std::string_view prompt);
  /// Prompt, default value in parentheses and the text being typed
  void renderPromptWithInput(std::string_view prompt, std::optional<std::string_view> defaultValue, const Input& input);
  /// Prompt with one mask glyph per grapheme of the input
  void renderPromptWithMaskedInput(std::string_view prompt, const Input& input);
  /// Prompt followed by the filter input when there is one
  void renderSelectPrompt(std::string_view prompt, const Input* filter);

  void renderSuggestions(const Page& page, const std::vector<ListOption<std::string_view>>& options);
  /// With `checked` the options get checkboxes, indexed by the original option index
  void renderOptions(
    const Page& page,
    const std::vector<ListOption<std::string_view>>& options,
    const std::vector<bool>* checked = nullptr);

  /// Options with the number of times each was picked, indexed by the original option index
  void renderCountedOptions(
    const Page& page,
    const std::vector<ListOption<std::string_view>>& options,
    const std::vector<uint32_t>& counts);

  void renderEditorPrompt(std::string_view prompt, std::string_view editor);
  void renderCalendar(const CalendarView& view);

  [[nodiscard]] const RenderConfig& config() const noexcept { return mConfig; }

private:
  void printPromptWithPrefix(const Styled& prefix, std::string_view prompt);
  void printInput(const Input& input);
  void printOptionPrefix(size_t relative, const Page& page, size_t pageLength);
  void printOptionValue(size_t relative, std::string_view value, const Page& page);
  void printIndexPrefix(size_t index, size_t total);
  void newLine();

  RenderConfig mConfig;
  FrameRenderer mRenderer;
};

} // namespace ask
