// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ask/formatter.hpp"
#include "ask/input.hpp"
#include "ask/prompt.hpp"
#include "ask/render_config.hpp"
#include "ask/validator.hpp"

namespace ask {

enum class PasswordDisplayMode : uint8_t {
  /// Nothing is shown while typing
  Hidden,
  /// One mask glyph per character
  Masked,
  Full,
};

struct PasswordConfig
{
  bool mEnableDisplayToggle { false };
  PasswordDisplayMode mDisplayMode { PasswordDisplayMode::Hidden };
};

struct PasswordAction
{
  enum Kind : uint8_t { kValueInput, kToggleDisplayMode };

  Kind mKind { kValueInput };
  InputAction mInput;

  static std::optional<PasswordAction> fromKey(const Key& key, const PasswordConfig& config);
};

/// Secret text, typed twice unless confirmation is disabled
class Password
{
public:
  explicit Password(std::string message);

  Password& withHelpMessage(std::string help);
  Password& withDisplayMode(PasswordDisplayMode mode);
  /// Ctrl-R switches between the display mode and showing the full text
  Password& withDisplayToggleEnabled();
  Password& withoutConfirmation();
  Password& withCustomConfirmationMessage(std::string message);
  Password& withCustomConfirmationErrorMessage(std::string message);
  Password& withFormatter(StringFormatter formatter);
  Password& withValidator(StringValidator validator);
  Password& withRenderConfig(RenderConfig config);

  std::string prompt();
  std::optional<std::string> promptSkippable();
  std::string promptWith(Terminal& terminal);

private:
  friend class PasswordPrompt;

  std::string mMessage;
  std::optional<std::string> mHelpMessage;
  PasswordDisplayMode mDisplayMode { PasswordDisplayMode::Hidden };
  bool mEnableDisplayToggle { false };
  bool mEnableConfirmation { true };
  std::string mConfirmationMessage { "Confirmation:" };
  std::string mConfirmationErrorMessage { "The answers don't match." };
  StringFormatter mFormatter { [](const std::string&) { return std::string { "********" }; } };
  std::vector<StringValidator> mValidators;
  RenderConfig mRenderConfig;
};

class PasswordPrompt
{
public:
  using Answer = std::string;
  using Action = PasswordAction;
  using Config = PasswordConfig;

  explicit PasswordPrompt(const Password& opts);

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const PasswordConfig& config() const noexcept { return mConfig; }
  [[nodiscard]] std::string formatAnswer(const std::string& answer) const { return mFormatter(answer); }

  void setup() { }
  /// Esc while confirming goes back to the first input
  bool preCancel();
  std::optional<std::string> submit();
  ActionResult handle(const PasswordAction& action);
  void render(Backend& backend) const;

  [[nodiscard]] bool isConfirming() const noexcept { return mConfirming; }
  [[nodiscard]] PasswordDisplayMode displayMode() const noexcept { return mMode; }
  [[nodiscard]] const std::optional<ErrorMessage>& error() const noexcept { return mError; }

private:
  [[nodiscard]] Input& activeInput() noexcept { return mConfirming ? mConfirmation : mInput; }
  void renderInput(Backend& backend, std::string_view prompt, const Input& input) const;

  std::string mMessage;
  PasswordConfig mConfig;
  std::optional<std::string> mHelpMessage;
  Input mInput;
  Input mConfirmation;
  bool mEnableConfirmation { true };
  std::string mConfirmationMessage;
  std::string mConfirmationErrorMessage;
  bool mConfirming { false };
  PasswordDisplayMode mMode;
  StringFormatter mFormatter;
  std::vector<StringValidator> mValidators;
  std::optional<ErrorMessage> mError;
};

} // namespace ask
