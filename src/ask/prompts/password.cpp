// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/prompts/password.hpp"

#include <utility>

#include "ask/macros.hpp"

namespace ask {

std::optional<PasswordAction> PasswordAction::fromKey(const Key& key, const PasswordConfig& config)
{
  if (config.mEnableDisplayToggle && key.mCode == kChar && key.has(kControl)
      && (key.mChar == 'r' || key.mChar == 'R'))
    return PasswordAction { kToggleDisplayMode, {} };

  if (auto input = InputAction::fromKey(key))
    return PasswordAction { kValueInput, *input };
  return std::nullopt;
}

Password::Password(std::string message)
  : mMessage(std::move(message))
  , mRenderConfig(getRenderConfig())
{
}

Password& Password::withHelpMessage(std::string help)
{
  mHelpMessage = std::move(help);
  return *this;
}

Password& Password::withDisplayMode(PasswordDisplayMode mode)
{
  mDisplayMode = mode;
  return *this;
}

Password& Password::withDisplayToggleEnabled()
{
  mEnableDisplayToggle = true;
  return *this;
}

Password& Password::withoutConfirmation()
{
  mEnableConfirmation = false;
  return *this;
}

Password& Password::withCustomConfirmationMessage(std::string message)
{
  mConfirmationMessage = std::move(message);
  return *this;
}

Password& Password::withCustomConfirmationErrorMessage(std::string message)
{
  mConfirmationErrorMessage = std::move(message);
  return *this;
}

Password& Password::withFormatter(StringFormatter formatter)
{
  mFormatter = std::move(formatter);
  return *this;
}

Password& Password::withValidator(StringValidator validator)
{
  mValidators.push_back(std::move(validator));
  return *this;
}

Password& Password::withRenderConfig(RenderConfig config)
{
  mRenderConfig = std::move(config);
  return *this;
}

std::string Password::prompt()
{
  return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
}

std::optional<std::string> Password::promptSkippable()
{
  return skipOnCancel([this] { return prompt(); });
}

std::string Password::promptWith(Terminal& terminal)
{
  PasswordPrompt state { *this };
  Backend backend { terminal, mRenderConfig };
  return runPrompt(state, backend);
}

PasswordPrompt::PasswordPrompt(const Password& opts)
  : mMessage(opts.mMessage)
  , mConfig { opts.mEnableDisplayToggle, opts.mDisplayMode }
  , mHelpMessage(opts.mHelpMessage)
  , mEnableConfirmation(opts.mEnableConfirmation)
  , mConfirmationMessage(opts.mConfirmationMessage)
  , mConfirmationErrorMessage(opts.mConfirmationErrorMessage)
  , mMode(opts.mDisplayMode)
  , mFormatter(opts.mFormatter)
  , mValidators(opts.mValidators)
{
}

bool PasswordPrompt::preCancel()
{
  if (!mConfirming)
    return true;

  if (mMode == PasswordDisplayMode::Hidden)
    mInput.clear();
  mConfirmation.clear();
  mError.reset();
  mConfirming = false;
  return false;
}

std::optional<std::string> PasswordPrompt::submit()
{
  if (!mConfirming) {
    if (auto error = runValidators(mValidators, mInput.content())) {
      mError = std::move(error);
      return std::nullopt;
    }
    if (!mEnableConfirmation)
      return mInput.content();

    mConfirmation.clear();
    mError.reset();
    mConfirming = true;
    return std::nullopt;
  }

  if (mConfirmation.content() == mInput.content())
    return mConfirmation.content();

  // Back to the first answer, which is kept
  mConfirmation.clear();
  mError = ErrorMessage { mConfirmationErrorMessage };
  mConfirming = false;
  return std::nullopt;
}

ActionResult PasswordPrompt::handle(const PasswordAction& action)
{
  switch (action.mKind) {
  case PasswordAction::kValueInput:
    return toActionResult(activeInput().handle(action.mInput));
  case PasswordAction::kToggleDisplayMode: {
    const auto mode = mMode == PasswordDisplayMode::Full ? mConfig.mDisplayMode : PasswordDisplayMode::Full;
    if (mode == mMode)
      return ActionResult::Clean;
    mMode = mode;
    return ActionResult::NeedsRedraw;
  }
  }
  UNREACHABLE();
}

void PasswordPrompt::renderInput(Backend& backend, std::string_view prompt, const Input& input) const
{
  switch (mMode) {
  case PasswordDisplayMode::Hidden:
    backend.renderPrompt(prompt);
    break;
  case PasswordDisplayMode::Masked:
    backend.renderPromptWithMaskedInput(prompt, input);
    break;
  case PasswordDisplayMode::Full:
    backend.renderPromptWithInput(prompt, std::nullopt, input);
    break;
  }
}

void PasswordPrompt::render(Backend& backend) const
{
  if (mError)
    backend.renderErrorMessage(*mError);

  renderInput(backend, mMessage, mInput);
  if (mConfirming)
    renderInput(backend, mConfirmationMessage, mConfirmation);

  if (mHelpMessage)
    backend.renderHelpMessage(*mHelpMessage);
}

} // namespace ask
