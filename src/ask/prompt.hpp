// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

#include "ask/error.hpp"
#include "ask/input.hpp"
#include "ask/key.hpp"
#include "ask/term/tty.hpp"
#include "ask/ui/backend.hpp"

namespace ask {

enum class ActionResult : uint8_t {
  NeedsRedraw,
  Clean,
};

[[nodiscard]] constexpr ActionResult merge(ActionResult a, ActionResult b) noexcept
{
  return a == ActionResult::NeedsRedraw || b == ActionResult::NeedsRedraw
    ? ActionResult::NeedsRedraw
    : ActionResult::Clean;
}

[[nodiscard]] constexpr ActionResult toActionResult(InputActionResult r) noexcept
{
  return needsRedraw(r) ? ActionResult::NeedsRedraw : ActionResult::Clean;
}

/// Read-render-handle loop shared by all prompts.
///
/// A prompt state machine provides:
///   - `Answer`, `Action` and `Config` types,
///     with `static std::optional<Action> Action::fromKey(const Key&, const Config&)`
///   - `message()`, `config()`, `render(Backend&) const`,
///     `formatAnswer(const Answer&) const`
///   - `setup()`, run once before the first frame
///   - `preCancel()`, false to stay in the prompt after Esc
///   - `submit()`, no value to stay in the prompt (usually with an error set)
///   - `handle(const Action&)`
///
/// Ctrl-C throws InterruptedError, leaving the last frame as it is. Esc throws
/// CanceledError after replacing the frame with the canceled prompt.
template <typename P>
typename P::Answer runPrompt(P& prompt, Backend& backend)
{
  prompt.setup();

  ActionResult last = ActionResult::NeedsRedraw;
  for (;;) {
    if (last == ActionResult::NeedsRedraw) {
      backend.frameSetup();
      prompt.render(backend);
      backend.frameFinish();
      last = ActionResult::Clean;
    }

    const Key key = backend.readKey();

    if (key.mCode == kInterrupt)
      throw InterruptedError {};

    if (key.mCode == kCancel) {
      if (prompt.preCancel()) {
        backend.frameSetup();
        backend.renderCanceledPrompt(prompt.message());
        backend.frameFinish();
        throw CanceledError {};
      }
      last = ActionResult::NeedsRedraw;
      continue;
    }

    if (key.mCode == kSubmit) {
      if (std::optional<typename P::Answer> answer = prompt.submit()) {
        const auto formatted = prompt.formatAnswer(*answer);
        backend.frameSetup();
        backend.renderPromptWithAnswer(prompt.message(), formatted);
        backend.frameFinish();
        return std::move(*answer);
      }
      last = ActionResult::NeedsRedraw;
      continue;
    }

    if (auto action = P::Action::fromKey(key, prompt.config()))
      last = prompt.handle(*action);
  }
}

/// Runs f on the controlling terminal
template <typename F>
auto withTTY(F&& f)
{
  TTY tty;
  tty.open();
  return f(static_cast<Terminal&>(tty));
}

/// No value instead of CanceledError. Every other error is rethrown.
template <typename F>
auto skipOnCancel(F&& f) -> std::optional<std::decay_t<decltype(f())>>
{
  try {
    return f();
  } catch (const CanceledError&) {
    return std::nullopt;
  }
}

} // namespace ask
