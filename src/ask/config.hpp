// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstdint>

namespace ask {

/// Number of list rows shown at once by list-based prompts.
static constexpr auto kDefaultPageSize = 7;

/// Whether h/j/k/l navigation is enabled when a prompt does not say otherwise.
static constexpr bool kDefaultVimMode = false;

/// Terminal size assumed when the real size cannot be queried.
/// Large enough that nothing ever wraps.
static constexpr uint16_t kFallbackTerminalWidth = 1000;
static constexpr uint16_t kFallbackTerminalHeight = 1000;

/// Editor spawned when neither EDITOR nor VISUAL is set.
static constexpr const char* kDefaultEditor = "nano";

/// Extension of the temporary file handed to the editor.
static constexpr const char* kDefaultFileExtension = ".txt";

} // namespace ask
