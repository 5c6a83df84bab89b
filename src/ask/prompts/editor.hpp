// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ask/config.hpp"
#include "ask/formatter.hpp"
#include "ask/prompt.hpp"
#include "ask/render_config.hpp"
#include "ask/validator.hpp"

namespace ask {

/// Uniquely named file in the temporary directory, removed on destruction
class TempFile
{
public:
  /// Throws IOError
  TempFile(std::string_view prefix, std::string_view extension);
  ~TempFile() noexcept;

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile(TempFile&& b) noexcept;
  TempFile& operator=(TempFile&& b) noexcept;

  void write(std::string_view content);
  [[nodiscard]] std::string read() const;

  [[nodiscard]] const std::string& path() const noexcept { return mPath; }

private:
  std::string mPath;
};

/// EDITOR or VISUAL, the latter winning when both are set, or kDefaultEditor
[[nodiscard]] std::string defaultEditorCommand();

/// Runs `command args... path` on the terminal and waits for it to exit.
/// Throws IOError when the command can't be started.
void runEditor(const std::string& command, const std::vector<std::string>& args, const std::string& path);

struct EditorConfig { };

struct EditorAction
{
  enum Kind : uint8_t { kOpenEditor };

  Kind mKind { kOpenEditor };

  static std::optional<EditorAction> fromKey(const Key& key, const EditorConfig&)
  {
    if (key.isChar('e'))
      return EditorAction { kOpenEditor };
    return std::nullopt;
  }
};

/// Multi-line text written in an external editor
class Editor
{
public:
  explicit Editor(std::string message);

  Editor& withHelpMessage(std::string help);
  /// Initial content of the file
  Editor& withPredefinedText(std::string text);
  Editor& withFileExtension(std::string extension);
  Editor& withEditorCommand(std::string command);
  /// Passed before the file path
  Editor& withArgs(std::vector<std::string> args);
  Editor& withFormatter(StringFormatter formatter);
  Editor& withValidator(StringValidator validator);
  Editor& withRenderConfig(RenderConfig config);

  std::string prompt();
  std::optional<std::string> promptSkippable();
  std::string promptWith(Terminal& terminal);

private:
  friend class EditorPrompt;

  std::string mMessage;
  std::optional<std::string> mHelpMessage;
  std::optional<std::string> mPredefinedText;
  std::string mFileExtension { kDefaultFileExtension };
  std::string mCommand;
  std::vector<std::string> mArgs;
  StringFormatter mFormatter { [](const std::string&) { return std::string { "<received>" }; } };
  std::vector<StringValidator> mValidators;
  RenderConfig mRenderConfig;
};

class EditorPrompt
{
public:
  using Answer = std::string;
  using Action = EditorAction;
  using Config = EditorConfig;

  /// Creates the temporary file, which lives as long as the prompt
  explicit EditorPrompt(const Editor& opts);

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const EditorConfig& config() const noexcept { return mConfig; }
  [[nodiscard]] std::string formatAnswer(const std::string& answer) const { return mFormatter(answer); }

  void setup() { }
  bool preCancel() noexcept { return true; }
  std::optional<std::string> submit();
  ActionResult handle(const EditorAction& action);
  void render(Backend& backend) const;

  [[nodiscard]] const TempFile& file() const noexcept { return mFile; }

private:
  std::string mMessage;
  EditorConfig mConfig;
  std::optional<std::string> mHelpMessage;
  std::string mCommand;
  std::vector<std::string> mArgs;
  StringFormatter mFormatter;
  std::vector<StringValidator> mValidators;
  TempFile mFile;
  std::optional<ErrorMessage> mError;
};

} // namespace ask
