// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/prompts/editor.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

#include "ask/error.hpp"

namespace ask {

namespace {

std::string tempDirectory()
{
  const char* dir = std::getenv("TMPDIR");
  if (dir == nullptr || *dir == '\0')
    return "/tmp";
  return dir;
}

std::string_view baseName(std::string_view path) noexcept
{
  const auto slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

TempFile::TempFile(std::string_view prefix, std::string_view extension)
{
  std::string path = tempDirectory();
  path.push_back('/');
  path.append(prefix);
  path.append("XXXXXXXXXX");
  path.append(extension);

  const int fd = mkstemps(path.data(), static_cast<int>(extension.size()));
  if (fd == -1)
    throw IOError::fromErrno("mkstemps");
  ::close(fd);
  mPath = std::move(path);
}

TempFile::~TempFile() noexcept
{
  if (!mPath.empty() && ::unlink(mPath.c_str()) == -1 && errno != ENOENT)
    perror("ask: unlink");
}

TempFile::TempFile(TempFile&& b) noexcept
  : mPath(std::exchange(b.mPath, {}))
{
}

TempFile& TempFile::operator=(TempFile&& b) noexcept
{
  if (this != &b) {
    TempFile tmp { std::move(*this) };
    mPath = std::exchange(b.mPath, {});
  }
  return *this;
}

void TempFile::write(std::string_view content)
{
  FILE* file = std::fopen(mPath.c_str(), "wb");
  if (file == nullptr)
    throw IOError::fromErrno("fopen");
  const size_t written = std::fwrite(content.data(), 1, content.size(), file);
  const bool failed = written != content.size();
  if (std::fclose(file) != 0 || failed)
    throw IOError { "failed to write " + mPath };
}

std::string TempFile::read() const
{
  FILE* file = std::fopen(mPath.c_str(), "rb");
  if (file == nullptr)
    throw IOError::fromErrno("fopen");

  std::string content;
  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0)
    content.append(buf, n);
  const bool failed = std::ferror(file) != 0;
  std::fclose(file);
  if (failed)
    throw IOError { "failed to read " + mPath };
  return content;
}

std::string defaultEditorCommand()
{
  std::string editor = kDefaultEditor;
  for (const char* var : { "EDITOR", "VISUAL" }) {
    const char* value = std::getenv(var);
    if (value != nullptr && *value != '\0')
      editor = value;
  }
  return editor;
}

void runEditor(const std::string& command, const std::vector<std::string>& args, const std::string& path)
{
  std::vector<char*> argv;
  argv.reserve(args.size() + 3);
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args)
    argv.push_back(const_cast<char*>(arg.c_str()));
  argv.push_back(const_cast<char*>(path.c_str()));
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0)
    throw IOError::fromErrno("fork");

  if (pid == 0) {
    // Input may be redirected, the editor needs the terminal
    const int tty = ::open("/dev/tty", O_RDWR);
    if (tty != -1) {
      ::dup2(tty, STDIN_FILENO);
      ::dup2(tty, STDOUT_FILENO);
      if (tty > STDERR_FILENO)
        ::close(tty);
    }
    execvp(argv[0], argv.data());
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      throw IOError::fromErrno("waitpid");
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 127)
    throw IOError { "failed to run editor " + command };
}

Editor::Editor(std::string message)
  : mMessage(std::move(message))
  , mCommand(defaultEditorCommand())
  , mRenderConfig(getRenderConfig())
{
}

Editor& Editor::withHelpMessage(std::string help)
{
  mHelpMessage = std::move(help);
  return *this;
}

Editor& Editor::withPredefinedText(std::string text)
{
  mPredefinedText = std::move(text);
  return *this;
}

Editor& Editor::withFileExtension(std::string extension)
{
  mFileExtension = std::move(extension);
  return *this;
}

Editor& Editor::withEditorCommand(std::string command)
{
  mCommand = std::move(command);
  return *this;
}

Editor& Editor::withArgs(std::vector<std::string> args)
{
  mArgs = std::move(args);
  return *this;
}

Editor& Editor::withFormatter(StringFormatter formatter)
{
  mFormatter = std::move(formatter);
  return *this;
}

Editor& Editor::withValidator(StringValidator validator)
{
  mValidators.push_back(std::move(validator));
  return *this;
}

Editor& Editor::withRenderConfig(RenderConfig config)
{
  mRenderConfig = std::move(config);
  return *this;
}

std::string Editor::prompt()
{
  return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
}

std::optional<std::string> Editor::promptSkippable()
{
  return skipOnCancel([this] { return prompt(); });
}

std::string Editor::promptWith(Terminal& terminal)
{
  EditorPrompt state { *this };
  Backend backend { terminal, mRenderConfig };
  return runPrompt(state, backend);
}

EditorPrompt::EditorPrompt(const Editor& opts)
  : mMessage(opts.mMessage)
  , mHelpMessage(opts.mHelpMessage)
  , mCommand(opts.mCommand)
  , mArgs(opts.mArgs)
  , mFormatter(opts.mFormatter)
  , mValidators(opts.mValidators)
  , mFile("tmp-", opts.mFileExtension)
{
  if (mCommand.empty())
    throw InvalidConfigurationError { "Editor command can not be empty" };
  if (opts.mPredefinedText)
    mFile.write(*opts.mPredefinedText);
}

ActionResult EditorPrompt::handle(const EditorAction& action)
{
  switch (action.mKind) {
  case EditorAction::kOpenEditor:
    runEditor(mCommand, mArgs, mFile.path());
    return ActionResult::NeedsRedraw;
  }
  return ActionResult::Clean;
}

std::optional<std::string> EditorPrompt::submit()
{
  std::string answer = mFile.read();
  if (!answer.empty() && answer.back() == '\n')
    answer.pop_back();
  if (!answer.empty() && answer.back() == '\r')
    answer.pop_back();

  if (auto error = runValidators(mValidators, answer)) {
    mError = std::move(error);
    return std::nullopt;
  }
  return answer;
}

void EditorPrompt::render(Backend& backend) const
{
  if (mError)
    backend.renderErrorMessage(*mError);

  backend.renderEditorPrompt(mMessage, baseName(mCommand));

  if (mHelpMessage)
    backend.renderHelpMessage(*mHelpMessage);
}

} // namespace ask
