// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/prompts/path_select.hpp"

#include <algorithm>
#include <system_error>
#include <tuple>
#include <utility>

#include "ask/error.hpp"
#include "ask/strings.hpp"

namespace ask {

namespace fs = std::filesystem;

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
  return a.size() == b.size() && toLower(a) == toLower(b);
}

std::string extensionOf(const fs::path& path)
{
  std::string ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.')
    ext.erase(0, 1);
  return ext;
}

fs::path startDirectory(const std::optional<fs::path>& start)
{
  std::error_code ec;
  fs::path path;
  if (start) {
    path = fs::absolute(*start, ec);
    if (ec)
      path = *start;
  } else {
    path = fs::current_path(ec);
    if (ec)
      return fs::path { "/" };
  }

  if (!fs::is_directory(path, ec)) {
    path = path.parent_path();
    if (path.empty())
      return fs::path { "/" };
  }
  return path;
}

} // namespace

PathFilter PathFilter::acceptMatching(Matcher matcher)
{
  PathFilter filter { kAcceptMatching, {} };
  filter.mMatcher = std::move(matcher);
  return filter;
}

PathFilter PathFilter::denyMatching(Matcher matcher)
{
  PathFilter filter { kDenyMatching, {} };
  filter.mMatcher = std::move(matcher);
  return filter;
}

PathFilter PathFilter::acceptAny(std::vector<PathFilter> filters)
{
  PathFilter filter { kAcceptAny, {} };
  filter.mNested = std::move(filters);
  return filter;
}

PathFilter PathFilter::acceptAll(std::vector<PathFilter> filters)
{
  PathFilter filter { kAcceptAll, {} };
  filter.mNested = std::move(filters);
  return filter;
}

bool PathFilter::check(const fs::path& path) const
{
  switch (mKind) {
  case kAll:
    return true;
  case kAcceptExtension:
    return equalsIgnoreCase(extensionOf(path), mCriterion);
  case kAcceptStem:
    return equalsIgnoreCase(path.stem().string(), mCriterion);
  case kAcceptMatching:
    return mMatcher && mMatcher(path);
  case kDenyExtension:
    return !equalsIgnoreCase(extensionOf(path), mCriterion);
  case kDenyStem:
    return !equalsIgnoreCase(path.stem().string(), mCriterion);
  case kDenyMatching:
    return !(mMatcher && mMatcher(path));
  case kAcceptAny:
    return std::any_of(mNested.begin(), mNested.end(), [&](const PathFilter& f) { return f.check(path); });
  case kAcceptAll:
    return std::all_of(mNested.begin(), mNested.end(), [&](const PathFilter& f) { return f.check(path); });
  }
  return false;
}

PathSortingMode nextSortingMode(PathSortingMode mode) noexcept
{
  switch (mode) {
  case PathSortingMode::Path:
    return PathSortingMode::Size;
  case PathSortingMode::Size:
    return PathSortingMode::Extension;
  case PathSortingMode::Extension:
    return PathSortingMode::Path;
  }
  return PathSortingMode::Path;
}

std::string_view toString(PathSortingMode mode) noexcept
{
  switch (mode) {
  case PathSortingMode::Path:
    return "Path";
  case PathSortingMode::Size:
    return "Size";
  case PathSortingMode::Extension:
    return "Extension";
  }
  return {};
}

PathEntry PathEntry::fromPath(const fs::path& path)
{
  std::error_code ec;
  const auto linkStatus = fs::symlink_status(path, ec);
  if (ec)
    throw IOError { fmt::format("{}: {}", path.string(), ec.message()) };

  PathEntry entry;
  if (fs::is_symlink(linkStatus)) {
    entry.mSymlink = path;
    entry.mPath = fs::canonical(path, ec);
    if (ec)
      throw IOError { fmt::format("{}: {}", path.string(), ec.message()) };
    entry.mType = fs::status(entry.mPath, ec).type();
    if (ec)
      throw IOError { fmt::format("{}: {}", entry.mPath.string(), ec.message()) };
  } else {
    entry.mPath = path;
    entry.mType = linkStatus.type();
  }

  if (entry.isFile()) {
    entry.mSize = fs::file_size(entry.mPath, ec);
    if (ec)
      entry.mSize = 0;
  }
  return entry;
}

std::string PathEntry::name() const
{
  return (mSymlink ? *mSymlink : mPath).filename().string();
}

bool PathEntry::isHidden() const
{
  const auto n = name();
  return !n.empty() && n.front() == '.';
}

bool PathEntry::isSelectable(const PathSelectionMode& mode) const
{
  switch (mode.mKind) {
  case PathSelectionMode::kDirectory:
    return isDir() && mode.mFilter.check(mPath);
  case PathSelectionMode::kFile:
    return isFile() && mode.mFilter.check(mPath);
  case PathSelectionMode::kFileOrDirectory:
    return (isDir() || isFile()) && mode.mFilter.check(mPath);
  }
  return false;
}

std::string PathEntry::display() const
{
  if (mSymlink)
    return fmt::format("{} -> {}", mSymlink->string(), mPath.string());
  if (isDir())
    return fmt::format("(dir) {}", mPath.string());
  return mPath.string();
}

std::vector<PathEntry> listDirectory(
  const fs::path& dir,
  const PathSelectionMode& mode,
  bool showHidden,
  bool showSymlinks,
  PathSortingMode sorting)
{
  std::error_code ec;
  fs::directory_iterator it { dir, ec };
  if (ec)
    throw IOError { fmt::format("{}: {}", dir.string(), ec.message()) };

  std::vector<PathEntry> entries;
  fs::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    PathEntry entry;
    try {
      entry = PathEntry::fromPath(it->path());
    } catch (const IOError&) {
      // Dangling links and entries removed while listing
      continue;
    }

    if (!entry.isDir() && !entry.isSelectable(mode))
      continue;
    if (!showHidden && entry.isHidden())
      continue;
    if (!showSymlinks && entry.isSymlink())
      continue;
    entries.push_back(std::move(entry));
  }
  if (ec)
    throw IOError { fmt::format("{}: {}", dir.string(), ec.message()) };

  auto byPath = [](const PathEntry& a, const PathEntry& b) { return a.mPath < b.mPath; };
  switch (sorting) {
  case PathSortingMode::Path:
    std::sort(entries.begin(), entries.end(), byPath);
    break;
  case PathSortingMode::Size:
    std::sort(entries.begin(), entries.end(), [](const PathEntry& a, const PathEntry& b) {
      return std::make_tuple(!a.isDir(), a.mSize, a.mPath) < std::make_tuple(!b.isDir(), b.mSize, b.mPath);
    });
    break;
  case PathSortingMode::Extension:
    std::sort(entries.begin(), entries.end(), [](const PathEntry& a, const PathEntry& b) {
      return std::make_tuple(a.mPath.extension(), a.mPath) < std::make_tuple(b.mPath.extension(), b.mPath);
    });
    break;
  }
  return entries;
}

std::optional<PathSelectAction> PathSelectAction::fromKey(const Key& key, const PathSelectConfig& config)
{
  if (config.mVimMode) {
    if (key.isChar('k'))
      return PathSelectAction { kMoveUp, {} };
    if (key.isChar('j'))
      return PathSelectAction { kMoveDown, {} };
  }

  if (key.is(kUp))
    return PathSelectAction { kMoveUp, {} };
  if (key.is(kDown))
    return PathSelectAction { kMoveDown, {} };
  if (key.mCode == kPageUp)
    return PathSelectAction { kMovePageUp, {} };
  if (key.mCode == kPageDown)
    return PathSelectAction { kMovePageDown, {} };
  if (key.mCode == kHome)
    return PathSelectAction { kMoveToStart, {} };
  if (key.mCode == kEnd)
    return PathSelectAction { kMoveToEnd, {} };
  if (key.isChar(' '))
    return PathSelectAction { kToggleCurrent, {} };
  if (key.is(kRight, kShift))
    return PathSelectAction { kSelectAll, {} };
  if (key.is(kRight))
    return PathSelectAction { kNavigateDeeper, {} };
  if (key.is(kLeft, kShift))
    return PathSelectAction { kClearSelections, {} };
  if (key.is(kLeft))
    return PathSelectAction { kNavigateHigher, {} };
  if (key.is(kTab))
    return PathSelectAction { kChangeSortingMode, {} };

  if (auto input = InputAction::fromKey(key))
    return PathSelectAction { kFilterInput, *input };
  return std::nullopt;
}

PathSelect::PathSelect(std::string message)
  : mMessage(std::move(message))
  , mRenderConfig(getRenderConfig())
{
}

PathSelect& PathSelect::withStartPath(fs::path path)
{
  mStartPath = std::move(path);
  return *this;
}

PathSelect& PathSelect::withDefault(std::vector<fs::path> paths)
{
  mDefault = std::move(paths);
  return *this;
}

PathSelect& PathSelect::withHelpMessage(std::string help)
{
  mHelpMessage = std::move(help);
  return *this;
}

PathSelect& PathSelect::withoutHelpMessage()
{
  mHelpMessage.reset();
  return *this;
}

PathSelect& PathSelect::withPageSize(size_t pageSize)
{
  mPageSize = pageSize;
  return *this;
}

PathSelect& PathSelect::withVimMode(bool enabled)
{
  mVimMode = enabled;
  return *this;
}

PathSelect& PathSelect::withShowHidden(bool show)
{
  mShowHidden = show;
  return *this;
}

PathSelect& PathSelect::withShowSymlinks(bool show)
{
  mShowSymlinks = show;
  return *this;
}

PathSelect& PathSelect::withSelectMultiple(bool multiple)
{
  mSelectMultiple = multiple;
  return *this;
}

PathSelect& PathSelect::withKeepFilter(bool keep)
{
  mKeepFilter = keep;
  return *this;
}

PathSelect& PathSelect::withSelectionMode(PathSelectionMode mode)
{
  mSelectionMode = std::move(mode);
  return *this;
}

PathSelect& PathSelect::withSortingMode(PathSortingMode mode)
{
  mSortingMode = mode;
  return *this;
}

PathSelect& PathSelect::withFormatter(MultiOptionFormatter<PathEntry> formatter)
{
  mFormatter = std::move(formatter);
  return *this;
}

PathSelect& PathSelect::withValidator(MultiOptionValidator<PathEntry> validator)
{
  mValidator = std::move(validator);
  return *this;
}

PathSelect& PathSelect::withRenderConfig(RenderConfig config)
{
  mRenderConfig = std::move(config);
  return *this;
}

std::vector<PathEntry> PathSelect::prompt()
{
  std::vector<PathEntry> entries;
  for (auto& option : rawPrompt())
    entries.push_back(std::move(option.mValue));
  return entries;
}

std::optional<std::vector<PathEntry>> PathSelect::promptSkippable()
{
  return skipOnCancel([this] { return prompt(); });
}

std::vector<ListOption<PathEntry>> PathSelect::rawPrompt()
{
  return withTTY([this](Terminal& terminal) { return promptWith(terminal); });
}

std::vector<ListOption<PathEntry>> PathSelect::promptWith(Terminal& terminal)
{
  PathSelectPrompt state { *this };
  Backend backend { terminal, mRenderConfig };
  return runPrompt(state, backend);
}

namespace {

/// Case insensitive substring of the listed name, in listing order
Scorer<PathEntry> nameScorer()
{
  return [](std::string_view filter, const PathEntry& entry, std::string_view, size_t) -> std::optional<int64_t> {
    if (filter.empty() || toLower(entry.name()).find(toLower(filter)) != std::string::npos)
      return 0;
    return std::nullopt;
  };
}

} // namespace

std::vector<PathEntry> PathSelectPrompt::validated(const PathSelect& opts)
{
  if (opts.mPageSize == 0)
    throw InvalidConfigurationError { "Page size must be greater than zero" };

  std::vector<PathEntry> entries;
  for (const auto& path : opts.mDefault) {
    std::error_code ec;
    if (!fs::exists(path, ec))
      throw InvalidConfigurationError { fmt::format("Specified default path `{}` does not exist", path.string()) };
    auto entry = PathEntry::fromPath(path);
    if (std::find(entries.begin(), entries.end(), entry) == entries.end())
      entries.push_back(std::move(entry));
  }
  return entries;
}

PathSelectPrompt::PathSelectPrompt(const PathSelect& opts)
  : mMessage(opts.mMessage)
  , mConfig { opts.mVimMode, opts.mPageSize, opts.mKeepFilter }
  , mHelpMessage(opts.mHelpMessage)
  , mCurrentPath(startDirectory(opts.mStartPath))
  , mSelectionMode(opts.mSelectionMode)
  , mSortingMode(opts.mSortingMode)
  , mShowHidden(opts.mShowHidden)
  , mShowSymlinks(opts.mShowSymlinks)
  , mSelectMultiple(opts.mSelectMultiple)
  , mList({}, nameScorer(), false, 0)
  , mSelected(validated(opts))
  , mFormatter(opts.mFormatter)
  , mValidator(opts.mValidator)
{
  reload(0);
}

std::string PathSelectPrompt::formatAnswer(const Answer& answer) const
{
  if (mFormatter)
    return mFormatter(answer);
  return joinOptions(answer, [](const PathEntry& entry) { return entry.mPath.string(); });
}

bool PathSelectPrompt::isSelected(const PathEntry& entry) const
{
  return std::find(mSelected.begin(), mSelected.end(), entry) != mSelected.end();
}

std::optional<PathSelectPrompt::Answer> PathSelectPrompt::submit()
{
  Answer answer;
  const auto& options = mList.options();
  for (size_t i = 0; i < options.size(); ++i)
    if (isSelected(options[i]))
      answer.emplace_back(i, options[i]);

  if (mValidator) {
    Validation res = mValidator(answer);
    if (!res.isValid()) {
      mError = std::move(res.mMessage);
      return std::nullopt;
    }
  }
  return answer;
}

ActionResult PathSelectPrompt::handle(const PathSelectAction& action)
{
  switch (action.mKind) {
  case PathSelectAction::kMoveUp:
    return mList.moveUp(1, true);
  case PathSelectAction::kMoveDown:
    return mList.moveDown(1, true);
  case PathSelectAction::kMovePageUp:
    return mList.moveUp(mConfig.mPageSize, false);
  case PathSelectAction::kMovePageDown:
    return mList.moveDown(mConfig.mPageSize, false);
  case PathSelectAction::kMoveToStart:
    return mList.moveUp(SIZE_MAX, false);
  case PathSelectAction::kMoveToEnd:
    return mList.moveDown(SIZE_MAX, false);

  case PathSelectAction::kToggleCurrent: {
    const PathEntry* entry = current();
    if (entry == nullptr || !entry->isSelectable(mSelectionMode))
      return ActionResult::Clean;
    if (isSelected(*entry))
      unselect(*entry);
    else
      select(*entry);
    clearFilterUnlessKept();
    return ActionResult::NeedsRedraw;
  }

  case PathSelectAction::kSelectAll:
    if (mSelectMultiple) {
      for (size_t i : mList.view()) {
        const PathEntry& entry = mList.options()[i];
        if (entry.isSelectable(mSelectionMode) && !isSelected(entry))
          mSelected.push_back(entry);
      }
    } else if (const PathEntry* entry = current(); entry != nullptr && entry->isSelectable(mSelectionMode)) {
      select(*entry);
    }
    clearFilterUnlessKept();
    return ActionResult::NeedsRedraw;

  case PathSelectAction::kClearSelections:
    mSelected.clear();
    clearFilterUnlessKept();
    return ActionResult::NeedsRedraw;

  case PathSelectAction::kNavigateDeeper: {
    const PathEntry* entry = current();
    if (entry == nullptr || !entry->isDir())
      return ActionResult::Clean;
    mCurrentPath = entry->mPath;
    reload(0);
    return ActionResult::NeedsRedraw;
  }

  case PathSelectAction::kNavigateHigher: {
    auto parent = mCurrentPath.parent_path();
    if (parent.empty() || parent == mCurrentPath)
      return ActionResult::Clean;
    mCurrentPath = std::move(parent);
    reload(0);
    return ActionResult::NeedsRedraw;
  }

  case PathSelectAction::kChangeSortingMode:
    mSortingMode = nextSortingMode(mSortingMode);
    reload(mList.cursor());
    return ActionResult::NeedsRedraw;

  case PathSelectAction::kFilterInput: {
    const auto res = mFilter.handle(action.mInput);
    if (res == InputActionResult::ContentChanged)
      rescore();
    return toActionResult(res);
  }
  }
  return ActionResult::Clean;
}

void PathSelectPrompt::render(Backend& backend) const
{
  if (mError)
    backend.renderErrorMessage(*mError);

  backend.renderSelectPrompt(mMessage, &mFilter);

  const auto& options = mList.options();
  std::vector<bool> checked(options.size());
  for (size_t i = 0; i < options.size(); ++i)
    checked[i] = isSelected(options[i]);

  const Page page = mList.page(mConfig.mPageSize);
  backend.renderOptions(page, mList.window(page), &checked);

  if (mHelpMessage)
    backend.renderHelpMessage(*mHelpMessage);
}

void PathSelectPrompt::reload(size_t cursor)
{
  auto entries = listDirectory(mCurrentPath, mSelectionMode, mShowHidden, mShowSymlinks, mSortingMode);
  for (const auto& entry : mSelected)
    if (std::find(entries.begin(), entries.end(), entry) == entries.end())
      entries.push_back(entry);

  if (cursor >= entries.size())
    cursor = entries.empty() ? 0 : entries.size() - 1;
  mList = ScoredList<PathEntry> { std::move(entries), nameScorer(), false, cursor };
  rescore();
}

void PathSelectPrompt::rescore()
{
  mList.rescore(mFilter.content());
}

void PathSelectPrompt::clearFilterUnlessKept()
{
  if (mConfig.mKeepFilter || mFilter.isEmpty())
    return;
  mFilter.clear();
  rescore();
}

void PathSelectPrompt::select(const PathEntry& entry)
{
  if (!mSelectMultiple)
    mSelected.clear();
  if (!isSelected(entry))
    mSelected.push_back(entry);
}

void PathSelectPrompt::unselect(const PathEntry& entry)
{
  mSelected.erase(std::remove(mSelected.begin(), mSelected.end(), entry), mSelected.end());
}

const PathEntry* PathSelectPrompt::current() const
{
  const auto index = mList.current();
  if (!index)
    return nullptr;
  return &mList.options()[*index];
}

} // namespace ask
