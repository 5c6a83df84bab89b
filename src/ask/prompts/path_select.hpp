// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "ask/config.hpp"
#include "ask/formatter.hpp"
#include "ask/input.hpp"
#include "ask/list_option.hpp"
#include "ask/prompt.hpp"
#include "ask/prompts/option_list.hpp"
#include "ask/render_config.hpp"
#include "ask/validator.hpp"

namespace ask {

/// Which paths can be picked. Names are compared ignoring ASCII case.
class PathFilter
{
public:
  using Matcher = std::function<bool(const std::filesystem::path&)>;

  PathFilter() = default;

  static PathFilter all() { return {}; }
  static PathFilter acceptExtension(std::string extension) { return { kAcceptExtension, std::move(extension) }; }
  static PathFilter acceptStem(std::string stem) { return { kAcceptStem, std::move(stem) }; }
  static PathFilter acceptMatching(Matcher matcher);
  static PathFilter denyExtension(std::string extension) { return { kDenyExtension, std::move(extension) }; }
  static PathFilter denyStem(std::string stem) { return { kDenyStem, std::move(stem) }; }
  static PathFilter denyMatching(Matcher matcher);
  /// Passes when any of the nested filters does
  static PathFilter acceptAny(std::vector<PathFilter> filters);
  /// Passes when all of the nested filters do
  static PathFilter acceptAll(std::vector<PathFilter> filters);

  [[nodiscard]] bool check(const std::filesystem::path& path) const;

private:
  enum Kind : uint8_t {
    kAll,
    kAcceptExtension,
    kAcceptStem,
    kAcceptMatching,
    kDenyExtension,
    kDenyStem,
    kDenyMatching,
    kAcceptAny,
    kAcceptAll,
  };

  PathFilter(Kind kind, std::string criterion) : mKind(kind), mCriterion(std::move(criterion)) { }

  Kind mKind { kAll };
  std::string mCriterion;
  Matcher mMatcher;
  std::vector<PathFilter> mNested;
};

struct PathSelectionMode
{
  enum Kind : uint8_t { kDirectory, kFile, kFileOrDirectory };

  Kind mKind { kFile };
  PathFilter mFilter;

  static PathSelectionMode directory(PathFilter filter = {}) { return { kDirectory, std::move(filter) }; }
  static PathSelectionMode file(PathFilter filter = {}) { return { kFile, std::move(filter) }; }
  static PathSelectionMode fileOrDirectory(PathFilter filter = {}) { return { kFileOrDirectory, std::move(filter) }; }
};

enum class PathSortingMode : uint8_t {
  Path,
  /// Directories first, then files from the smallest
  Size,
  Extension,
};

/// The mode Tab switches to
[[nodiscard]] PathSortingMode nextSortingMode(PathSortingMode mode) noexcept;
[[nodiscard]] std::string_view toString(PathSortingMode mode) noexcept;

/// Directory entry with its type and size looked up once
struct PathEntry
{
  /// Target of the link for symlinks
  std::filesystem::path mPath;
  std::filesystem::file_type mType { std::filesystem::file_type::none };
  uintmax_t mSize { 0 };
  /// Where the link itself lives
  std::optional<std::filesystem::path> mSymlink;

  /// Throws IOError when the path (or the target of a link) can't be read
  static PathEntry fromPath(const std::filesystem::path& path);

  [[nodiscard]] bool isDir() const noexcept { return mType == std::filesystem::file_type::directory; }
  [[nodiscard]] bool isFile() const noexcept { return mType == std::filesystem::file_type::regular; }
  [[nodiscard]] bool isSymlink() const noexcept { return mSymlink.has_value(); }
  /// Dotfiles, judged by the listed name
  [[nodiscard]] bool isHidden() const;
  [[nodiscard]] bool isSelectable(const PathSelectionMode& mode) const;
  /// Name under which the entry is listed in its directory
  [[nodiscard]] std::string name() const;
  /// "(dir) /a/b", "link -> target" or just the path
  [[nodiscard]] std::string display() const;

  bool operator==(const PathEntry& b) const { return mPath == b.mPath; }
  bool operator!=(const PathEntry& b) const { return !(*this == b); }
};

/// Entries of a directory in the given order, throws IOError when it can't be read
std::vector<PathEntry> listDirectory(
  const std::filesystem::path& dir,
  const PathSelectionMode& mode,
  bool showHidden,
  bool showSymlinks,
  PathSortingMode sorting);

struct PathSelectConfig
{
  bool mVimMode { kDefaultVimMode };
  size_t mPageSize { kDefaultPageSize };
  bool mKeepFilter { true };
};

struct PathSelectAction
{
  enum Kind : uint8_t {
    kFilterInput,
    kMoveUp,
    kMoveDown,
    kMovePageUp,
    kMovePageDown,
    kMoveToStart,
    kMoveToEnd,
    kToggleCurrent,
    kSelectAll,
    kClearSelections,
    kNavigateDeeper,
    kNavigateHigher,
    kChangeSortingMode,
  };

  Kind mKind { kFilterInput };
  InputAction mInput;

  static std::optional<PathSelectAction> fromKey(const Key& key, const PathSelectConfig& config);
};

/// Browse the file system and pick files or directories
class PathSelect
{
public:
  static constexpr const char* kDefaultHelpMessage =
    "↑↓ to move, space to select one, → to navigate to path, ← to navigate up, "
    "shift+→ to select all, shift+← to clear, tab to change sorting mode";

  explicit PathSelect(std::string message);

  /// Directory listed first, the working directory by default
  PathSelect& withStartPath(std::filesystem::path path);
  /// Paths selected from the start, they must exist
  PathSelect& withDefault(std::vector<std::filesystem::path> paths);
  PathSelect& withHelpMessage(std::string help);
  PathSelect& withoutHelpMessage();
  PathSelect& withPageSize(size_t pageSize);
  PathSelect& withVimMode(bool enabled);
  PathSelect& withShowHidden(bool show);
  PathSelect& withShowSymlinks(bool show);
  PathSelect& withSelectMultiple(bool multiple);
  PathSelect& withKeepFilter(bool keep);
  PathSelect& withSelectionMode(PathSelectionMode mode);
  PathSelect& withSortingMode(PathSortingMode mode);
  PathSelect& withFormatter(MultiOptionFormatter<PathEntry> formatter);
  PathSelect& withValidator(MultiOptionValidator<PathEntry> validator);
  PathSelect& withRenderConfig(RenderConfig config);

  std::vector<PathEntry> prompt();
  std::optional<std::vector<PathEntry>> promptSkippable();
  /// Selected entries in the order they are listed, with their position in the list
  std::vector<ListOption<PathEntry>> rawPrompt();
  std::vector<ListOption<PathEntry>> promptWith(Terminal& terminal);

private:
  friend class PathSelectPrompt;

  std::string mMessage;
  std::optional<std::filesystem::path> mStartPath;
  std::vector<std::filesystem::path> mDefault;
  std::optional<std::string> mHelpMessage { kDefaultHelpMessage };
  size_t mPageSize { kDefaultPageSize };
  bool mVimMode { kDefaultVimMode };
  bool mShowHidden { false };
  bool mShowSymlinks { false };
  bool mSelectMultiple { false };
  bool mKeepFilter { true };
  PathSelectionMode mSelectionMode;
  PathSortingMode mSortingMode { PathSortingMode::Path };
  MultiOptionFormatter<PathEntry> mFormatter;
  MultiOptionValidator<PathEntry> mValidator;
  RenderConfig mRenderConfig;
};

class PathSelectPrompt
{
public:
  using Answer = std::vector<ListOption<PathEntry>>;
  using Action = PathSelectAction;
  using Config = PathSelectConfig;

  /// Throws InvalidConfigurationError for missing defaults, IOError when the
  /// start directory can't be listed
  explicit PathSelectPrompt(const PathSelect& opts);

  [[nodiscard]] const std::string& message() const noexcept { return mMessage; }
  [[nodiscard]] const PathSelectConfig& config() const noexcept { return mConfig; }
  [[nodiscard]] std::string formatAnswer(const Answer& answer) const;

  void setup() { rescore(); }
  bool preCancel() noexcept { return true; }
  std::optional<Answer> submit();
  ActionResult handle(const PathSelectAction& action);
  void render(Backend& backend) const;

  [[nodiscard]] const std::filesystem::path& currentPath() const noexcept { return mCurrentPath; }
  [[nodiscard]] PathSortingMode sortingMode() const noexcept { return mSortingMode; }
  [[nodiscard]] const ScoredList<PathEntry>& list() const noexcept { return mList; }
  [[nodiscard]] bool isSelected(const PathEntry& entry) const;

private:
  /// Default selections, throws InvalidConfigurationError for missing paths
  static std::vector<PathEntry> validated(const PathSelect& opts);
  /// Lists the current directory again, selected entries from elsewhere go last
  void reload(size_t cursor);
  void rescore();
  void clearFilterUnlessKept();
  void select(const PathEntry& entry);
  void unselect(const PathEntry& entry);
  [[nodiscard]] const PathEntry* current() const;

  std::string mMessage;
  PathSelectConfig mConfig;
  std::optional<std::string> mHelpMessage;
  std::filesystem::path mCurrentPath;
  PathSelectionMode mSelectionMode;
  PathSortingMode mSortingMode;
  bool mShowHidden;
  bool mShowSymlinks;
  bool mSelectMultiple;
  ScoredList<PathEntry> mList;
  /// Kept across directories, in the order they were picked
  std::vector<PathEntry> mSelected;
  Input mFilter;
  MultiOptionFormatter<PathEntry> mFormatter;
  MultiOptionValidator<PathEntry> mValidator;
  std::optional<ErrorMessage> mError;
};

} // namespace ask

template <>
struct fmt::formatter<ask::PathEntry> : fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto format(const ask::PathEntry& entry, FormatContext& ctx) const
  {
    return fmt::formatter<std::string_view>::format(entry.display(), ctx);
  }
};
