#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ask/prompts/path_select.hpp"
#include "scripted_terminal.hpp"

using namespace ask;
namespace fs = std::filesystem;
using Answer = std::vector<ListOption<PathEntry>>;

namespace {

/// Small directory tree under the temp directory, removed again on destruction
///
///   dir_0/  rustfile_0_0.rs 336, rustfile_0_1.rs 3336, xmlfile_0_0.xml 66, xmlfile_0_1.xml 14
///   dir_1/
///   dir_2/  htmlfile_2_0.html 66, htmlfile_2_1.html 14
///   dir_2/dir_2_0/  a.html 66, b.html 14, c.rs 4181, d.rs 987, e.rs 2584
///   dir_3/  jpegfile_3_0.jpeg 332
///   mp3file_0.mp3 300, mp3file_1.mp3 5000, rustfile_0.rs 300, rustfile_1.rs 4000,
///   tomlfile_0.toml 10, tomlfile_1.toml 300, .secret 1, link.rs -> rustfile_0.rs
class TempTree
{
public:
  TempTree()
    : mRoot(fs::temp_directory_path() / ("ask-path-select-" + std::to_string(::getpid())))
  {
    fs::remove_all(mRoot);
    fs::create_directories(mRoot / "dir_0");
    fs::create_directories(mRoot / "dir_1");
    fs::create_directories(mRoot / "dir_2" / "dir_2_0");
    fs::create_directories(mRoot / "dir_3");

    file("dir_0/rustfile_0_0.rs", 336);
    file("dir_0/rustfile_0_1.rs", 3336);
    file("dir_0/xmlfile_0_0.xml", 66);
    file("dir_0/xmlfile_0_1.xml", 14);
    file("dir_2/htmlfile_2_0.html", 66);
    file("dir_2/htmlfile_2_1.html", 14);
    file("dir_2/dir_2_0/a.html", 66);
    file("dir_2/dir_2_0/b.html", 14);
    file("dir_2/dir_2_0/c.rs", 4181);
    file("dir_2/dir_2_0/d.rs", 987);
    file("dir_2/dir_2_0/e.rs", 2584);
    file("dir_3/jpegfile_3_0.jpeg", 332);
    file("mp3file_0.mp3", 300);
    file("mp3file_1.mp3", 5000);
    file("rustfile_0.rs", 300);
    file("rustfile_1.rs", 4000);
    file("tomlfile_0.toml", 10);
    file("tomlfile_1.toml", 300);
    file(".secret", 1);
    fs::create_symlink(mRoot / "rustfile_0.rs", mRoot / "link.rs");
  }

  ~TempTree()
  {
    std::error_code ec;
    fs::remove_all(mRoot, ec);
  }

  TempTree(const TempTree&) = delete;
  TempTree& operator=(const TempTree&) = delete;

  [[nodiscard]] const fs::path& root() const noexcept { return mRoot; }

private:
  void file(const std::string& name, size_t size)
  {
    std::ofstream out { mRoot / name, std::ios::binary };
    out << std::string(size, 'x');
  }

  fs::path mRoot;
};

PathSelect browse(const fs::path& start)
{
  return PathSelect { "Pick:" }
    .withRenderConfig(RenderConfig::empty())
    .withoutHelpMessage()
    .withStartPath(start);
}

std::vector<std::string> names(const std::vector<PathEntry>& entries)
{
  std::vector<std::string> out;
  for (const auto& entry : entries)
    out.push_back(entry.name());
  return out;
}

std::vector<std::pair<size_t, std::string>> names(const Answer& answer)
{
  std::vector<std::pair<size_t, std::string>> out;
  for (const auto& option : answer)
    out.emplace_back(option.mIndex, option.mValue.name());
  return out;
}

using Names = std::vector<std::string>;
using IndexedNames = std::vector<std::pair<size_t, std::string>>;

} // namespace

TEST_CASE("ask::PathFilter", "[path_select]")
{
  CHECK(PathFilter::all().check("trachea.stl"));
  CHECK(PathFilter::acceptExtension("stl").check("trachea.stl"));
  CHECK(PathFilter::acceptExtension("STL").check("trachea.stl"));
  CHECK_FALSE(PathFilter::acceptExtension("stl").check("trachea.rs"));
  CHECK_FALSE(PathFilter::acceptExtension("stl").check("stl"));
  CHECK_FALSE(PathFilter::denyExtension("stl").check("trachea.stl"));
  CHECK(PathFilter::denyExtension("stl").check("trachea.rs"));
  CHECK(PathFilter::acceptStem("trachea").check("/body/trachea.rs"));
  CHECK_FALSE(PathFilter::denyStem("trachea").check("trachea.rs"));
  CHECK(PathFilter::acceptAny({ PathFilter::acceptExtension("stl"), PathFilter::acceptExtension("rs") }).check("trachea.rs"));
  CHECK_FALSE(PathFilter::acceptAll({ PathFilter::acceptExtension("stl"), PathFilter::acceptStem("artery") }).check("artery.rs"));
  CHECK(PathFilter::acceptAll({ PathFilter::acceptExtension("rs"), PathFilter::acceptStem("artery") }).check("artery.rs"));

  auto isShort = [](const fs::path& p) { return p.filename().string().size() < 6; };
  CHECK(PathFilter::acceptMatching(isShort).check("a.rs"));
  CHECK_FALSE(PathFilter::denyMatching(isShort).check("a.rs"));
}

TEST_CASE("ask::nextSortingMode", "[path_select]")
{
  CHECK(nextSortingMode(PathSortingMode::Path) == PathSortingMode::Size);
  CHECK(nextSortingMode(PathSortingMode::Size) == PathSortingMode::Extension);
  CHECK(nextSortingMode(PathSortingMode::Extension) == PathSortingMode::Path);
  CHECK(toString(PathSortingMode::Size) == "Size");
}

TEST_CASE("ask::listDirectory", "[path_select]")
{
  TempTree tree;
  const auto& root = tree.root();

  SECTION("sorted by path") {
    auto entries = listDirectory(root / "dir_2" / "dir_2_0", PathSelectionMode::file(), false, false, PathSortingMode::Path);
    CHECK(names(entries) == Names { "a.html", "b.html", "c.rs", "d.rs", "e.rs" });
  }

  SECTION("sorted by size, directories first") {
    auto entries = listDirectory(root, PathSelectionMode::file(PathFilter::acceptExtension("rs")), false, false, PathSortingMode::Size);
    CHECK(names(entries) == Names { "dir_0", "dir_1", "dir_2", "dir_3", "rustfile_0.rs", "rustfile_1.rs" });
  }

  SECTION("sorted by extension") {
    auto entries = listDirectory(root / "dir_2" / "dir_2_0", PathSelectionMode::file(), false, false, PathSortingMode::Extension);
    CHECK(names(entries) == Names { "a.html", "b.html", "c.rs", "d.rs", "e.rs" });

    entries = listDirectory(root / "dir_0", PathSelectionMode::file(), false, false, PathSortingMode::Extension);
    CHECK(names(entries) == Names { "rustfile_0_0.rs", "rustfile_0_1.rs", "xmlfile_0_0.xml", "xmlfile_0_1.xml" });
  }

  SECTION("directories are listed even when they can't be picked") {
    auto entries = listDirectory(root / "dir_2", PathSelectionMode::file(PathFilter::acceptExtension("rs")), false, false, PathSortingMode::Path);
    CHECK(names(entries) == Names { "dir_2_0" });
    CHECK(entries.front().isDir());
    CHECK_FALSE(entries.front().isSelectable(PathSelectionMode::file()));
    CHECK(entries.front().isSelectable(PathSelectionMode::directory()));
    CHECK(entries.front().isSelectable(PathSelectionMode::fileOrDirectory()));
    CHECK(entries.front().display() == "(dir) " + (root / "dir_2" / "dir_2_0").string());
  }

  SECTION("hidden files and symlinks only when asked for") {
    auto shown = [&](bool hidden, bool symlinks) {
      return names(listDirectory(root, PathSelectionMode::file(), hidden, symlinks, PathSortingMode::Path));
    };
    auto has = [](const Names& n, const std::string& name) { return std::find(n.begin(), n.end(), name) != n.end(); };

    CHECK_FALSE(has(shown(false, false), ".secret"));
    CHECK_FALSE(has(shown(false, false), "link.rs"));
    CHECK(has(shown(true, false), ".secret"));
    CHECK(has(shown(false, true), "link.rs"));
  }

  SECTION("symlinks point at their target") {
    auto entry = PathEntry::fromPath(root / "link.rs");
    CHECK(entry.isSymlink());
    CHECK(entry.isFile());
    CHECK(entry.mSize == 300);
    CHECK(entry.name() == "link.rs");
    CHECK(entry.mPath == fs::canonical(root / "rustfile_0.rs"));
    CHECK(entry.display() == (root / "link.rs").string() + " -> " + entry.mPath.string());
  }

  SECTION("missing directory") {
    CHECK_THROWS_AS(listDirectory(root / "nope", PathSelectionMode::file(), false, false, PathSortingMode::Path), IOError);
  }
}

TEST_CASE("ask::PathSelect", "[path_select]")
{
  TempTree tree;
  const auto& root = tree.root();
  ScriptedTerminal term;

  SECTION("navigates down and picks everything matching the extension") {
    term.press(kDown).press(kDown).press(kRight).press(kRight).press(kRight, kShift).submit();
    auto answer = browse(root)
      .withSelectMultiple(true)
      .withSelectionMode(PathSelectionMode::file(PathFilter::acceptExtension("rs")))
      .withSortingMode(PathSortingMode::Size)
      .promptWith(term);
    CHECK(names(answer) == IndexedNames { { 0, "d.rs" }, { 1, "e.rs" }, { 2, "c.rs" } });
    for (const auto& option : answer)
      CHECK(option.mValue.mPath.parent_path() == root / "dir_2" / "dir_2_0");
  }

  SECTION("one path unless multiple are allowed") {
    term.type(" ").press(kDown).type(" ").submit();
    CHECK(names(browse(root / "dir_2" / "dir_2_0").promptWith(term)) == IndexedNames { { 1, "b.html" } });

    term.type(" ").press(kDown).type(" ").submit();
    CHECK(names(browse(root / "dir_2" / "dir_2_0").withSelectMultiple(true).promptWith(term))
      == IndexedNames { { 0, "a.html" }, { 1, "b.html" } });
  }

  SECTION("space toggles") {
    term.type("  ").submit();
    CHECK(browse(root / "dir_3").promptWith(term).empty());
  }

  SECTION("directories only in directory mode") {
    term.press(kDown).type(" ").submit();
    CHECK(names(browse(root).withSelectionMode(PathSelectionMode::directory()).promptWith(term))
      == IndexedNames { { 1, "dir_1" } });
  }

  SECTION("directories can't be picked in file mode") {
    term.type(" ").submit();
    CHECK(browse(root).promptWith(term).empty());
  }

  SECTION("selections are kept while browsing") {
    term.type(" ").press(kLeft).type("toml").type(" ").submit();
    auto answer = browse(root / "dir_0").withSelectMultiple(true).promptWith(term);
    CHECK(names(answer) == IndexedNames { { 8, "tomlfile_0.toml" }, { 10, "rustfile_0_0.rs" } });
  }

  SECTION("left goes to the parent directory") {
    term.press(kLeft).press(kDown).press(kDown).press(kDown).press(kRight).type(" ").submit();
    CHECK(names(browse(root / "dir_0").promptWith(term)) == IndexedNames { { 0, "jpegfile_3_0.jpeg" } });
  }

  SECTION("right on a file does nothing") {
    term.press(kRight).type(" ").submit();
    CHECK(names(browse(root / "dir_3").promptWith(term)) == IndexedNames { { 0, "jpegfile_3_0.jpeg" } });
  }

  SECTION("tab changes the sorting mode") {
    term.press(kTab).type(" ").submit();
    CHECK(names(browse(root / "dir_2" / "dir_2_0").promptWith(term)) == IndexedNames { { 0, "b.html" } });
  }

  SECTION("filter matches the name") {
    term.type("RS").press(kDown).type(" ").submit();
    CHECK(names(browse(root / "dir_2" / "dir_2_0").promptWith(term)) == IndexedNames { { 3, "d.rs" } });
  }

  SECTION("filter is cleared after picking unless kept") {
    term.type("e.").type(" ").press(kDown).type(" ").submit();
    CHECK(names(browse(root / "dir_2" / "dir_2_0").withSelectMultiple(true).withKeepFilter(false).promptWith(term))
      == IndexedNames { { 1, "b.html" }, { 4, "e.rs" } });
  }

  SECTION("shift left clears") {
    term.press(kRight, kShift).press(kLeft, kShift).submit();
    CHECK(browse(root / "dir_2" / "dir_2_0").withSelectMultiple(true).promptWith(term).empty());
  }

  SECTION("select all picks only the current path in single mode") {
    term.press(kDown).press(kRight, kShift).submit();
    CHECK(names(browse(root / "dir_2" / "dir_2_0").promptWith(term)) == IndexedNames { { 1, "b.html" } });
  }

  SECTION("defaults are listed after the entries of the directory") {
    term.submit();
    auto answer = browse(root / "dir_3").withDefault({ root / "tomlfile_1.toml" }).promptWith(term);
    CHECK(names(answer) == IndexedNames { { 1, "tomlfile_1.toml" } });
  }

  SECTION("validator") {
    term.submit().type(" ").submit();
    auto answer = browse(root / "dir_3")
      .withValidator([](const Answer& a) {
        return a.empty() ? Validation::invalid(std::string { "pick a file" }) : Validation::valid();
      })
      .promptWith(term);
    CHECK(answer.size() == 1);
    CHECK(term.shown("# pick a file"));
  }

  SECTION("answer shows the paths") {
    ScriptedTerminal wide { 1000 };
    wide.type(" ").submit();
    browse(root / "dir_3").promptWith(wide);
    CHECK(wide.lines() == std::vector<std::string> { "? Pick: " + (root / "dir_3" / "jpegfile_3_0.jpeg").string() });
  }

  SECTION("start path") {
    PathSelectPrompt fromFile { browse(root / "tomlfile_0.toml") };
    CHECK(fromFile.currentPath() == root);

    CHECK_THROWS_AS(browse(root / "nope" / "deeper").promptWith(term), IOError);
  }

  SECTION("invalid configuration") {
    CHECK_THROWS_AS(browse(root).withDefault({ root / "missing.rs" }).promptWith(term), InvalidConfigurationError);
    CHECK_THROWS_AS(browse(root).withPageSize(0).promptWith(term), InvalidConfigurationError);
  }
}
