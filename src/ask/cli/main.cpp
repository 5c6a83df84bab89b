// Licensed under LGPLv3 - see LICENSE file for details.

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "ask/ask.hpp"

namespace {

constexpr int kExitAnswer = 0;
constexpr int kExitNo = 1;
constexpr int kExitCanceled = 1;
constexpr int kExitError = 2;
constexpr int kExitInterrupted = 130;

constexpr const char* kUsage =
  "Usage: ask <command> [options] <message> [items...]\n"
  "\n"
  "Commands:\n"
  "  text      single line of text\n"
  "  confirm   yes or no, answered with the exit status\n"
  "  password  secret text, typed twice\n"
  "  select    one of the items\n"
  "  multi     any number of the items\n"
  "  count     how many of each item, printed as count and item\n"
  "  path      files picked while browsing, starting in the first item\n"
  "  reorder   the items in a new order\n"
  "  date      a day picked on a calendar\n"
  "  editor    text written in $EDITOR\n"
  "\n"
  "Items are read from stdin, one per line, when none are given.\n"
  "\n"
  "Options:\n"
  "  -d, --default VALUE       answer for empty input, starting date, y/n for confirm\n"
  "  -p, --placeholder TEXT    shown while the input is empty\n"
  "  -m, --help-message TEXT   shown under the prompt\n"
  "  -n, --page-size N         list rows shown at once\n"
  "  -v, --vim                 h/j/k/l navigation\n"
  "  -r, --required            reject empty text\n"
  "      --mode MODE           password display: hidden, masked or full\n"
  "      --no-confirm          type the password once\n"
  "      --min DATE            earliest date, YYYY-MM-DD\n"
  "      --max DATE            latest date, YYYY-MM-DD\n"
  "      --monday              weeks start on Monday\n"
  "      --editor CMD          editor command\n"
  "      --extension EXT       extension of the edited file, or of the picked paths\n"
  "      --multiple            pick more than one path\n"
  "      --dirs                pick directories instead of files\n"
  "      --hidden              list dotfiles\n"
  "  -h, --help                show this message\n";

enum LongOption : int {
  kOptMode = 256,
  kOptNoConfirm,
  kOptMin,
  kOptMax,
  kOptMonday,
  kOptEditor,
  kOptExtension,
  kOptMultiple,
  kOptDirs,
  kOptHidden,
};

struct Options
{
  std::string mCommand;
  std::string mMessage;
  std::vector<std::string> mItems;
  std::optional<std::string> mDefault;
  std::optional<std::string> mPlaceholder;
  std::optional<std::string> mHelpMessage;
  std::optional<size_t> mPageSize;
  bool mVimMode { false };
  bool mRequired { false };
  std::optional<std::string> mMode;
  bool mConfirm { true };
  std::optional<std::string> mMinDate;
  std::optional<std::string> mMaxDate;
  bool mMonday { false };
  std::optional<std::string> mEditor;
  std::optional<std::string> mExtension;
  bool mMultiple { false };
  bool mDirs { false };
  bool mHidden { false };
};

/// Thrown for bad command line arguments
struct UsageError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

ask::Date parseDate(const std::string& s)
{
  if (auto date = ask::Date::parse(s))
    return *date;
  throw UsageError { fmt::format("invalid date '{}', expected YYYY-MM-DD", s) };
}

size_t parseSize(const char* s)
{
  char* end = nullptr;
  const unsigned long value = std::strtoul(s, &end, 10);
  if (*s == '\0' || *end != '\0')
    throw UsageError { fmt::format("invalid number '{}'", s) };
  return value;
}

/// Returns false when only the usage was requested
bool parseArgs(int argc, char** argv, Options& opts)
{
  static const option kLongOptions[] = {
    { "default", required_argument, nullptr, 'd' },
    { "placeholder", required_argument, nullptr, 'p' },
    { "help-message", required_argument, nullptr, 'm' },
    { "page-size", required_argument, nullptr, 'n' },
    { "vim", no_argument, nullptr, 'v' },
    { "required", no_argument, nullptr, 'r' },
    { "help", no_argument, nullptr, 'h' },
    { "mode", required_argument, nullptr, kOptMode },
    { "no-confirm", no_argument, nullptr, kOptNoConfirm },
    { "min", required_argument, nullptr, kOptMin },
    { "max", required_argument, nullptr, kOptMax },
    { "monday", no_argument, nullptr, kOptMonday },
    { "editor", required_argument, nullptr, kOptEditor },
    { "extension", required_argument, nullptr, kOptExtension },
    { "multiple", no_argument, nullptr, kOptMultiple },
    { "dirs", no_argument, nullptr, kOptDirs },
    { "hidden", no_argument, nullptr, kOptHidden },
    { nullptr, 0, nullptr, 0 },
  };

  if (argc < 2)
    throw UsageError { "missing command" };
  opts.mCommand = argv[1];
  if (opts.mCommand == "-h" || opts.mCommand == "--help")
    return false;

  // Options are parsed after the command
  optind = 2;
  int ch;
  while ((ch = getopt_long(argc, argv, "d:p:m:n:vrh", kLongOptions, nullptr)) != -1) {
    switch (ch) {
    case 'd': opts.mDefault = optarg; break;
    case 'p': opts.mPlaceholder = optarg; break;
    case 'm': opts.mHelpMessage = optarg; break;
    case 'n': opts.mPageSize = parseSize(optarg); break;
    case 'v': opts.mVimMode = true; break;
    case 'r': opts.mRequired = true; break;
    case 'h': return false;
    case kOptMode: opts.mMode = optarg; break;
    case kOptNoConfirm: opts.mConfirm = false; break;
    case kOptMin: opts.mMinDate = optarg; break;
    case kOptMax: opts.mMaxDate = optarg; break;
    case kOptMonday: opts.mMonday = true; break;
    case kOptEditor: opts.mEditor = optarg; break;
    case kOptExtension: opts.mExtension = optarg; break;
    case kOptMultiple: opts.mMultiple = true; break;
    case kOptDirs: opts.mDirs = true; break;
    case kOptHidden: opts.mHidden = true; break;
    default:
      throw UsageError { "invalid option" };
    }
  }

  if (optind >= argc)
    throw UsageError { "missing message" };
  opts.mMessage = argv[optind++];
  for (; optind < argc; ++optind)
    opts.mItems.emplace_back(argv[optind]);
  return true;
}

std::vector<std::string> readItems(const Options& opts)
{
  if (!opts.mItems.empty())
    return opts.mItems;

  std::vector<std::string> items;
  std::string line;
  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    items.push_back(std::move(line));
  }
  return items;
}

template <typename P>
void applyListOptions(const Options& opts, P& prompt)
{
  if (opts.mHelpMessage)
    prompt.withHelpMessage(*opts.mHelpMessage);
  if (opts.mPageSize)
    prompt.withPageSize(*opts.mPageSize);
  prompt.withVimMode(opts.mVimMode);
}

void printLines(const std::vector<std::string>& lines)
{
  for (const auto& line : lines)
    fmt::print("{}\n", line);
}

int runText(const Options& opts)
{
  ask::Text prompt { opts.mMessage };
  if (opts.mDefault)
    prompt.withDefault(*opts.mDefault);
  if (opts.mPlaceholder)
    prompt.withPlaceholder(*opts.mPlaceholder);
  if (opts.mHelpMessage)
    prompt.withHelpMessage(*opts.mHelpMessage);
  if (opts.mPageSize)
    prompt.withPageSize(*opts.mPageSize);
  if (opts.mRequired)
    prompt.withValidator(ask::required());
  if (!opts.mItems.empty())
    prompt.withAutocomplete(std::make_shared<ask::WordListAutocomplete>(opts.mItems));

  fmt::print("{}\n", prompt.prompt());
  return kExitAnswer;
}

int runConfirm(const Options& opts)
{
  ask::Confirm prompt { opts.mMessage };
  if (opts.mDefault) {
    auto value = ask::parseBool(*opts.mDefault);
    if (!value)
      throw UsageError { fmt::format("invalid default '{}', expected y or n", *opts.mDefault) };
    prompt.withDefault(*value);
  }
  if (opts.mPlaceholder)
    prompt.withPlaceholder(*opts.mPlaceholder);
  if (opts.mHelpMessage)
    prompt.withHelpMessage(*opts.mHelpMessage);

  return prompt.prompt() ? kExitAnswer : kExitNo;
}

int runPassword(const Options& opts)
{
  ask::Password prompt { opts.mMessage };
  if (opts.mHelpMessage)
    prompt.withHelpMessage(*opts.mHelpMessage);
  if (!opts.mConfirm)
    prompt.withoutConfirmation();
  if (opts.mRequired)
    prompt.withValidator(ask::required());
  if (opts.mMode) {
    if (*opts.mMode == "hidden")
      prompt.withDisplayMode(ask::PasswordDisplayMode::Hidden);
    else if (*opts.mMode == "masked")
      prompt.withDisplayMode(ask::PasswordDisplayMode::Masked);
    else if (*opts.mMode == "full")
      prompt.withDisplayMode(ask::PasswordDisplayMode::Full);
    else
      throw UsageError { fmt::format("invalid mode '{}'", *opts.mMode) };
    prompt.withDisplayToggleEnabled();
  }

  fmt::print("{}\n", prompt.prompt());
  return kExitAnswer;
}

int runSelect(const Options& opts)
{
  ask::Select<std::string> prompt { opts.mMessage, readItems(opts) };
  applyListOptions(opts, prompt);
  if (opts.mDefault)
    prompt.withStartingFilterInput(*opts.mDefault);

  fmt::print("{}\n", prompt.prompt());
  return kExitAnswer;
}

int runMultiSelect(const Options& opts)
{
  ask::MultiSelect<std::string> prompt { opts.mMessage, readItems(opts) };
  applyListOptions(opts, prompt);
  if (opts.mRequired)
    prompt.withValidator(ask::minLength<std::vector<ask::ListOption<std::string>>>(1, "Select at least one option"));

  printLines(prompt.prompt());
  return kExitAnswer;
}

int runMultiCount(const Options& opts)
{
  ask::MultiCount<std::string> prompt { opts.mMessage, readItems(opts) };
  applyListOptions(opts, prompt);
  if (opts.mRequired)
    prompt.withValidator(ask::minLength<std::vector<ask::CountedListOption<std::string>>>(1, "Pick at least one"));

  for (const auto& option : prompt.prompt())
    fmt::print("{}\t{}\n", option.mCount, option.mOption.mValue);
  return kExitAnswer;
}

int runPathSelect(const Options& opts)
{
  ask::PathSelect prompt { opts.mMessage };
  applyListOptions(opts, prompt);
  if (!opts.mItems.empty())
    prompt.withStartPath(opts.mItems.front());
  if (opts.mDefault)
    prompt.withDefault({ *opts.mDefault });

  ask::PathFilter filter;
  if (opts.mExtension)
    filter = ask::PathFilter::acceptExtension(*opts.mExtension);
  prompt.withSelectionMode(opts.mDirs ? ask::PathSelectionMode::directory(filter) : ask::PathSelectionMode::file(filter));
  prompt.withSelectMultiple(opts.mMultiple);
  prompt.withShowHidden(opts.mHidden);
  if (opts.mRequired)
    prompt.withValidator(ask::minLength<std::vector<ask::ListOption<ask::PathEntry>>>(1, "Pick at least one path"));

  for (const auto& entry : prompt.prompt())
    fmt::print("{}\n", entry.mPath.string());
  return kExitAnswer;
}

int runReorder(const Options& opts)
{
  ask::Reorder<std::string> prompt { opts.mMessage, readItems(opts) };
  applyListOptions(opts, prompt);

  printLines(prompt.prompt());
  return kExitAnswer;
}

int runDate(const Options& opts)
{
  ask::DateSelect prompt { opts.mMessage };
  if (opts.mDefault)
    prompt.withStartingDate(parseDate(*opts.mDefault));
  if (opts.mMinDate)
    prompt.withMinDate(parseDate(*opts.mMinDate));
  if (opts.mMaxDate)
    prompt.withMaxDate(parseDate(*opts.mMaxDate));
  if (opts.mMonday)
    prompt.withWeekStart(ask::Weekday::Monday);
  if (opts.mHelpMessage)
    prompt.withHelpMessage(*opts.mHelpMessage);
  prompt.withVimMode(opts.mVimMode);

  fmt::print("{}\n", prompt.prompt().toString());
  return kExitAnswer;
}

int runEditor(const Options& opts)
{
  ask::Editor prompt { opts.mMessage };
  if (opts.mDefault)
    prompt.withPredefinedText(*opts.mDefault);
  if (opts.mEditor)
    prompt.withEditorCommand(*opts.mEditor);
  if (opts.mExtension)
    prompt.withFileExtension(*opts.mExtension);
  if (opts.mHelpMessage)
    prompt.withHelpMessage(*opts.mHelpMessage);
  if (opts.mRequired)
    prompt.withValidator(ask::required());

  fmt::print("{}\n", prompt.prompt());
  return kExitAnswer;
}

int run(const Options& opts)
{
  const std::string_view cmd = opts.mCommand;
  if (cmd == "text")
    return runText(opts);
  if (cmd == "confirm")
    return runConfirm(opts);
  if (cmd == "password")
    return runPassword(opts);
  if (cmd == "select")
    return runSelect(opts);
  if (cmd == "multi")
    return runMultiSelect(opts);
  if (cmd == "count")
    return runMultiCount(opts);
  if (cmd == "path")
    return runPathSelect(opts);
  if (cmd == "reorder")
    return runReorder(opts);
  if (cmd == "date")
    return runDate(opts);
  if (cmd == "editor")
    return runEditor(opts);
  throw UsageError { fmt::format("unknown command '{}'", cmd) };
}

} // namespace

int main(int argc, char** argv)
{
  Options opts;
  try {
    if (!parseArgs(argc, argv, opts)) {
      fmt::print("{}", kUsage);
      return kExitAnswer;
    }
    return run(opts);
  } catch (const UsageError& e) {
    fmt::print(stderr, "ask: {}\n{}", e.what(), kUsage);
    return kExitError;
  } catch (const ask::CanceledError&) {
    return kExitCanceled;
  } catch (const ask::InterruptedError&) {
    return kExitInterrupted;
  } catch (const std::exception& e) {
    fmt::print(stderr, "ask: {}\n", e.what());
    return kExitError;
  }
}
