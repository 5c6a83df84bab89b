// Licensed under LGPLv3 - see LICENSE file for details.

#include <benchmark/benchmark.h>

#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include "ask/match.hpp"
#include "ask/match/fzy.hpp"
#include "ask/scorer.hpp"

#include "common.hpp"

using namespace std::string_view_literals;

static std::string gFilter;
static std::vector<std::string> gOptions;

// NOLINTNEXTLINE(readability-identifier-naming)
static void BM_fzy(benchmark::State& s)
{
  for ([[maybe_unused]] auto _ : s) {
    for (const auto& option : gOptions) {
      if (ask::fzy::hasMatch(gFilter, option)) {
        auto res = ask::fzy::score(gFilter, option);
        benchmark::DoNotOptimize(res);
      }
    }
  }

  s.SetItemsProcessed(static_cast<int64_t>(gOptions.size()) * s.iterations());
}

BENCHMARK(BM_fzy);

// NOLINTNEXTLINE(readability-identifier-naming)
static void BM_substr(benchmark::State& s)
{
  for ([[maybe_unused]] auto _ : s) {
    for (const auto& option : gOptions) {
      auto res = ask::scoreSubstr(gFilter, option);
      benchmark::DoNotOptimize(res);
    }
  }

  s.SetItemsProcessed(static_cast<int64_t>(gOptions.size()) * s.iterations());
}

BENCHMARK(BM_substr);

/// Whole select filter pass: scoring and ordering
// NOLINTNEXTLINE(readability-identifier-naming)
static void BM_scoreOptions(benchmark::State& s)
{
  const auto scorer = ask::fuzzyScorer<std::string>();

  for ([[maybe_unused]] auto _ : s) {
    auto view = ask::scoreOptions(gFilter, gOptions, gOptions, scorer);
    benchmark::DoNotOptimize(view);
  }

  s.SetItemsProcessed(static_cast<int64_t>(gOptions.size()) * s.iterations());
}

BENCHMARK(BM_scoreOptions);

/// Read dataset from stdin
static void readStdin()
{
  fprintf(stderr, "reading stdin... ");
  std::string line;
  while (std::getline(std::cin, line))
    gOptions.push_back(std::move(line));
  fprintf(stderr, "done\n");
}

int main(int argc, char** argv)
{
  std::string_view filter { "chromium" };

  // Everything else is passed on to the benchmark library
  for (int i = 1; i < argc; ++i) {
    std::string_view arg { argv[i] };
    if (arg == "--filter"sv) {
      if (++i == argc) {
        fprintf(stderr, "Expected argument for --filter\n");
        return 1;
      }
      filter = std::string_view { argv[i] };
    }
  }

  gFilter = filter;

  if (isatty(0)) {
    noDataError();
    return 1;
  }
  readStdin();
  if (gOptions.empty()) {
    noDataError();
    return 1;
  }

  fprintf(stderr, "Input options: %zu\n", gOptions.size());

  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();
}
