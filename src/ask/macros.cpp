// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/macros.hpp"

#include <cstdio>
#include <cstdlib>

namespace ask::detail {

// NOLINTNEXTLINE(google-runtime-int)
[[noreturn]] NOINLINE void assertFail(const char* expr, const char* file, unsigned long line)
{
  std::fprintf(stderr, "ask: Assertion failed: %s:%lu: %s\n", file, line, expr);
  std::abort();
}

// NOLINTNEXTLINE(google-runtime-int)
[[noreturn]] NOINLINE void unreachableFail(const char* file, unsigned long line)
{
  std::fprintf(stderr, "ask: Reached unreachable code: %s:%lu\n", file, line);
  std::abort();
}

} // namespace ask::detail
