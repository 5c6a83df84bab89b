// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#if defined(__GNUC__) || defined(__clang__)
# define EXPORT __attribute__((visibility("default")))
#elif defined(_MSC_VER)
# define EXPORT __declspec(dllexport)
#else
# define EXPORT
#endif

#if defined(__GNUC__) || defined(__clang__)
# define NOINLINE __attribute__((noinline))
#elif defined(_MSC_VER)
# define NOINLINE __declspec(noinline)
#else
# define NOINLINE
#endif

#if defined(_MSC_VER)
# define RESTRICT __restrict
#elif defined(__GNUC__) || defined(__clang__)
# define RESTRICT __restrict__
#else
# define RESTRICT
#endif

#if defined(__GNUC__) || defined(__clang__)
# define LIKELY(x) __builtin_expect(static_cast<bool>(x), 1)
# define UNLIKELY(x) __builtin_expect(static_cast<bool>(x), 0)
#else
# define LIKELY(x) static_cast<bool>(x)
# define UNLIKELY(x) static_cast<bool>(x)
#endif

#define ASSERT(x) (LIKELY(x) ? void(0) : ::ask::detail::assertFail(#x, __FILE__, __LINE__))
#if !defined(ASK_OPTIMIZE)
# define DEBUG_ASSERT(x) ASSERT(x)
#else
# define DEBUG_ASSERT(x)
#endif

#if defined(ASK_OPTIMIZE)
# if defined(__GNUC__) || defined(__clang__)
#  define UNREACHABLE() __builtin_unreachable()
# elif defined(_MSC_VER)
#  define UNREACHABLE() __assume(false)
# else
#  define UNREACHABLE()
# endif
#else
# define UNREACHABLE() ::ask::detail::unreachableFail(__FILE__, __LINE__)
#endif

namespace ask {

namespace detail {

// NOLINTNEXTLINE(google-runtime-int)
[[noreturn]] NOINLINE void assertFail(const char* expr, const char* file, unsigned long line);
// NOLINTNEXTLINE(google-runtime-int)
[[noreturn]] NOINLINE void unreachableFail(const char* file, unsigned long line);

} // namespace detail

} // namespace ask
