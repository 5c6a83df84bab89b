#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cstring>
#include <iterator>
#include <string_view>

#include "ask/match/fzy.hpp"

using namespace std::string_view_literals;
using namespace ask::fzy;
using Catch::Approx;

TEST_CASE("ask::fzy::hasMatch", "[fzy]")
{
  CHECK(hasMatch("amor"sv, "app/models/order"sv));
  CHECK(hasMatch("AMO"sv, "app/models/order"sv));
  CHECK(hasMatch(""sv, "anything"sv));
  CHECK_FALSE(hasMatch("ba"sv, "abc"sv));
  CHECK_FALSE(hasMatch("abcd"sv, "abc"sv));
}

TEST_CASE("ask::fzy::score", "[fzy]")
{
  SECTION("should prefer starts of words") {
    CHECK(score("amor"sv, "app/models/order"sv) > score("amor"sv, "app/models/zrder"sv));
  }

  SECTION("should prefer consecutive letters") {
    CHECK(score("amo"sv, "app/m/foo"sv) < score("amo"sv, "app/models/foo"sv));
  }

  SECTION("should prefer contiguous over letter following period") {
    CHECK(score("gemfil"sv, "Gemfile.lock"sv) < score("gemfil"sv, "Gemfile"sv));
  }

  SECTION("should prefer shorter matches") {
    CHECK(score("abce"sv, "abcdef"sv) > score("abce"sv, "abc de"sv));
    CHECK(score("abc"sv, "    a b c "sv) > score("abc"sv, " a  b  c "sv));
    CHECK(score("abc"sv, " a b c    "sv) > score("abc"sv, " a  b  c "sv));
  }

  SECTION("should prefer shorter candidates") {
    CHECK(score("test"sv, "tests"sv) > score("test"sv, "testing"sv));
  }

  SECTION("should prefer start of candidate") {
    CHECK(score("test"sv, "testing"sv) > score("test"sv, "/testing"sv));
  }

  SECTION("score exact match") {
    CHECK(Approx(kScoreMax) == score("abc"sv, "abc"sv));
    CHECK(Approx(kScoreMax) == score("aBc"sv, "abC"sv));
  }

  SECTION("score empty query") {
    CHECK(Approx(kScoreMin) == score(""sv, ""sv));
    CHECK(Approx(kScoreMin) == score(""sv, "a"sv));
  }

  SECTION("score gaps") {
    CHECK(Approx(kScoreGapLeading) == score("a"sv, "*a"sv));
    CHECK(Approx(kScoreGapLeading*2) == score("a"sv, "*ba"sv));
    CHECK(Approx(kScoreGapLeading*2 + kScoreGapTrailing) == score("a"sv, "**a*"sv));
    CHECK(Approx(kScoreGapLeading*2 + kScoreMatchConsecutive + kScoreGapTrailing*2) == score("aa"sv, "**aa**"sv));
  }

  SECTION("score slash, capital and dot") {
    CHECK(Approx(kScoreGapLeading + kScoreMatchSlash) == score("a"sv, "/a"sv));
    CHECK(Approx(kScoreGapLeading + kScoreMatchCapital) == score("a"sv, "bA"sv));
    CHECK(Approx(kScoreGapLeading + kScoreMatchDot) == score("a"sv, ".a"sv));
  }

  SECTION("score long string") {
    char buf[4096] {};
    memset(buf, 'a', std::size(buf) - 1);
    std::string_view str { buf, std::size(buf) - 1 };
    CHECK(Approx(kScoreMin) == score("aa"sv, str));
    CHECK(Approx(kScoreMin) == score(str, "aa"sv));
  }
}
