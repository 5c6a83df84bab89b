#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "ask/autocomplete.hpp"

using namespace ask;

TEST_CASE("ask::WordListAutocomplete", "[autocomplete]")
{
  WordListAutocomplete words { { "apple", "application", "banana", "Apply" } };

  SECTION("suggestions match substrings case-insensitively") {
    CHECK(words.suggestions("app") == std::vector<std::string> { "apple", "application", "Apply" });
    CHECK(words.suggestions("nan") == std::vector<std::string> { "banana" });
    CHECK(words.suggestions("xyz").empty());
  }

  SECTION("completion uses the highlighted suggestion") {
    words.suggestions("app");
    CHECK(words.completion("app", std::string { "Apply" }) == "Apply");
  }

  SECTION("completion extends to the common prefix") {
    words.suggestions("ap");
    CHECK_FALSE(words.completion("ap", std::nullopt));

    words.suggestions("appl");
    CHECK_FALSE(words.completion("appl", std::nullopt));

    WordListAutocomplete paths { { "src/ask/input.cpp", "src/ask/input.hpp" } };
    paths.suggestions("inp");
    CHECK(paths.completion("inp", std::nullopt) == "src/ask/input.");
  }
}
