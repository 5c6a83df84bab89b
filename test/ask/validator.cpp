#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "ask/error.hpp"
#include "ask/validator.hpp"

using namespace ask;

TEST_CASE("ask::runValidators", "[validator]")
{
  SECTION("stops at the first invalid result") {
    int calls = 0;
    std::vector<StringValidator> validators {
      [&](const std::string&) { ++calls; return Validation::valid(); },
      [&](const std::string&) { ++calls; return Validation::invalid("first"); },
      [&](const std::string&) { ++calls; return Validation::invalid("second"); },
    };
    auto error = runValidators(validators, std::string { "x" });
    REQUIRE(error);
    CHECK(error->mCustom == "first");
    CHECK(calls == 2);
  }

  SECTION("no error when every validator passes") {
    std::vector<StringValidator> validators { required() };
    CHECK_FALSE(runValidators(validators, std::string { "x" }));
  }

  SECTION("invalid without a message") {
    std::vector<StringValidator> validators {
      [](const std::string&) { return Validation::invalid(); },
    };
    auto error = runValidators(validators, std::string {});
    REQUIRE(error);
    CHECK_FALSE(error->mCustom);
  }

  SECTION("exceptions propagate") {
    std::vector<StringValidator> validators {
      [](const std::string&) -> Validation { throw CustomError { "database is down" }; },
    };
    CHECK_THROWS_AS(runValidators(validators, std::string {}), CustomError);
  }
}

TEST_CASE("ask builtin validators", "[validator]")
{
  CHECK(required()("") == Validation::invalid("A response is required."));
  CHECK(required("Name please")("") == Validation::invalid("Name please"));
  CHECK(required()("a").isValid());

  // Lengths count grapheme clusters
  CHECK(maxLength(3)("e\u0301e\u0301e\u0301").isValid());
  CHECK(maxLength(3)("abcd") == Validation::invalid("The length of the response should be at most 3"));
  CHECK(minLength(2)("a") == Validation::invalid("The length of the response should be at least 2"));
  CHECK(minLength(2)("ab").isValid());
  CHECK(exactLength(2)("abc") == Validation::invalid("The length of the response should be 2"));
  CHECK(exactLength(2, std::string { "two!" })("a") == Validation::invalid("two!"));

  using Options = std::vector<ListOption<int>>;
  const Options options { { 0, 10 }, { 1, 20 } };
  CHECK(minLength<Options>(1)(options).isValid());
  CHECK_FALSE(maxLength<Options>(1)(options).isValid());
}
