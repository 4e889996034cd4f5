/// @file test_assertions.cpp
/// @brief Unit tests for step assertion checks.

#include "scenario/assertions.hpp"

#include <gtest/gtest.h>

using namespace loadcurve;
using namespace std::chrono_literals;

namespace {

const HttpResponse kResponse{
    .status = 201,
    .headers = {{"Location", "/users/9"}},
    .body = R"({"user":{"id":9,"name":"ada"},"tags":["a","b"]})",
};

auto re(std::string source) -> Pattern {
  return Pattern::compile(std::move(source)).value();
}

} // namespace

TEST(AssertionTest, StatusCode) {
  EXPECT_FALSE(check_assertion(assertion::StatusCode{201}, kResponse, 1ms));
  auto failure = check_assertion(assertion::StatusCode{200}, kResponse, 1ms);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, AssertionKind::StatusCode);
  EXPECT_EQ(failure->expected, "200");
  EXPECT_EQ(failure->actual, "201");
}

TEST(AssertionTest, BodyContains) {
  EXPECT_FALSE(
      check_assertion(assertion::BodyContains{"\"ada\""}, kResponse, 1ms));
  EXPECT_TRUE(check_assertion(assertion::BodyContains{"grace"}, kResponse, 1ms));
}

TEST(AssertionTest, ResponseTimeIsInclusive) {
  EXPECT_FALSE(
      check_assertion(assertion::ResponseTime{100ms}, kResponse, 100ms));
  EXPECT_TRUE(check_assertion(assertion::ResponseTime{100ms}, kResponse, 101ms));
}

TEST(AssertionTest, ResponseTimeKeepsFraction) {
  auto over = check_assertion(assertion::ResponseTime{100ms}, kResponse,
                              ElapsedMs{100.9});
  ASSERT_TRUE(over.has_value());
  EXPECT_EQ(over->actual, "100.9ms");
  EXPECT_FALSE(check_assertion(assertion::ResponseTime{100ms}, kResponse,
                               ElapsedMs{99.95}));
}

TEST(AssertionTest, JsonPathPresenceAndValue) {
  EXPECT_FALSE(check_assertion(assertion::JsonPath{"$.user.id", std::nullopt},
                               kResponse, 1ms));
  EXPECT_FALSE(check_assertion(assertion::JsonPath{"$.user.id", "9"},
                               kResponse, 1ms));
  EXPECT_FALSE(check_assertion(assertion::JsonPath{"$.tags[1]", "b"},
                               kResponse, 1ms));
  auto wrong = check_assertion(assertion::JsonPath{"$.user.name", "bob"},
                               kResponse, 1ms);
  ASSERT_TRUE(wrong.has_value());
  EXPECT_EQ(wrong->actual, "ada");
  EXPECT_TRUE(check_assertion(assertion::JsonPath{"$.user.email", std::nullopt},
                              kResponse, 1ms));
}

TEST(AssertionTest, BodyMatches) {
  EXPECT_FALSE(check_assertion(assertion::BodyMatches{re("\"id\":\\d+")},
                               kResponse, 1ms));
  auto miss = check_assertion(assertion::BodyMatches{re("^x")}, kResponse, 1ms);
  ASSERT_TRUE(miss.has_value());
  EXPECT_EQ(miss->kind, AssertionKind::BodyMatches);
  EXPECT_EQ(miss->expected, "^x");
  EXPECT_EQ(miss->actual, "no match");
}

TEST(AssertionTest, BodyMatchesUncompiledPatternFails) {
  auto failure =
      check_assertion(assertion::BodyMatches{}, kResponse, 1ms);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, AssertionKind::BodyMatches);
}

TEST(AssertionTest, BodyMatchesLargeBody) {
  HttpResponse big{.status = 200, .body = std::string(400'000, 'x')};
  big.body += "done";
  EXPECT_FALSE(
      check_assertion(assertion::BodyMatches{re("x+done$")}, big, 1ms));

  // Heavy backtracking over a long body either matches or is reported.
  HttpResponse alt{.status = 200};
  for (int i = 0; i < 100'000; ++i) {
    alt.body += "ab";
  }
  alt.body += "token";
  auto heavy =
      check_assertion(assertion::BodyMatches{re("(a|b)*token")}, alt, 1ms);
  if (heavy.has_value()) {
    EXPECT_TRUE(heavy->actual.starts_with("match aborted"));
  }
}

TEST(AssertionTest, HeaderExistsIgnoresCase) {
  EXPECT_FALSE(
      check_assertion(assertion::HeaderExists{"location"}, kResponse, 1ms));
  EXPECT_TRUE(check_assertion(assertion::HeaderExists{"ETag"}, kResponse, 1ms));
}

TEST(AssertionTest, RunEvaluatesEveryAssertion) {
  std::vector<Assertion> all{
      assertion::StatusCode{200},
      assertion::BodyContains{"ada"},
      assertion::HeaderExists{"ETag"},
  };
  auto report = run_assertions(all, kResponse, 5ms);
  EXPECT_EQ(report.passed, 1u);
  EXPECT_EQ(report.failures.size(), 2u);
  EXPECT_FALSE(report.all_passed());
}
