/// @file test_session_store.cpp
/// @brief Unit tests for the per-worker cookie jar.

#include "scenario/session_store.hpp"

#include <gtest/gtest.h>

#include <type_traits>

using namespace loadcurve;

static_assert(!std::is_copy_constructible_v<SessionStore>);
static_assert(std::is_move_constructible_v<SessionStore>);

TEST(SetCookieParseTest, LeadingPairOnly) {
  auto parsed = parse_set_cookie("sid=abc123; Path=/; HttpOnly");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, "sid");
  EXPECT_EQ(parsed->second, "abc123");
}

TEST(SetCookieParseTest, QuotedValueIsUnwrapped) {
  auto parsed = parse_set_cookie("pref=\"dark mode\"");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->second, "dark mode");
}

TEST(SetCookieParseTest, RejectsMissingName) {
  EXPECT_FALSE(parse_set_cookie("=value").has_value());
  EXPECT_FALSE(parse_set_cookie("novalue").has_value());
}

TEST(SessionStoreTest, EmptyJarHasNoHeader) {
  SessionStore store;
  EXPECT_FALSE(store.cookie_header().has_value());
}

TEST(SessionStoreTest, CollectsSetCookieHeaders) {
  SessionStore store;
  store.update_from_response({{"Content-Type", "text/html"},
                              {"Set-Cookie", "b=2; Path=/"},
                              {"set-cookie", "a=1"}});
  EXPECT_EQ(store.size(), 2u);
  EXPECT_EQ(store.cookie_header(), "a=1; b=2");
}

TEST(SessionStoreTest, LaterValueReplacesEarlier) {
  SessionStore store;
  store.apply_set_cookie("sid=one");
  store.apply_set_cookie("sid=two");
  EXPECT_EQ(store.cookie("sid"), "two");
}

TEST(SessionStoreTest, MaxAgeZeroDeletes) {
  SessionStore store;
  store.apply_set_cookie("sid=one");
  store.apply_set_cookie("sid=gone; Max-Age=0");
  EXPECT_FALSE(store.cookie("sid").has_value());
  EXPECT_EQ(store.size(), 0u);
}

TEST(SessionStoreTest, EmptyValueDeletes) {
  SessionStore store;
  store.apply_set_cookie("sid=one");
  store.apply_set_cookie("sid=; Path=/");
  EXPECT_FALSE(store.cookie("sid").has_value());
}

TEST(SessionStoreTest, SurvivesMove) {
  SessionStore store;
  store.apply_set_cookie("sid=one");
  SessionStore moved = std::move(store);
  EXPECT_EQ(moved.cookie("sid"), "one");
}
