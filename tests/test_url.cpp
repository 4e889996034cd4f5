/// @file test_url.cpp
/// @brief Unit tests for URL parsing and joining.

#include "http/url.hpp"

#include <gtest/gtest.h>

using namespace loadcurve;

TEST(UrlTest, DefaultsPortAndTarget) {
  auto url = parse_url("http://example.com");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme, "http");
  EXPECT_EQ(url->host, "example.com");
  EXPECT_EQ(url->port, 80);
  EXPECT_EQ(url->target, "/");
  EXPECT_EQ(url->host_header(), "example.com");
}

TEST(UrlTest, ExplicitPortPathAndQuery) {
  auto url = parse_url("HTTP://api.local:8081/v1/items?page=2#frag");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme, "http");
  EXPECT_EQ(url->port, 8081);
  EXPECT_EQ(url->target, "/v1/items?page=2");
  EXPECT_EQ(url->host_header(), "api.local:8081");
}

TEST(UrlTest, QueryWithoutPath) {
  auto url = parse_url("http://h?x=1");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->target, "/?x=1");
}

TEST(UrlTest, HttpsDefaultPort) {
  auto url = parse_url("https://secure.example");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->port, 443);
}

TEST(UrlTest, Ipv6Host) {
  auto url = parse_url("http://[::1]:9000/x");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "::1");
  EXPECT_EQ(url->port, 9000);
  EXPECT_EQ(url->host_header(), "[::1]:9000");
}

TEST(UrlTest, UserinfoIsDropped) {
  auto url = parse_url("http://user:pw@host:81/");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "host");
  EXPECT_EQ(url->port, 81);
}

TEST(UrlTest, Rejections) {
  for (const char *bad : {"example.com/x", "ftp://h/", "http:///path",
                          "http://h:0/", "http://h:99999/", "http://h:8x/",
                          "http://[::1/"}) {
    auto url = parse_url(bad);
    ASSERT_FALSE(url.has_value()) << bad;
    EXPECT_EQ(url.error().kind, TransportErrorKind::InvalidRequest);
  }
}

TEST(UrlJoinTest, JoinsWithSingleSlash) {
  EXPECT_EQ(join_url("http://h:1/", "/a"), "http://h:1/a");
  EXPECT_EQ(join_url("http://h:1", "a"), "http://h:1/a");
  EXPECT_EQ(join_url("http://h:1//", "/a?b=c"), "http://h:1/a?b=c");
}

TEST(UrlJoinTest, AbsolutePathWins) {
  EXPECT_EQ(join_url("http://h:1", "https://other/x"), "https://other/x");
}
