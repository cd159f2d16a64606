#include <gtest/gtest.h>

#include "smolink/uri.hpp"

using smolink::ExtractShortToken;
using smolink::IsAbsoluteUri;
using smolink::ParseQueryParams;
using smolink::PercentDecode;

TEST(UriTest, SplitTargetSeparatesQuery) {
  auto target = smolink::SplitTarget("/c?url=https://example.com");
  EXPECT_EQ(target.path, "/c");
  EXPECT_EQ(target.query, "url=https://example.com");

  auto bare = smolink::SplitTarget("/abc123");
  EXPECT_EQ(bare.path, "/abc123");
  EXPECT_TRUE(bare.query.empty());
}

TEST(UriTest, PercentDecodeHandlesEscapesAndPlus) {
  EXPECT_EQ(PercentDecode("https%3A%2F%2Fexample.com", false).value(), "https://example.com");
  EXPECT_EQ(PercentDecode("a+b", true).value(), "a b");
  EXPECT_EQ(PercentDecode("a+b", false).value(), "a+b");
  EXPECT_FALSE(PercentDecode("%zz", false).has_value());
  EXPECT_FALSE(PercentDecode("abc%4", false).has_value());
  EXPECT_FALSE(PercentDecode("%", false).has_value());
}

TEST(UriTest, ParseQueryParamsDecodesAndKeepsFirstValue) {
  auto params = ParseQueryParams("url=https%3A%2F%2Fexample.com%2Fa%3Fb%3Dc&url=second&flag&q=a+b");
  EXPECT_EQ(params.at("url"), "https://example.com/a?b=c");
  EXPECT_EQ(params.at("flag"), "");
  EXPECT_EQ(params.at("q"), "a b");
  EXPECT_TRUE(ParseQueryParams("").empty());
  EXPECT_EQ(ParseQueryParams("bad=%zz").count("bad"), 0u);
}

TEST(UriTest, AbsoluteUriAcceptsSchemes) {
  EXPECT_TRUE(IsAbsoluteUri("https://example.com"));
  EXPECT_TRUE(IsAbsoluteUri("http://user@example.com:8080/path?q=1#frag"));
  EXPECT_TRUE(IsAbsoluteUri("mailto:someone@example.com"));
  EXPECT_TRUE(IsAbsoluteUri("ftp://files.example.com/a%20b"));
}

TEST(UriTest, AbsoluteUriRejectsMalformedInput) {
  EXPECT_FALSE(IsAbsoluteUri(""));
  EXPECT_FALSE(IsAbsoluteUri("not-a-url"));
  EXPECT_FALSE(IsAbsoluteUri("/relative/path"));
  EXPECT_FALSE(IsAbsoluteUri("https:"));
  EXPECT_FALSE(IsAbsoluteUri("https://"));
  EXPECT_FALSE(IsAbsoluteUri("1http://example.com"));
  EXPECT_FALSE(IsAbsoluteUri("http://exa mple.com"));
  EXPECT_FALSE(IsAbsoluteUri("http://example.com/%zz"));
  EXPECT_FALSE(IsAbsoluteUri("http://example.com/\r\nX-Injected: 1"));
}

TEST(UriTest, ExtractShortTokenStripsSlashes) {
  EXPECT_EQ(ExtractShortToken("/abc123").value(), "abc123");
  EXPECT_EQ(ExtractShortToken("/a/b/").value(), "ab");
  EXPECT_EQ(ExtractShortToken("/%41b").value(), "Ab");
  EXPECT_EQ(ExtractShortToken("/").value(), "");
}

TEST(UriTest, ExtractShortTokenRejectsNonPaths) {
  EXPECT_FALSE(ExtractShortToken("").has_value());
  EXPECT_FALSE(ExtractShortToken("abc").has_value());
  EXPECT_FALSE(ExtractShortToken("/%zz").has_value());
}
