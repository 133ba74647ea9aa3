#include <string>

#include "gtest/gtest.h"
#include "scanpool/url.hpp"

using scanpool::Error;
using scanpool::parse_url;
using scanpool::UrlComponents;

TEST(ParseUrlTest, ParsesHttpUrl) {
    auto result = parse_url("http://example.com/foo/bar?baz=1");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_FALSE(url.endpoint.secure);
    EXPECT_EQ(url.endpoint.host, "example.com");
    EXPECT_EQ(url.endpoint.port, 80);
    EXPECT_EQ(url.target, "/foo/bar?baz=1");
}

TEST(ParseUrlTest, ParsesHttpsUrlWithPort) {
    auto result = parse_url("https://Example.com:8443/path");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_TRUE(url.endpoint.secure);
    EXPECT_EQ(url.endpoint.host, "example.com");
    EXPECT_EQ(url.endpoint.port, 8443);
    EXPECT_EQ(url.target, "/path");
}

TEST(ParseUrlTest, DefaultPortAndTarget) {
    auto result = parse_url("https://hostonly");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_EQ(url.endpoint.port, 443);
    EXPECT_EQ(url.target, "/");
}

TEST(ParseUrlTest, QueryWithoutPath) {
    auto result = parse_url("http://host?id=1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().endpoint.host, "host");
    EXPECT_EQ(result.value().target, "/?id=1");
}

TEST(ParseUrlTest, MissingScheme) {
    auto result = parse_url("example.com");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyHost) {
    auto result = parse_url("http:///foo");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyPort) {
    auto result = parse_url("http://host:");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, PortOutOfRange) {
    EXPECT_TRUE(parse_url("http://host:0/").has_error());
    EXPECT_TRUE(parse_url("http://host:65536/").has_error());
    EXPECT_TRUE(parse_url("http://host:80x/").has_error());
}
