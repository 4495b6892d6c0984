#include <gtest/gtest.h>
#include "url.hpp"

using namespace rproxy;

TEST(UrlTest, ParsesHostAndPort) {
    auto url = Url::parse("http://localhost:8080");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->host, "localhost");
    EXPECT_EQ(url->port, 8080);
    EXPECT_EQ(url->path, "");
    EXPECT_EQ(url->origin(), "http://localhost:8080");
}

TEST(UrlTest, DefaultPorts) {
    EXPECT_EQ(Url::parse("http://example.com")->port, 80);
    EXPECT_EQ(Url::parse("https://example.com")->port, 443);
}

TEST(UrlTest, KeepsBasePath) {
    auto url = Url::parse("http://10.0.0.5:9000/v1/api?debug=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path, "/v1/api");
    EXPECT_EQ(url->to_string(), "http://10.0.0.5:9000/v1/api");
}

TEST(UrlTest, RootPathIsDropped) {
    auto url = Url::parse("http://localhost:8080/");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path, "");
}

TEST(UrlTest, IPv6Literal) {
    auto url = Url::parse("http://[::1]:8080");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->origin(), "http://[::1]:8080");
}

TEST(UrlTest, RejectsMalformed) {
    for (const char* raw : {"", "localhost:8080", "://host", "ftp://host", "http://",
                            "http://user@host", "http://host:0", "http://host:70000",
                            "http://host:80x", "http://[::1"}) {
        auto url = Url::parse(raw);
        ASSERT_FALSE(url.has_value()) << raw;
        EXPECT_EQ(url.error().code, ErrorCode::InvalidUrl);
    }
}

TEST(UrlTest, SchemeIsCaseInsensitive) {
    auto url = Url::parse("HTTPS://Example.com:8443");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->origin(), "https://Example.com:8443");
}

TEST(UrlTest, NonAsciiSchemeIsRejected) {
    auto url = Url::parse("htt\xC3\xA9p://host:80");
    ASSERT_FALSE(url.has_value());
    EXPECT_EQ(url.error().code, ErrorCode::InvalidUrl);
}
