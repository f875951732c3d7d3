#include <gtest/gtest.h>
#include "uplift/http/message.hpp"
#include "uplift/http/url.hpp"

using namespace uplift::http;

TEST(UrlTest, ParsesHttpsWithDefaults) {
    auto url = Url::parse("https://www.googleapis.com/upload/youtube/v3/videos?uploadType=resumable");
    ASSERT_TRUE(url.has_value());
    
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "www.googleapis.com");
    EXPECT_EQ(url->port, 443);
    EXPECT_EQ(url->target, "/upload/youtube/v3/videos?uploadType=resumable");
    EXPECT_TRUE(url->secure());
    EXPECT_EQ(url->authority(), "www.googleapis.com");
}

TEST(UrlTest, ParsesExplicitPort) {
    auto url = Url::parse("HTTP://127.0.0.1:8080");
    ASSERT_TRUE(url.has_value());
    
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->port, 8080);
    EXPECT_EQ(url->target, "/");
    EXPECT_EQ(url->authority(), "127.0.0.1:8080");
    EXPECT_EQ(url->to_string(), "http://127.0.0.1:8080/");
}

TEST(UrlTest, ParsesBracketedIpv6) {
    auto url = Url::parse("http://[::1]:9000/media.mp4#frag");
    ASSERT_TRUE(url.has_value());
    
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, 9000);
    EXPECT_EQ(url->target, "/media.mp4");
    EXPECT_EQ(url->authority(), "[::1]:9000");
}

TEST(UrlTest, RejectsUnsupportedInput) {
    EXPECT_FALSE(Url::parse("video.mp4").has_value());
    EXPECT_FALSE(Url::parse("ftp://example.com/file").has_value());
    EXPECT_FALSE(Url::parse("https://user:pw@example.com/").has_value());
    EXPECT_FALSE(Url::parse("http:///path").has_value());
    EXPECT_FALSE(Url::parse("http://example.com:0/").has_value());
    EXPECT_FALSE(Url::parse("http://example.com:70000/").has_value());
    EXPECT_FALSE(Url::parse("http://example.com:http/").has_value());
    EXPECT_FALSE(Url::parse("http://[::1/").has_value());
}

TEST(UrlTest, ResolvesLocations) {
    auto base = Url::parse("https://upload.example.com:8443/upload/videos?part=snippet");
    ASSERT_TRUE(base.has_value());
    
    EXPECT_EQ(base->resolve("https://other.example.com/session/1"),
              "https://other.example.com/session/1");
    EXPECT_EQ(base->resolve("/session?upload_id=abc"),
              "https://upload.example.com:8443/session?upload_id=abc");
    EXPECT_EQ(base->resolve("session?upload_id=abc"),
              "https://upload.example.com:8443/upload/session?upload_id=abc");
}

TEST(UrlTest, RedirectStatuses) {
    for (int status : {301, 302, 303, 307, 308}) {
        EXPECT_TRUE(is_redirect(status)) << status;
    }
    for (int status : {200, 304, 305, 400, 404}) {
        EXPECT_FALSE(is_redirect(status)) << status;
    }
}
