/**
 * @file test_url_signer.cpp
 * @brief Tests for request-target extraction and HMAC-SHA1 URL signing
 */

#include "UrlSigner.hpp"
#include "GeocodeError.hpp"
#include <gtest/gtest.h>

using namespace geocoder;

namespace {

std::vector<unsigned char> bytes(const std::string& text) {
    return std::vector<unsigned char>(text.begin(), text.end());
}

std::string hex(const std::vector<unsigned char>& data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (unsigned char b : data) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

} // namespace

TEST(UrlSignerTest, SignsGoogleDocumentationExample) {
    EXPECT_EQ(sign_url("https://maps.googleapis.com/maps/api/geocode/json?address=New+York&client=clientID",
                       "vNIXE0xscrmjlyV-12Nj_BvUPaw="),
              "chaRF2hTJKOScPr-RQCEhZbSzIE=");
}

TEST(UrlSignerTest, HmacSha1MatchesRfc2202) {
    std::vector<unsigned char> key = base64url_decode("SmVmZQ==");
    EXPECT_EQ(key, bytes("Jefe"));

    auto digest = hmac_sha1(key, "what do ya want for nothing?");
    EXPECT_EQ(hex(digest), "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
    EXPECT_EQ(base64url_encode(digest), "7_zfauXrL6LSdBbV8YTfnCWafHk=");
}

TEST(UrlSignerTest, DecodesUnpaddedKeys) {
    EXPECT_EQ(base64url_decode("SmVmZQ"), bytes("Jefe"));
    EXPECT_EQ(base64url_decode("_-8"), (std::vector<unsigned char>{0xff, 0xef}));
    EXPECT_TRUE(base64url_decode("").empty());
}

TEST(UrlSignerTest, RejectsInvalidKeys) {
    EXPECT_THROW(base64url_decode("not base64!"), KeyDecodeError);
    EXPECT_THROW(base64url_decode("abc+def/"), KeyDecodeError);
    EXPECT_THROW(base64url_decode("abcde"), KeyDecodeError);
    EXPECT_THROW(base64url_decode("SmVmZQ="), KeyDecodeError);
    EXPECT_THROW(sign_url("https://h/p?a=b", "%%%"), ConfigError);
}

TEST(UrlSignerTest, RequestTargetIsPathAndQuery) {
    EXPECT_EQ(request_target("https://maps.googleapis.com/maps/api/geocode/json?sensor=false&address=New+York"),
              "/maps/api/geocode/json?sensor=false&address=New+York");
    EXPECT_EQ(request_target("http://localhost:8080/geo?x=1"), "/geo?x=1");
    EXPECT_EQ(request_target("http://user:pw@[::1]:8080/geo"), "/geo");
    EXPECT_EQ(request_target("http://example.com"), "/");
    EXPECT_EQ(request_target("http://example.com?x=1"), "/?x=1");
    EXPECT_EQ(request_target("http://example.com/p#fragment"), "/p");
    EXPECT_EQ(request_target("/relative/path?q=1"), "/relative/path?q=1");
}

TEST(UrlSignerTest, RequestTargetRejectsMalformedUrls) {
    EXPECT_THROW(request_target("://no-scheme/path"), UrlParseError);
    EXPECT_THROW(request_target("http://bad host/path"), UrlParseError);
    EXPECT_THROW(request_target("http://host:port/path"), UrlParseError);
    EXPECT_THROW(request_target("http:///path"), UrlParseError);
    EXPECT_THROW(request_target("http://host/%zz"), UrlParseError);
    EXPECT_THROW(request_target("http://host/p\x01"), UrlParseError);
    EXPECT_THROW(request_target("1http://host/p"), UrlParseError);
}
