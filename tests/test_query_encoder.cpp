/**
 * @file test_query_encoder.cpp
 * @brief Tests for query escaping, coordinate formatting and redaction
 */

#include "QueryEncoder.hpp"
#include "GeocodeError.hpp"
#include <gtest/gtest.h>

using namespace geocoder;

TEST(QueryEncoderTest, EscapesReservedCharactersAndSpaces) {
    EXPECT_EQ(query_escape("1600 Amphitheatre Pkwy, Mountain View, CA & more/\xC3\xA9?#=+"),
              "1600+Amphitheatre+Pkwy%2C+Mountain+View%2C+CA+%26+more%2F%C3%A9%3F%23%3D%2B");
}

TEST(QueryEncoderTest, LeavesUnreservedCharactersAlone) {
    EXPECT_EQ(query_escape("AZaz09-_.~"), "AZaz09-_.~");
    EXPECT_EQ(query_escape(""), "");
}

TEST(QueryEncoderTest, UnescapeReversesEscape) {
    const std::string samples[] = {
        "New York",
        "Straße 12, München",
        "a+b=c&d",
        "100% sure",
        "",
    };
    for (const auto& sample : samples) {
        EXPECT_EQ(query_unescape(query_escape(sample)), sample) << sample;
    }
}

TEST(QueryEncoderTest, UnescapeRejectsMalformedEscapes) {
    EXPECT_THROW(query_unescape("abc%"), QueryDecodeError);
    EXPECT_THROW(query_unescape("abc%4"), QueryDecodeError);
    EXPECT_THROW(query_unescape("%zz"), QueryDecodeError);
    EXPECT_EQ(query_unescape("%41%62"), "Ab");
}

TEST(QueryEncoderTest, FormatsCoordinatesWithShortestRoundTrip) {
    EXPECT_EQ(format_coordinate(40.714224), "40.714224");
    EXPECT_EQ(format_coordinate(-73.961452), "-73.961452");
    EXPECT_EQ(format_coordinate(0.0), "0");
    EXPECT_EQ(format_coordinate(1.0), "1");

    double precise = 37.42199990000001;
    EXPECT_EQ(std::stod(format_coordinate(precise)), precise);
}

TEST(QueryEncoderTest, BuildsForwardAndReverseQueries) {
    EXPECT_EQ(build_geocode_query("New York"), "address=New+York");
    EXPECT_EQ(build_reverse_geocode_query(GeoPoint(40.714224, -73.961452)),
              "latlng=40.714224,-73.961452");
}

TEST(QueryEncoderTest, RedactsKeyAndSignature) {
    EXPECT_EQ(redact_query_secrets("https://h/p?sensor=false&address=X&key=SECRET"),
              "https://h/p?sensor=false&address=X&key=REDACTED");
    EXPECT_EQ(redact_query_secrets("https://h/p?address=X&client=c&signature=abc=&channel=web"),
              "https://h/p?address=X&client=c&signature=REDACTED&channel=web");
    EXPECT_EQ(redact_query_secrets("https://h/p?monkey=1&address=X"),
              "https://h/p?monkey=1&address=X");
}
