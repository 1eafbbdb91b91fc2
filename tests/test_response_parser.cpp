/**
 * @file test_response_parser.cpp
 * @brief Tests for geocoding response decoding
 */

#include "ResponseParser.hpp"
#include "GeocodeError.hpp"
#include <gtest/gtest.h>

using namespace geocoder;

namespace {

const char* const MAIN_ST_BODY = R"({
    "results": [
        {
            "formatted_address": "1 Main St",
            "geometry": { "location": { "Lat": 1.0, "Lng": 2.0 } }
        },
        {
            "formatted_address": "2 Main St",
            "geometry": { "location": { "lat": 3.0, "lng": 4.0 } }
        }
    ],
    "status": "OK"
})";

} // namespace

TEST(ResponseParserTest, ForwardTakesFirstResult) {
    GeocodeResult result = parse_geocode_response(MAIN_ST_BODY);
    EXPECT_EQ(result.formatted_address, "1 Main St");
    EXPECT_EQ(result.location, GeoPoint(1.0, 2.0));
}

TEST(ResponseParserTest, ReverseTakesFirstAddress) {
    EXPECT_EQ(parse_reverse_geocode_response(MAIN_ST_BODY), "1 Main St");
}

TEST(ResponseParserTest, EmptyResultsIsZeroResults) {
    const char* body = R"({"results": [], "status": "ZERO_RESULTS"})";
    EXPECT_THROW(parse_geocode_response(body), ZeroResultsError);
    EXPECT_THROW(parse_reverse_geocode_response(body), ZeroResultsError);
    EXPECT_THROW(parse_geocode_response("{}"), ZeroResultsError);
    EXPECT_THROW(parse_geocode_response("null"), ZeroResultsError);
}

TEST(ResponseParserTest, ZeroResultsCarriesUpstreamStatus) {
    const char* body = R"({"results": [], "status": "REQUEST_DENIED",
                           "error_message": "The provided API key is invalid."})";
    try {
        parse_geocode_response(body);
        FAIL() << "expected ZeroResultsError";
    } catch (const ZeroResultsError& e) {
        EXPECT_EQ(e.status(), "REQUEST_DENIED");
        EXPECT_EQ(e.error_message(), "The provided API key is invalid.");
        EXPECT_EQ(std::string(e.what()),
                  "ZERO_RESULTS (status REQUEST_DENIED): The provided API key is invalid.");
    }
}

TEST(ResponseParserTest, MalformedJsonIsDecodeError) {
    EXPECT_THROW(parse_geocode_response("{\"results\": ["), DecodeError);
    EXPECT_THROW(parse_geocode_response("<html>502 Bad Gateway</html>"), DecodeError);
    EXPECT_THROW(parse_reverse_geocode_response(""), DecodeError);
}

TEST(ResponseParserTest, WrongShapesAreDecodeErrors) {
    EXPECT_THROW(parse_geocode_response("[1, 2]"), DecodeError);
    EXPECT_THROW(parse_geocode_response(R"({"results": "none"})"), DecodeError);
    EXPECT_THROW(parse_geocode_response(R"({"results": [42]})"), DecodeError);
    EXPECT_THROW(parse_geocode_response(R"({"results": [{"formatted_address": 7}]})"), DecodeError);
    EXPECT_THROW(parse_geocode_response(
        R"({"results": [{"geometry": {"location": {"lat": "north"}}}]})"), DecodeError);
}

TEST(ResponseParserTest, MissingFieldsDefault) {
    GeocodeResult result = parse_geocode_response(R"({"results": [{}]})");
    EXPECT_EQ(result.formatted_address, "");
    EXPECT_EQ(result.location, GeoPoint(0.0, 0.0));
}
