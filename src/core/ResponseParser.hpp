/**
 * @file ResponseParser.hpp
 * @brief Interpretation of Google Geocoding API JSON responses
 *
 * Only the fields the client needs are read: results[].formatted_address
 * and results[].geometry.location.{lat,lng}. Field names are matched
 * case-insensitively, so "Lat"/"Lng" fixtures work as well as the
 * lowercase keys the live service returns.
 */

#pragma once

#include "geocoder.hpp"
#include <string>

namespace geocoder {

/**
 * @brief First result of a forward geocode response
 *
 * @throws DecodeError if the body is not JSON or has the wrong shape
 * @throws ZeroResultsError if the results array is empty or missing
 */
GeocodeResult parse_geocode_response(const std::string& body);

/**
 * @brief Formatted address of the first result of a reverse geocode response
 *
 * @throws DecodeError if the body is not JSON or has the wrong shape
 * @throws ZeroResultsError if the results array is empty or missing
 */
std::string parse_reverse_geocode_response(const std::string& body);

} // namespace geocoder
