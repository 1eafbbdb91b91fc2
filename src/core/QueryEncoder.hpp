/**
 * @file QueryEncoder.hpp
 * @brief Scheme-agnostic query construction for geocode requests
 */

#pragma once

#include "geocoder.hpp"
#include <string>

namespace geocoder {

/**
 * @brief Escape a value for use inside a URL query component
 *
 * Unreserved characters [A-Za-z0-9-_.~] are kept, space becomes '+',
 * every other byte is written as %XX with uppercase hex digits.
 */
std::string query_escape(const std::string& value);

/**
 * @brief Inverse of query_escape
 * @throws QueryDecodeError on a truncated or non-hex % escape
 */
std::string query_unescape(const std::string& value);

/**
 * @brief Format a coordinate with the shortest representation that
 * reads back to the same double
 */
std::string format_coordinate(double value);

/**
 * @brief Build "address=<escaped address>"
 */
std::string build_geocode_query(const std::string& address);

/**
 * @brief Build "latlng=<lat>,<lng>"
 */
std::string build_reverse_geocode_query(const GeoPoint& point);

/**
 * @brief Replace the values of credential parameters (key, signature)
 * in a URL or query string with "REDACTED" for logging
 */
std::string redact_query_secrets(const std::string& url);

} // namespace geocoder
