#pragma once

/**
 * @file geocoder.hpp
 * @brief Main header for the Google Maps geocoding client
 *
 * Core value types shared by the query builder, the authentication
 * schemes, the response parser and the GoogleGeocoder facade.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <memory>
#include <string>

// Forward declarations
namespace geocoder {
    class AuthScheme;
    class HttpTransport;
}

namespace geocoder {

/// Default Google Geocoding API endpoint (JSON output)
inline constexpr const char* DEFAULT_GEOCODE_URL = "https://maps.googleapis.com/maps/api/geocode/json";

// ============================================================================
// Value types
// ============================================================================

/**
 * @brief Geographic point in decimal degrees
 *
 * No range validation is performed; the values are passed through as given.
 */
struct GeoPoint {
    double lat_, lng_;

    GeoPoint() : lat_(0), lng_(0) {}
    GeoPoint(double lat, double lng) : lat_(lat), lng_(lng) {}

    double lat() const { return lat_; }
    double lng() const { return lng_; }

    bool operator==(const GeoPoint& other) const {
        return lat_ == other.lat_ && lng_ == other.lng_;
    }
    bool operator!=(const GeoPoint& other) const { return !(*this == other); }
};

/**
 * @brief Result of a forward geocode
 */
struct GeocodeResult {
    std::string formatted_address;
    GeoPoint location;

    GeocodeResult() = default;
    GeocodeResult(std::string address, const GeoPoint& point)
        : formatted_address(std::move(address)), location(point) {}
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Options for the default libcurl transport
 */
struct TransportOptions {
    int timeout_seconds = 10;
    std::string user_agent = "gmaps-geocoder/1.0";

    // Status codes are not inspected unless this is set; any body is handed
    // to the response parser.
    bool fail_on_http_error = false;
};

/**
 * @brief Per-instance client configuration
 *
 * Immutable once handed to a GoogleGeocoder. The auth scheme carries the
 * credentials it needs; nothing is stored process-wide.
 */
struct GeocoderConfig {
    std::string base_url = DEFAULT_GEOCODE_URL;
    std::shared_ptr<const AuthScheme> auth_scheme;  // nullptr means unauthenticated
    TransportOptions transport;
};

} // namespace geocoder
