/**
 * @file GoogleGeocoder.hpp
 * @brief Google Maps Geocoding API client
 *
 * Converts addresses to coordinates and coordinates to addresses using
 * the Google Geocoding web service, with unauthenticated, API key or
 * client ID (signed URL) authentication.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "geocoder.hpp"
#include "AuthScheme.hpp"
#include <memory>
#include <string>

namespace geocoder {

/**
 * @brief Geocoding client bound to one endpoint and one auth scheme
 *
 * Instances are immutable: the with_*() methods return a reconfigured
 * copy and leave the original untouched. A single instance may be used
 * from several threads concurrently.
 *
 * Every operation either returns a complete result or throws a
 * GeocodeError subclass; there are no retries.
 */
class GoogleGeocoder {
public:
    /**
     * @brief Unauthenticated client for the default endpoint using libcurl
     */
    GoogleGeocoder();

    /**
     * @brief Client using the default libcurl transport built from config.transport
     */
    explicit GoogleGeocoder(const GeocoderConfig& config);

    /**
     * @brief Client using a caller supplied transport
     */
    GoogleGeocoder(const GeocoderConfig& config, std::shared_ptr<const HttpTransport> transport);

    /**
     * @brief Geocode an address
     * @param address Free-form address or place name
     * @return Formatted address and location of the first match
     *
     * @throws ZeroResultsError if the service found nothing
     * @throws KeyDecodeError, UrlParseError from the signed scheme
     * @throws TransportError, DecodeError
     */
    GeocodeResult geocode(const std::string& address) const;

    /**
     * @brief Reverse geocode a point
     * @return Formatted address of the first match
     */
    std::string reverse_geocode(const GeoPoint& point) const;

    /**
     * @brief Send "<base url>?<params>" as-is and return the raw body
     *
     * No authentication is added; callers passing raw params are
     * responsible for their own key.
     */
    std::string request(const std::string& params) const;

    /**
     * @brief "sensor=false&<params>" finished by the configured auth scheme
     */
    std::string formatted_request_query(const std::string& params) const;

    /// Full URL that geocode(address) would request
    std::string request_url_for_address(const std::string& address) const;

    /// Full URL that reverse_geocode(point) would request
    std::string request_url_for_point(const GeoPoint& point) const;

    // Builder-style reconfiguration
    GoogleGeocoder with_base_url(const std::string& base_url) const;
    GoogleGeocoder with_auth_scheme(AuthSchemePtr auth_scheme) const;
    GoogleGeocoder with_transport(std::shared_ptr<const HttpTransport> transport) const;

    const GeocoderConfig& config() const { return config_; }
    const AuthScheme& auth_scheme() const { return *config_.auth_scheme; }

private:
    GeocoderConfig config_;
    std::shared_ptr<const HttpTransport> transport_;
};

} // namespace geocoder
