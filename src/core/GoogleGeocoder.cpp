/**
 * @file GoogleGeocoder.cpp
 * @brief Implementation of the Google geocoding facade
 */

#include "GoogleGeocoder.hpp"
#include "GeocodeError.hpp"
#include "HttpTransport.hpp"
#include "Logger.hpp"
#include "QueryEncoder.hpp"
#include "ResponseParser.hpp"

namespace geocoder {

namespace {

// Legacy parameter the upstream API expects first on every request
const char* const SENSOR_PARAM = "sensor=false";

GeocoderConfig normalized(GeocoderConfig config) {
    if (!config.auth_scheme) {
        config.auth_scheme = make_unauthenticated();
    }
    return config;
}

} // namespace

GoogleGeocoder::GoogleGeocoder()
    : GoogleGeocoder(GeocoderConfig()) {
}

GoogleGeocoder::GoogleGeocoder(const GeocoderConfig& config)
    : config_(normalized(config)),
      transport_(std::make_shared<CurlTransport>(config.transport)) {
}

GoogleGeocoder::GoogleGeocoder(const GeocoderConfig& config, std::shared_ptr<const HttpTransport> transport)
    : config_(normalized(config)), transport_(std::move(transport)) {
    if (!transport_) {
        throw ConfigError("GoogleGeocoder requires a transport");
    }
}

GeocodeResult GoogleGeocoder::geocode(const std::string& address) const {
    Logger logger("GoogleGeocoder");
    logger.detailed("Geocoding address: " + address);

    std::string body = request(formatted_request_query(build_geocode_query(address)));
    GeocodeResult result = parse_geocode_response(body);

    logger.debug("Geocoded '" + address + "' to " + result.formatted_address + " (" +
                 format_coordinate(result.location.lat()) + ", " +
                 format_coordinate(result.location.lng()) + ")");
    return result;
}

std::string GoogleGeocoder::reverse_geocode(const GeoPoint& point) const {
    Logger logger("GoogleGeocoder");
    logger.detailed("Reverse geocoding: " + format_coordinate(point.lat()) + ", " + format_coordinate(point.lng()));

    std::string body = request(formatted_request_query(build_reverse_geocode_query(point)));
    std::string address = parse_reverse_geocode_response(body);

    logger.debug("Reverse geocoded to " + address);
    return address;
}

std::string GoogleGeocoder::request(const std::string& params) const {
    return transport_->get(config_.base_url + "?" + params);
}

std::string GoogleGeocoder::formatted_request_query(const std::string& params) const {
    std::string query = std::string(SENSOR_PARAM) + "&" + params;
    return config_.auth_scheme->finish_query(query, config_.base_url);
}

std::string GoogleGeocoder::request_url_for_address(const std::string& address) const {
    return config_.base_url + "?" + formatted_request_query(build_geocode_query(address));
}

std::string GoogleGeocoder::request_url_for_point(const GeoPoint& point) const {
    return config_.base_url + "?" + formatted_request_query(build_reverse_geocode_query(point));
}

GoogleGeocoder GoogleGeocoder::with_base_url(const std::string& base_url) const {
    GeocoderConfig config = config_;
    config.base_url = base_url;
    return GoogleGeocoder(config, transport_);
}

GoogleGeocoder GoogleGeocoder::with_auth_scheme(AuthSchemePtr auth_scheme) const {
    GeocoderConfig config = config_;
    config.auth_scheme = std::move(auth_scheme);
    return GoogleGeocoder(config, transport_);
}

GoogleGeocoder GoogleGeocoder::with_transport(std::shared_ptr<const HttpTransport> transport) const {
    return GoogleGeocoder(config_, std::move(transport));
}

} // namespace geocoder
