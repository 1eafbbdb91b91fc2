#pragma once

/**
 * @file GeocodeError.hpp
 * @brief Exception hierarchy for the geocoding client
 *
 * Every failure surfaced by the library derives from GeocodeError so callers
 * can catch the whole family at once, or branch on the concrete type
 * (for example ZeroResultsError for "no match" versus TransportError for
 * "request failed").
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <stdexcept>
#include <string>

namespace geocoder {

/**
 * @brief Base class of all geocoding client errors
 */
class GeocodeError : public std::runtime_error {
public:
    explicit GeocodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid client configuration (unknown scheme, missing credentials, bad values)
 */
class ConfigError : public GeocodeError {
public:
    explicit ConfigError(const std::string& message)
        : GeocodeError("Configuration error: " + message) {}
};

/**
 * @brief The signing key is not valid base64url
 *
 * Raised by the signer before any network traffic happens.
 */
class KeyDecodeError : public ConfigError {
public:
    explicit KeyDecodeError(const std::string& message)
        : ConfigError("private key is not valid base64url: " + message) {}
};

/**
 * @brief A request URL could not be parsed into a request target
 */
class UrlParseError : public GeocodeError {
public:
    explicit UrlParseError(const std::string& message)
        : GeocodeError("URL parse error: " + message) {}
};

/**
 * @brief A percent-encoded query component is malformed
 */
class QueryDecodeError : public GeocodeError {
public:
    explicit QueryDecodeError(const std::string& message)
        : GeocodeError("Query decode error: " + message) {}
};

/**
 * @brief Network or HTTP level failure reported by the transport
 */
class TransportError : public GeocodeError {
public:
    explicit TransportError(const std::string& message, long http_status = 0)
        : GeocodeError("Transport error: " + message), http_status_(http_status) {}

    /// HTTP status code when the failure was a rejected status, 0 otherwise
    long http_status() const { return http_status_; }

private:
    long http_status_;
};

/**
 * @brief Response body is not JSON or does not have the expected shape
 */
class DecodeError : public GeocodeError {
public:
    explicit DecodeError(const std::string& message)
        : GeocodeError("Response decode error: " + message) {}
};

/**
 * @brief The service answered but returned no results
 *
 * The upstream status ("ZERO_RESULTS", "REQUEST_DENIED", ...) and its
 * error_message are carried along when the response included them.
 */
class ZeroResultsError : public GeocodeError {
public:
    explicit ZeroResultsError(const std::string& status = "",
                              const std::string& error_message = "")
        : GeocodeError(build_message(status, error_message)),
          status_(status), error_message_(error_message) {}

    const std::string& status() const { return status_; }
    const std::string& error_message() const { return error_message_; }

private:
    std::string status_;
    std::string error_message_;

    static std::string build_message(const std::string& status, const std::string& error_message) {
        std::string message = "ZERO_RESULTS";
        if (!status.empty() && status != "ZERO_RESULTS") {
            message += " (status " + status + ")";
        }
        if (!error_message.empty()) {
            message += ": " + error_message;
        }
        return message;
    }
};

} // namespace geocoder
