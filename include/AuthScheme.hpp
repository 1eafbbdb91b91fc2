#pragma once

/**
 * @file AuthScheme.hpp
 * @brief Authentication schemes for Google Geocoding API requests
 *
 * Each scheme knows how to finish a base query string ("sensor=false&...")
 * into the query that is actually sent:
 *  - Unauthenticated: query unchanged
 *  - Token: "&key=<api key>" appended
 *  - Signed (client ID): "&channel=", "&client=" and an HMAC-SHA1
 *    "&signature=" appended
 *
 * Schemes are immutable and safe to share between threads.
 */

#include <memory>
#include <string>

namespace geocoder {

enum class AuthSchemeKind {
    UNAUTHENTICATED,
    TOKEN,
    SIGNED
};

/**
 * @brief Name used in configuration files and on the command line
 * @return "none", "token" or "signed"
 */
std::string auth_scheme_name(AuthSchemeKind kind);

/**
 * @brief Inverse of auth_scheme_name (also accepts a few aliases)
 * @throws ConfigError for unknown names
 */
AuthSchemeKind parse_auth_scheme_kind(const std::string& name);

/**
 * @brief Base class for all authentication schemes
 */
class AuthScheme {
public:
    virtual ~AuthScheme() = default;

    virtual AuthSchemeKind kind() const = 0;

    /**
     * @brief Produce the final query string for a request
     *
     * @param query Base query, already starting with "sensor=false&"
     * @param base_url Endpoint the query will be appended to (used by
     *        schemes that sign the whole URL)
     * @return Query string to send
     *
     * @throws KeyDecodeError, UrlParseError from the signed scheme
     */
    virtual std::string finish_query(const std::string& query, const std::string& base_url) const = 0;
};

using AuthSchemePtr = std::shared_ptr<const AuthScheme>;

class UnauthenticatedScheme : public AuthScheme {
public:
    AuthSchemeKind kind() const override { return AuthSchemeKind::UNAUTHENTICATED; }
    std::string finish_query(const std::string& query, const std::string& base_url) const override;
};

class TokenAuthScheme : public AuthScheme {
public:
    explicit TokenAuthScheme(std::string api_key) : api_key_(std::move(api_key)) {}

    AuthSchemeKind kind() const override { return AuthSchemeKind::TOKEN; }
    std::string finish_query(const std::string& query, const std::string& base_url) const override;

    const std::string& api_key() const { return api_key_; }

private:
    std::string api_key_;
};

/**
 * @brief Google Maps Platform client ID authentication
 *
 * The private key is the base64url string Google issues with the client ID.
 * It is only decoded when a request is signed, so a bad key surfaces as
 * KeyDecodeError from finish_query(), before anything is sent.
 */
class SignedAuthScheme : public AuthScheme {
public:
    SignedAuthScheme(std::string client_id, std::string private_key, std::string channel = "")
        : client_id_(std::move(client_id)), private_key_(std::move(private_key)),
          channel_(std::move(channel)) {}

    AuthSchemeKind kind() const override { return AuthSchemeKind::SIGNED; }
    std::string finish_query(const std::string& query, const std::string& base_url) const override;

    const std::string& client_id() const { return client_id_; }
    const std::string& private_key() const { return private_key_; }
    const std::string& channel() const { return channel_; }

private:
    std::string client_id_;
    std::string private_key_;
    std::string channel_;
};

// Factory functions
AuthSchemePtr make_unauthenticated();
AuthSchemePtr make_token_auth(const std::string& api_key);
AuthSchemePtr make_signed_auth(const std::string& client_id, const std::string& private_key,
                               const std::string& channel = "");

} // namespace geocoder
