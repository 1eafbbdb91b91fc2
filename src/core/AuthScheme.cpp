/**
 * @file AuthScheme.cpp
 * @brief Implementation of the request authentication schemes
 */

#include "AuthScheme.hpp"
#include "GeocodeError.hpp"
#include "Logger.hpp"
#include "UrlSigner.hpp"
#include <algorithm>
#include <cctype>

namespace geocoder {

std::string auth_scheme_name(AuthSchemeKind kind) {
    switch (kind) {
        case AuthSchemeKind::TOKEN: return "token";
        case AuthSchemeKind::SIGNED: return "signed";
        default: return "none";
    }
}

AuthSchemeKind parse_auth_scheme_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none" || lower == "unauthenticated" || lower.empty()) {
        return AuthSchemeKind::UNAUTHENTICATED;
    }
    if (lower == "token" || lower == "key" || lower == "api-key") {
        return AuthSchemeKind::TOKEN;
    }
    if (lower == "signed" || lower == "client" || lower == "client-id") {
        return AuthSchemeKind::SIGNED;
    }
    throw ConfigError("unknown auth scheme '" + name + "' (expected none, token or signed)");
}

std::string UnauthenticatedScheme::finish_query(const std::string& query,
                                                [[maybe_unused]] const std::string& base_url) const {
    return query;
}

std::string TokenAuthScheme::finish_query(const std::string& query,
                                          [[maybe_unused]] const std::string& base_url) const {
    return query + "&key=" + api_key_;
}

std::string SignedAuthScheme::finish_query(const std::string& query, const std::string& base_url) const {
    Logger logger("AuthScheme");

    std::string signed_query = query;
    if (!channel_.empty()) {
        signed_query += "&channel=" + channel_;
    }
    signed_query += "&client=" + client_id_;

    std::string url = base_url + "?" + signed_query;
    logger.debug("Signing request for client " + client_id_);
    if (logger.shouldOutput(LogLevel::TRACE)) {
        logger.trace("Request target: " + request_target(url));
    }

    std::string signature = sign_url(url, private_key_);

    return signed_query + "&signature=" + signature;
}

AuthSchemePtr make_unauthenticated() {
    return std::make_shared<UnauthenticatedScheme>();
}

AuthSchemePtr make_token_auth(const std::string& api_key) {
    return std::make_shared<TokenAuthScheme>(api_key);
}

AuthSchemePtr make_signed_auth(const std::string& client_id, const std::string& private_key,
                               const std::string& channel) {
    return std::make_shared<SignedAuthScheme>(client_id, private_key, channel);
}

} // namespace geocoder
