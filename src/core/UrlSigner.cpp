/**
 * @file UrlSigner.cpp
 * @brief Implementation of request-target canonicalization and HMAC-SHA1 signing
 */

#include "UrlSigner.hpp"
#include "GeocodeError.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>

namespace geocoder {

namespace {

bool is_control(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7f;
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

void validate_scheme(const std::string& scheme) {
    if (scheme.empty()) {
        throw UrlParseError("missing protocol scheme");
    }
    if (!std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        throw UrlParseError("first character of scheme '" + scheme + "' is not a letter");
    }
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            throw UrlParseError("invalid character in scheme '" + scheme + "'");
        }
    }
}

void validate_authority(const std::string& authority) {
    // Drop userinfo
    std::string host_port = authority;
    size_t at = host_port.rfind('@');
    if (at != std::string::npos) {
        host_port = host_port.substr(at + 1);
    }

    std::string host = host_port;
    std::string port;

    if (!host_port.empty() && host_port[0] == '[') {
        size_t close = host_port.find(']');
        if (close == std::string::npos) {
            throw UrlParseError("missing ']' in host '" + host_port + "'");
        }
        host = host_port.substr(0, close + 1);
        if (close + 1 < host_port.size()) {
            if (host_port[close + 1] != ':') {
                throw UrlParseError("invalid characters after IPv6 host '" + host_port + "'");
            }
            port = host_port.substr(close + 2);
        }
    } else {
        size_t colon = host_port.rfind(':');
        if (colon != std::string::npos) {
            host = host_port.substr(0, colon);
            port = host_port.substr(colon + 1);
        }
    }

    if (host.empty()) {
        throw UrlParseError("missing host");
    }
    if (host.find(' ') != std::string::npos) {
        throw UrlParseError("invalid character ' ' in host name '" + host + "'");
    }
    if (!std::all_of(port.begin(), port.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        throw UrlParseError("invalid port ':" + port + "'");
    }
}

void validate_path_escapes(const std::string& path) {
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] != '%') continue;
        if (i + 2 >= path.size() || !is_hex(path[i + 1]) || !is_hex(path[i + 2])) {
            throw UrlParseError("invalid URL escape '" + path.substr(i, 3) + "'");
        }
        i += 2;
    }
}

bool is_base64url_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

} // namespace

std::string request_target(const std::string& url) {
    for (size_t i = 0; i < url.size(); ++i) {
        if (is_control(url[i])) {
            throw UrlParseError("invalid control character in URL at offset " + std::to_string(i));
        }
    }

    std::string rest = url;

    size_t scheme_end = url.find("://");
    size_t first_delim = url.find_first_of("/?#");
    if (scheme_end != std::string::npos && (first_delim == std::string::npos || scheme_end < first_delim)) {
        validate_scheme(url.substr(0, scheme_end));

        size_t authority_start = scheme_end + 3;
        size_t authority_end = url.find_first_of("/?#", authority_start);
        std::string authority = url.substr(authority_start,
            authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);
        validate_authority(authority);

        rest = authority_end == std::string::npos ? "" : url.substr(authority_end);
    } else if (!url.empty() && url[0] == ':') {
        throw UrlParseError("missing protocol scheme");
    }

    // Fragment is never part of the request target
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }

    size_t question = rest.find('?');
    std::string path = question == std::string::npos ? rest : rest.substr(0, question);
    validate_path_escapes(path);

    std::string target = path.empty() ? "/" : path;
    if (question != std::string::npos) {
        target += rest.substr(question);
    }
    return target;
}

std::vector<unsigned char> base64url_decode(const std::string& encoded) {
    size_t data_len = encoded.size();
    while (data_len > 0 && encoded[data_len - 1] == '=') {
        --data_len;
    }
    size_t padding = encoded.size() - data_len;

    for (size_t i = 0; i < data_len; ++i) {
        if (!is_base64url_char(encoded[i])) {
            throw KeyDecodeError("illegal base64url data at input byte " + std::to_string(i));
        }
    }
    if (data_len % 4 == 1) {
        throw KeyDecodeError("illegal base64url data at input byte " + std::to_string(data_len - 1));
    }
    size_t required_padding = (4 - data_len % 4) % 4;
    if (padding != 0 && padding != required_padding) {
        throw KeyDecodeError("illegal base64url padding at input byte " + std::to_string(data_len));
    }

    // EVP_DecodeBlock expects the standard alphabet with full padding
    std::string standard = encoded.substr(0, data_len);
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');
    standard.append(required_padding, '=');

    if (standard.empty()) {
        return {};
    }

    std::vector<unsigned char> decoded(standard.size() / 4 * 3);
    int written = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(standard.data()),
                                  static_cast<int>(standard.size()));
    if (written < 0) {
        throw KeyDecodeError("OpenSSL rejected the key encoding");
    }
    decoded.resize(static_cast<size_t>(written) - required_padding);
    return decoded;
}

std::string base64url_encode(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return "";
    }

    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                  data.data(), static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));

    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    return encoded;
}

std::vector<unsigned char> hmac_sha1(const std::vector<unsigned char>& key, const std::string& message) {
    static const unsigned char empty_key = 0;

    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;

    const unsigned char* result = HMAC(EVP_sha1(),
                                       key.empty() ? &empty_key : key.data(),
                                       static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       digest.data(), &digest_len);
    if (result == nullptr) {
        throw GeocodeError("HMAC-SHA1 computation failed");
    }

    digest.resize(digest_len);
    return digest;
}

std::string sign_url(const std::string& full_url, const std::string& base64url_key) {
    std::string target = request_target(full_url);
    std::vector<unsigned char> key = base64url_decode(base64url_key);
    return base64url_encode(hmac_sha1(key, target));
}

} // namespace geocoder
