/**
 * @file UrlSigner.hpp
 * @brief HMAC-SHA1 URL signing for Google Maps Platform client IDs
 *
 * The signature covers the request target of the URL (path plus raw query,
 * no scheme or host) exactly as it will be sent. The private key and the
 * resulting signature are both base64url (RFC 4648 section 5).
 */

#pragma once

#include <string>
#include <vector>

namespace geocoder {

/**
 * @brief Reduce a URL to its request target ("/path?query")
 *
 * Scheme, authority and fragment are removed; the path and query are kept
 * byte for byte. An empty path becomes "/".
 *
 * @throws UrlParseError if the URL cannot be parsed
 */
std::string request_target(const std::string& url);

/**
 * @brief Decode base64url text, padded or unpadded
 * @throws KeyDecodeError on characters outside the URL-safe alphabet or a bad length
 */
std::vector<unsigned char> base64url_decode(const std::string& encoded);

/**
 * @brief Encode bytes as padded base64url
 */
std::string base64url_encode(const std::vector<unsigned char>& data);

/**
 * @brief Raw 20-byte HMAC-SHA1 digest of message under key
 */
std::vector<unsigned char> hmac_sha1(const std::vector<unsigned char>& key, const std::string& message);

/**
 * @brief Sign a full request URL
 *
 * @param full_url URL including scheme, host, path and query
 * @param base64url_key Private key as issued by Google (base64url)
 * @return base64url signature, ready to append as "&signature=<value>"
 *
 * @throws KeyDecodeError if the key is not valid base64url
 * @throws UrlParseError if full_url cannot be parsed
 */
std::string sign_url(const std::string& full_url, const std::string& base64url_key);

} // namespace geocoder
