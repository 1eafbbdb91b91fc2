/**
 * @file HttpTransport.hpp
 * @brief HTTP GET transport used by the geocoder
 *
 * The geocoder only needs "send GET, receive body bytes". HttpTransport is
 * the seam; CurlTransport is the default libcurl implementation and tests
 * substitute their own.
 */

#pragma once

#include "geocoder.hpp"
#include <memory>
#include <string>

namespace geocoder {

/**
 * @brief Abstract GET-only HTTP transport
 *
 * Implementations must be safe to call from several threads at once.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform a GET request
     * @param url Complete URL including query string
     * @return Response body
     * @throws TransportError on network failure
     */
    virtual std::string get(const std::string& url) const = 0;
};

/**
 * @brief libcurl based transport, one easy handle per request
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(const TransportOptions& options);

    std::string get(const std::string& url) const override;

private:
    TransportOptions options_;
};

} // namespace geocoder
