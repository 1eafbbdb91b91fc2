/**
 * @file HttpTransport.cpp
 * @brief libcurl implementation of the HTTP transport
 */

#include "HttpTransport.hpp"
#include "GeocodeError.hpp"
#include "Logger.hpp"
#include "QueryEncoder.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace geocoder {

namespace {

// Callback for CURL to write response data
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    static CURLcode init_result = CURLE_OK;
    std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (init_result != CURLE_OK) {
        throw TransportError("curl_global_init failed: " + std::string(curl_easy_strerror(init_result)));
    }
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

} // namespace

CurlTransport::CurlTransport(const TransportOptions& options)
    : options_(options) {
}

std::string CurlTransport::get(const std::string& url) const {
    Logger logger("CurlTransport");
    ensure_curl_initialized();

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransportError("failed to initialize CURL handle");
    }

    std::string response_data;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_data);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    logger.debug("GET " + redact_query_secrets(url));

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(res));
        throw TransportError("CURL request failed: " + detail);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    logger.detailed("HTTP " + std::to_string(http_code) + ", " + std::to_string(response_data.size()) + " bytes");
    logger.trace("Response body: " + response_data);

    if (options_.fail_on_http_error && (http_code < 200 || http_code >= 300)) {
        throw TransportError("HTTP error " + std::to_string(http_code), http_code);
    }

    return response_data;
}

} // namespace geocoder
