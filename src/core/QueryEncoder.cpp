/**
 * @file QueryEncoder.cpp
 * @brief Implementation of query construction helpers
 */

#include "QueryEncoder.hpp"
#include "GeocodeError.hpp"
#include <charconv>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace geocoder {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string query_escape(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

std::string query_unescape(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            decoded.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= value.size()) {
                throw QueryDecodeError("truncated escape at offset " + std::to_string(i));
            }
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                throw QueryDecodeError("invalid escape '" + value.substr(i, 3) + "'");
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }

    return decoded;
}

std::string format_coordinate(double value) {
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        std::ostringstream fallback;
        fallback << std::setprecision(17) << value;
        return fallback.str();
    }
    return std::string(buffer, end);
}

std::string build_geocode_query(const std::string& address) {
    return "address=" + query_escape(address);
}

std::string build_reverse_geocode_query(const GeoPoint& point) {
    return "latlng=" + format_coordinate(point.lat()) + "," + format_coordinate(point.lng());
}

std::string redact_query_secrets(const std::string& url) {
    static const char* const secret_params[] = {"key", "signature"};
    static const std::string placeholder = "REDACTED";

    std::string redacted = url;
    size_t query_start = redacted.find('?');
    size_t pos = query_start == std::string::npos ? 0 : query_start + 1;

    while (pos < redacted.size()) {
        size_t end = redacted.find('&', pos);
        if (end == std::string::npos) end = redacted.size();

        size_t eq = redacted.find('=', pos);
        if (eq != std::string::npos && eq < end) {
            std::string name = redacted.substr(pos, eq - pos);
            for (const char* secret : secret_params) {
                if (name == secret) {
                    redacted.replace(eq + 1, end - eq - 1, placeholder);
                    end = eq + 1 + placeholder.size();
                    break;
                }
            }
        }
        pos = end + 1;
    }

    return redacted;
}

} // namespace geocoder
