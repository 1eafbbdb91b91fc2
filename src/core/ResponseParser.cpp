/**
 * @file ResponseParser.cpp
 * @brief Implementation of geocoding response parsing
 */

#include "ResponseParser.hpp"
#include "GeocodeError.hpp"
#include "Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace geocoder {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

// Exact key first, then the first case-insensitive match
const json* find_field(const json& object, const std::string& name) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto exact = object.find(name);
    if (exact != object.end()) {
        return &exact.value();
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (iequals(it.key(), name)) {
            return &it.value();
        }
    }
    return nullptr;
}

std::string string_field(const json& object, const std::string& name, const std::string& path) {
    const json* field = find_field(object, name);
    if (field == nullptr || field->is_null()) {
        return "";
    }
    if (!field->is_string()) {
        throw DecodeError("'" + path + "' is " + std::string(field->type_name()) + ", expected string");
    }
    return field->get<std::string>();
}

double number_field(const json& object, const std::string& name, const std::string& path) {
    const json* field = find_field(object, name);
    if (field == nullptr || field->is_null()) {
        return 0.0;
    }
    if (!field->is_number()) {
        throw DecodeError("'" + path + "' is " + std::string(field->type_name()) + ", expected number");
    }
    return field->get<double>();
}

const json* object_field(const json& object, const std::string& name, const std::string& path) {
    const json* field = find_field(object, name);
    if (field == nullptr || field->is_null()) {
        return nullptr;
    }
    if (!field->is_object()) {
        throw DecodeError("'" + path + "' is " + std::string(field->type_name()) + ", expected object");
    }
    return field;
}

/**
 * @brief Parse the body and return the first element of "results"
 *
 * Throws ZeroResultsError (with the upstream status, if any) when there
 * is nothing to return.
 */
json first_result(const std::string& body) {
    Logger logger("ResponseParser");

    json document;
    try {
        document = json::parse(body);
    } catch (const json::parse_error& e) {
        throw DecodeError(e.what());
    }

    if (document.is_null()) {
        throw ZeroResultsError();
    }
    if (!document.is_object()) {
        throw DecodeError("top-level value is " + std::string(document.type_name()) + ", expected object");
    }

    std::string status = string_field(document, "status", "status");
    std::string error_message = string_field(document, "error_message", "error_message");
    if (!status.empty()) {
        logger.detailed("Response status: " + status);
    }

    const json* results = find_field(document, "results");
    if (results != nullptr && !results->is_null() && !results->is_array()) {
        throw DecodeError("'results' is " + std::string(results->type_name()) + ", expected array");
    }
    if (results == nullptr || results->is_null() || results->empty()) {
        throw ZeroResultsError(status, error_message);
    }

    logger.debug("Response contains " + std::to_string(results->size()) + " result(s)");

    const json& first = results->front();
    if (!first.is_object()) {
        throw DecodeError("'results[0]' is " + std::string(first.type_name()) + ", expected object");
    }
    return first;
}

} // namespace

GeocodeResult parse_geocode_response(const std::string& body) {
    json first = first_result(body);

    GeocodeResult result;
    result.formatted_address = string_field(first, "formatted_address", "results[0].formatted_address");

    double lat = 0.0;
    double lng = 0.0;
    if (const json* geometry = object_field(first, "geometry", "results[0].geometry")) {
        if (const json* location = object_field(*geometry, "location", "results[0].geometry.location")) {
            lat = number_field(*location, "lat", "results[0].geometry.location.lat");
            lng = number_field(*location, "lng", "results[0].geometry.location.lng");
        }
    }
    result.location = GeoPoint(lat, lng);

    return result;
}

std::string parse_reverse_geocode_response(const std::string& body) {
    json first = first_result(body);
    return string_field(first, "formatted_address", "results[0].formatted_address");
}

} // namespace geocoder
