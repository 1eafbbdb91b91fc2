/**
 * @file main.cpp
 * @brief Entry point for the gmaps-geocode command line tool
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GoogleGeocoder.hpp"
#include "GeocodeError.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"
#include "core/QueryEncoder.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using namespace geocoder;
using json = nlohmann::json;

namespace {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_GENERIC = 1;
constexpr int EXIT_NO_RESULTS = 2;

void print_geocode_result(const GeocodeResult& result, bool as_json) {
    if (as_json) {
        json out = {
            {"formatted_address", result.formatted_address},
            {"location", {{"lat", result.location.lat()}, {"lng", result.location.lng()}}}
        };
        std::cout << out.dump(2) << "\n";
        return;
    }
    std::cout << result.formatted_address << "\n";
    std::cout << format_coordinate(result.location.lat()) << ","
              << format_coordinate(result.location.lng()) << "\n";
}

void print_reverse_result(const std::string& address, bool as_json) {
    if (as_json) {
        json out = {{"formatted_address", address}};
        std::cout << out.dump(2) << "\n";
        return;
    }
    std::cout << address << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    Logger logger("main");

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return EXIT_OK;  // Help, version or create-config
        }

        if (logger.shouldOutput(LogLevel::DETAILED)) {
            cli.print_config();
        }

        GoogleGeocoder client(cli.get_config());

        if (cli.is_dry_run()) {
            std::string url = cli.get_operation() == CommandLineInterface::Operation::REVERSE_GEOCODE
                ? client.request_url_for_point(cli.get_point())
                : client.request_url_for_address(cli.get_address());
            std::cout << redact_query_secrets(url) << "\n";
            return EXIT_OK;
        }

        if (cli.get_operation() == CommandLineInterface::Operation::REVERSE_GEOCODE) {
            print_reverse_result(client.reverse_geocode(cli.get_point()), cli.is_json_output());
        } else {
            print_geocode_result(client.geocode(cli.get_address()), cli.is_json_output());
        }

        return EXIT_OK;

    } catch (const ZeroResultsError& e) {
        logger.warning(e.what());
        return EXIT_NO_RESULTS;
    } catch (const GeocodeError& e) {
        logger.error(e.what());
        return EXIT_FAILURE_GENERIC;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return EXIT_FAILURE_GENERIC;
    }
}

// Example usage:
//
// Unauthenticated:
// ./gmaps-geocode --address "1600 Amphitheatre Parkway, Mountain View, CA"
//
// API key, reverse geocode:
// ./gmaps-geocode --api-key "$GOOGLE_MAPS_API_KEY" --latlng 40.714224,-73.961452
//
// Client ID signing, show the signed URL only:
// ./gmaps-geocode --client-id gme-acme --private-key vNIXE0xscrmjlyV-12Nj_BvUPaw= \
//                 --channel web --address "New York" --dry-run
