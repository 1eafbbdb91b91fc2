/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "AuthScheme.hpp"
#include "GeocodeError.hpp"
#include "../core/Logger.hpp"
#include "../core/QueryEncoder.hpp"
#include "version.h"
#include <cmath>
#include <iostream>

namespace geocoder {

namespace {

struct OptionBinding {
    const char* option;
    const char* config_key;
};

// Command line options that override configuration file keys
const OptionBinding option_bindings[] = {
    {"base-url", "base_url"},
    {"auth-scheme", "auth_scheme"},
    {"api-key", "api_key"},
    {"client-id", "client_id"},
    {"private-key", "private_key"},
    {"channel", "channel"},
    {"timeout", "timeout_seconds"},
    {"user-agent", "user_agent"},
    {"log-level", "log_level"},
    {"log-file", "log_file"},
};

std::string mask(const std::string& secret) {
    if (secret.empty()) return "(unset)";
    if (secret.size() <= 4) return "****";
    return secret.substr(0, 4) + std::string(secret.size() - 4, '*');
}

} // namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return parse_arguments(args);
}

bool CommandLineInterface::parse_arguments(const std::vector<std::string>& args) {
    SimpleCommandLineParser parser("gmaps-geocode",
        "GMAPS-GEOCODE - Google Maps Geocoding API client\n"
        "\n"
        "Converts addresses to coordinates (geocode) and coordinates to\n"
        "addresses (reverse geocode). Supports unauthenticated requests,\n"
        "API keys, and client ID + private key signed URLs.");
    register_options(parser);

    if (!parser.parse(args)) {
        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                return false;
            }
        }
        throw ConfigError("invalid command line arguments (see --help)");
    }

    if (parser.get_flag("version")) {
        std::cout << "gmaps-geocode v" << GEOCODER_VERSION_STRING << std::endl;
        std::cout << "Built with libcurl, nlohmann::json and OpenSSL" << std::endl;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            throw ConfigError("could not write configuration file '" + config_path.value() + "'");
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    ConfigurationManager manager;
    if (auto config_file = parser.get("config")) {
        if (!manager.load_from_file(config_file.value())) {
            throw ConfigError("failed to load configuration file '" + config_file.value() + "'");
        }
    }

    apply_overrides(parser, manager);
    manager.apply_environment();
    configure_logging(parser, manager);

    config_ = manager.to_geocoder_config();
    dry_run_ = parser.get_flag("dry-run");
    json_output_ = parser.get_flag("json");

    return parse_request(parser);
}

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.add_section("REQUEST");
    parser.add_option("address", "a", "Address or place name to geocode");
    parser.add_option("latlng", "l", "Coordinates to reverse geocode (lat,lng)");

    parser.add_section("AUTHENTICATION");
    parser.add_option("auth-scheme", "", "none, token or signed (inferred from credentials if omitted)");
    parser.add_option("api-key", "k", "API key for the token scheme");
    parser.add_option("client-id", "", "Client ID for the signed scheme");
    parser.add_option("private-key", "", "base64url private key for the signed scheme");
    parser.add_option("channel", "", "Optional channel for the signed scheme");

    parser.add_section("CONNECTION");
    parser.add_option("base-url", "", std::string("Geocoding endpoint (default: ") + DEFAULT_GEOCODE_URL + ")");
    parser.add_option("timeout", "", "Request timeout in seconds");
    parser.add_option("user-agent", "", "HTTP User-Agent header");
    parser.add_flag("fail-on-http-error", "", "Treat non-2xx HTTP status as an error instead of parsing the body");

    parser.add_section("CONFIGURATION");
    parser.add_option("config", "c", "Load settings from a key=value file");
    parser.add_option("create-config", "", "Write a default configuration file to the given path and exit");

    parser.add_section("OUTPUT & LOGGING");
    parser.add_flag("json", "j", "Print the result as JSON");
    parser.add_flag("dry-run", "", "Print the request URL (secrets redacted) without sending it");
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "facility form: \"3,CurlTransport=6\"");
    parser.add_option("log-file", "", "Also write log output to file (append if exists)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_flag("silent", "s", "Only log errors (same as --log-level 1)");
    parser.add_flag("version", "", "Show version information");
}

void CommandLineInterface::apply_overrides(const SimpleCommandLineParser& parser,
                                           ConfigurationManager& manager) const {
    for (const auto& binding : option_bindings) {
        auto value = parser.get(binding.option);
        if (value.has_value()) {
            manager.set_value(binding.config_key, value.value());
        }
    }

    if (parser.get_flag("fail-on-http-error")) {
        manager.set_value("fail_on_http_error", "true");
    }
}

void CommandLineInterface::configure_logging(const SimpleCommandLineParser& parser,
                                             const ConfigurationManager& manager) const {
    if (parser.get_flag("verbose")) {
        Logger::setDefaultLevel(LogLevel::TRACE);
    } else if (parser.get_flag("silent")) {
        Logger::setDefaultLevel(LogLevel::ERROR);
    } else if (manager.has_value("log_level")) {
        Logger::parseLogConfig(manager.get_string("log_level"));
    }

    if (manager.has_value("log_file")) {
        Logger::setGlobalLogFile(manager.get_string("log_file"));
    }
}

bool CommandLineInterface::parse_request(const SimpleCommandLineParser& parser) {
    auto address = parser.get("address");
    auto latlng = parser.get("latlng");
    const auto& positional = parser.get_positional();

    if (address.has_value() && latlng.has_value()) {
        throw ConfigError("--address and --latlng are mutually exclusive");
    }

    if (latlng.has_value()) {
        operation_ = Operation::REVERSE_GEOCODE;
        point_ = parse_latlng(latlng.value());
        return true;
    }

    if (address.has_value()) {
        address_ = address.value();
    } else if (!positional.empty()) {
        // Unquoted multi-word address
        for (size_t i = 0; i < positional.size(); ++i) {
            if (i > 0) address_ += " ";
            address_ += positional[i];
        }
    } else {
        throw ConfigError("nothing to do: give --address or --latlng (see --help)");
    }

    operation_ = Operation::GEOCODE;
    return true;
}

GeoPoint CommandLineInterface::parse_latlng(const std::string& latlng_str) {
    size_t comma = latlng_str.find(',');
    if (comma == std::string::npos) {
        throw ConfigError("coordinates must be 'lat,lng', got '" + latlng_str + "'");
    }

    auto parse_component = [&latlng_str](const std::string& text) {
        // Plain decimal only: no hex floats, nan or inf
        bool decimal = !text.empty() &&
            text.find_first_not_of("0123456789+-.eE") == std::string::npos;
        try {
            size_t consumed = 0;
            double value = decimal ? std::stod(text, &consumed) : 0.0;
            if (!decimal || consumed != text.size() || !std::isfinite(value)) {
                throw std::invalid_argument(text);
            }
            return value;
        } catch (const std::exception&) {
            throw ConfigError("invalid coordinate '" + text + "' in '" + latlng_str + "'");
        }
    };

    return GeoPoint(parse_component(latlng_str.substr(0, comma)),
                    parse_component(latlng_str.substr(comma + 1)));
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager;
    manager.from_geocoder_config(GeocoderConfig());
    manager.set_value("auth_scheme", "");
    manager.set_value("api_key", "");
    manager.set_value("client_id", "");
    manager.set_value("private_key", "");
    manager.set_value("channel", "");
    manager.set_value("log_level", "3");
    return manager.save_to_file(filename);
}

void CommandLineInterface::print_config() const {
    std::cout << "\n=== Geocoder Configuration ===\n";
    std::cout << "Endpoint: " << config_.base_url << "\n";
    std::cout << "Auth scheme: " << auth_scheme_name(config_.auth_scheme->kind()) << "\n";

    if (auto token = std::dynamic_pointer_cast<const TokenAuthScheme>(config_.auth_scheme)) {
        std::cout << "API key: " << mask(token->api_key()) << "\n";
    } else if (auto signed_scheme = std::dynamic_pointer_cast<const SignedAuthScheme>(config_.auth_scheme)) {
        std::cout << "Client ID: " << signed_scheme->client_id() << "\n";
        std::cout << "Private key: " << mask(signed_scheme->private_key()) << "\n";
        if (!signed_scheme->channel().empty()) {
            std::cout << "Channel: " << signed_scheme->channel() << "\n";
        }
    }

    std::cout << "Timeout: " << config_.transport.timeout_seconds << "s\n";
    std::cout << "User agent: " << config_.transport.user_agent << "\n";
    std::cout << "Fail on HTTP error: " << (config_.transport.fail_on_http_error ? "yes" : "no") << "\n";

    if (operation_ == Operation::REVERSE_GEOCODE) {
        std::cout << "Request: reverse geocode " << format_coordinate(point_.lat()) << ","
                  << format_coordinate(point_.lng()) << "\n";
    } else {
        std::cout << "Request: geocode \"" << address_ << "\"\n";
    }
    std::cout << "==============================\n\n";
}

} // namespace geocoder
