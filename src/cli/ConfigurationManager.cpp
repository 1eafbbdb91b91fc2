/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the geocoding client
 */

#include "ConfigurationManager.hpp"
#include "AuthScheme.hpp"
#include "GeocodeError.hpp"
#include <cstdlib>
#include <fstream>
#include <optional>

namespace geocoder {

namespace {

struct EnvironmentBinding {
    const char* key;
    const char* variable;
    AuthSchemeKind scheme;
};

const EnvironmentBinding environment_bindings[] = {
    {"api_key", "GOOGLE_MAPS_API_KEY", AuthSchemeKind::TOKEN},
    {"client_id", "GOOGLE_MAPS_CLIENT_ID", AuthSchemeKind::SIGNED},
    {"private_key", "GOOGLE_MAPS_PRIVATE_KEY", AuthSchemeKind::SIGNED},
    {"channel", "GOOGLE_MAPS_CHANNEL", AuthSchemeKind::SIGNED},
};

// Keys that select a scheme when no auth_scheme is given
const char* const credential_keys[] = {"api_key", "client_id", "private_key"};

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // Simple key=value parser
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);

        config_values_[key] = value;
    }

    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# Google geocoder configuration" << std::endl;
    file << "# auth_scheme: none, token (api_key) or signed (client_id, private_key, channel)" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        file << key << "=" << value << std::endl;
    }

    return file.good();
}

void ConfigurationManager::apply_environment() {
    std::optional<AuthSchemeKind> scheme;
    if (!get_string("auth_scheme").empty()) {
        scheme = parse_auth_scheme_kind(get_string("auth_scheme"));
    } else {
        for (const char* key : credential_keys) {
            if (!get_string(key).empty()) {
                // Explicit credentials decide the scheme on their own
                return;
            }
        }
    }

    for (const auto& binding : environment_bindings) {
        if (scheme.has_value() && scheme.value() != binding.scheme) {
            continue;
        }
        if (!get_string(binding.key).empty()) {
            continue;
        }
        if (const char* value = std::getenv(binding.variable)) {
            set_value(binding.key, value);
        }
    }
}

GeocoderConfig ConfigurationManager::to_geocoder_config() const {
    GeocoderConfig config;

    config.base_url = get_string("base_url", DEFAULT_GEOCODE_URL);
    if (config.base_url.empty()) {
        throw ConfigError("base_url must not be empty");
    }

    // Without an explicit scheme, pick the one the credentials imply
    AuthSchemeKind kind = AuthSchemeKind::UNAUTHENTICATED;
    if (!get_string("auth_scheme").empty()) {
        kind = parse_auth_scheme_kind(get_string("auth_scheme"));
    } else if (!get_string("client_id").empty() || !get_string("private_key").empty()) {
        kind = AuthSchemeKind::SIGNED;
    } else if (!get_string("api_key").empty()) {
        kind = AuthSchemeKind::TOKEN;
    }

    switch (kind) {
        case AuthSchemeKind::TOKEN: {
            std::string api_key = get_string("api_key");
            if (api_key.empty()) {
                throw ConfigError("auth scheme 'token' requires api_key");
            }
            config.auth_scheme = make_token_auth(api_key);
            break;
        }
        case AuthSchemeKind::SIGNED: {
            std::string client_id = get_string("client_id");
            std::string private_key = get_string("private_key");
            if (client_id.empty() || private_key.empty()) {
                throw ConfigError("auth scheme 'signed' requires client_id and private_key");
            }
            config.auth_scheme = make_signed_auth(client_id, private_key, get_string("channel"));
            break;
        }
        default:
            config.auth_scheme = make_unauthenticated();
            break;
    }

    if (has_value("timeout_seconds")) {
        std::string timeout_str = get_string("timeout_seconds");
        try {
            size_t consumed = 0;
            int timeout = std::stoi(timeout_str, &consumed);
            if (consumed != timeout_str.size() || timeout < 0) {
                throw std::invalid_argument(timeout_str);
            }
            config.transport.timeout_seconds = timeout;
        } catch (const std::exception&) {
            throw ConfigError("timeout_seconds must be a non-negative integer, got '" + timeout_str + "'");
        }
    }
    config.transport.user_agent = get_string("user_agent", config.transport.user_agent);
    config.transport.fail_on_http_error = get_bool("fail_on_http_error", false);

    return config;
}

void ConfigurationManager::from_geocoder_config(const GeocoderConfig& config) {
    set_value("base_url", config.base_url);

    if (config.auth_scheme) {
        set_value("auth_scheme", auth_scheme_name(config.auth_scheme->kind()));

        if (auto token = std::dynamic_pointer_cast<const TokenAuthScheme>(config.auth_scheme)) {
            set_value("api_key", token->api_key());
        } else if (auto signed_scheme = std::dynamic_pointer_cast<const SignedAuthScheme>(config.auth_scheme)) {
            set_value("client_id", signed_scheme->client_id());
            set_value("private_key", signed_scheme->private_key());
            if (!signed_scheme->channel().empty()) {
                set_value("channel", signed_scheme->channel());
            }
        }
    } else {
        set_value("auth_scheme", auth_scheme_name(AuthSchemeKind::UNAUTHENTICATED));
    }

    set_value("timeout_seconds", std::to_string(config.transport.timeout_seconds));
    set_value("user_agent", config.transport.user_agent);
    set_value("fail_on_http_error", config.transport.fail_on_http_error ? "true" : "false");
}

} // namespace geocoder
