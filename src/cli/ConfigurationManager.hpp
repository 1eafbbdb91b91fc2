/**
 * @file ConfigurationManager.hpp
 * @brief Configuration file management for the geocoding client
 */

#pragma once

#include "geocoder.hpp"
#include <string>
#include <map>
#include <optional>

namespace geocoder {

/**
 * @brief key=value configuration store
 *
 * Recognized keys: base_url, auth_scheme (none|token|signed), api_key,
 * client_id, private_key, channel, timeout_seconds, user_agent,
 * fail_on_http_error, log_level, log_file.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Fill missing credentials from GOOGLE_MAPS_* environment variables
     *
     * With an explicit auth_scheme only that scheme's credentials are
     * filled. Without one, the environment is consulted only when no
     * api_key, client_id or private_key was given; otherwise the given
     * credentials select the scheme. Non-empty values are never replaced.
     *
     * @throws ConfigError if auth_scheme names an unknown scheme
     */
    void apply_environment();

    /**
     * @brief Build a GeocoderConfig from the stored values
     * @throws ConfigError for unknown schemes, missing credentials or bad numbers
     */
    GeocoderConfig to_geocoder_config() const;

    /**
     * @brief Store the values of a GeocoderConfig
     */
    void from_geocoder_config(const GeocoderConfig& config);

    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            const std::string& value = it->second;
            return value == "true" || value == "1" || value == "yes";
        }
        return default_value;
    }

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace geocoder
