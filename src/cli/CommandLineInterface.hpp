/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the gmaps-geocode tool
 */

#pragma once

#include "geocoder.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ConfigurationManager.hpp"
#include <string>
#include <vector>

namespace geocoder {

/**
 * @brief Parses arguments into a GeocoderConfig and a single request
 */
class CommandLineInterface {
public:
    enum class Operation {
        GEOCODE,
        REVERSE_GEOCODE
    };

    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if a request should be executed, false if help/version
     *         was shown or a config file was created
     * @throws ConfigError for unknown options and invalid values (bad
     *         coordinates, missing credentials, unknown auth scheme)
     */
    bool parse_arguments(int argc, char* argv[]);
    bool parse_arguments(const std::vector<std::string>& args);

    const GeocoderConfig& get_config() const { return config_; }
    Operation get_operation() const { return operation_; }
    const std::string& get_address() const { return address_; }
    const GeoPoint& get_point() const { return point_; }

    bool is_dry_run() const { return dry_run_; }
    bool is_json_output() const { return json_output_; }

    /**
     * @brief Print the effective configuration (secrets masked)
     */
    void print_config() const;

private:
    GeocoderConfig config_;
    Operation operation_ = Operation::GEOCODE;
    std::string address_;
    GeoPoint point_;
    bool dry_run_ = false;
    bool json_output_ = false;

    void register_options(SimpleCommandLineParser& parser) const;
    void apply_overrides(const SimpleCommandLineParser& parser, ConfigurationManager& manager) const;
    void configure_logging(const SimpleCommandLineParser& parser, const ConfigurationManager& manager) const;
    bool parse_request(const SimpleCommandLineParser& parser);

    static GeoPoint parse_latlng(const std::string& latlng_str);
    static bool create_default_config_file(const std::string& filename);
};

} // namespace geocoder
