/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the geocoder tool
 */

#pragma once

#include <cctype>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <iostream>

namespace geocoder {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long, --long=value, -s and flags. Arguments that look like
 * negative numbers ("-33.86,151.2") are accepted as option values.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool has_value;

        // Default constructor for std::map
        Option() : has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool has_value)
            : long_name(long_name), short_name(short_name), description(description),
              has_value(has_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description) {
        register_option(Option(long_name, short_name, description, true));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false));
    }

    /**
     * @brief Start a new help section; options added afterwards are listed under it
     */
    void add_section(const std::string& title) {
        help_order_.push_back("\n" + title);
    }

    bool parse(const std::vector<std::string>& args) {
        parsed_values_.clear();
        positional_args_.clear();

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // --option=value
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool has_inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    has_inline_value = true;
                }

                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!has_inline_value) {
                        if (i + 1 >= args.size() || looks_like_option(args[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (looks_like_option(arg)) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args.size() || looks_like_option(args[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS] --address \"ADDRESS\"\n";
        std::cout << "    " << program_name_ << " [OPTIONS] --latlng LAT,LNG\n";

        for (const auto& entry : help_order_) {
            if (entry.starts_with("\n")) {
                std::cout << "\n" << entry.substr(1) << ":\n";
            } else {
                print_help_line(options_.at(entry));
            }
        }

        std::cout << "\nHELP:\n";
        std::cout << "    -h, --help               Show this help\n";
    }

private:
    static bool looks_like_option(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-') {
            return false;
        }
        // Negative numbers are values, not options
        return !(std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            help_order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    static void print_help_line(const Option& option) {
        std::string flags = "    ";
        if (!option.short_name.empty()) {
            flags += "-" + option.short_name + ", ";
        }
        flags += "--" + option.long_name;
        if (option.has_value) {
            flags += " VALUE";
        }
        if (flags.size() < 32) {
            flags.append(32 - flags.size(), ' ');
        } else {
            flags += "  ";
        }
        std::cout << flags << option.description << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> help_order_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
};

} // namespace geocoder
