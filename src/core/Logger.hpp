/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every component creates a Logger named after itself ("GoogleGeocoder",
 * "CurlTransport", "AuthScheme", ...). Whether a message is printed is
 * decided in exactly one place, outputMessage(), against the facility
 * level if one is registered, otherwise the global default.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace geocoder {

/**
 * @brief Log levels
 *
 * Level 1: Errors
 * Level 2: Warnings
 * Level 3: Information (default)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (requests, parsed values)
 * Level 6: Detailed debugging (raw payloads)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Facility logger with a single point of output control
 *
 * Messages go to stderr, so stdout carries only command results, and to
 * the process-wide log file if one was set with setGlobalLogFile().
 */
class Logger {
public:
    /**
     * @brief Logger for a named facility
     * @param component_name Facility name, looked up in the level registry
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Single point of output control for the whole project.
     *
     * @param level Severity of the message
     * @param message Message text, printed after the timestamp and facility
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /**
     * @brief Check whether a message at this level would be printed
     *
     * Use this to skip building expensive messages.
     *
     * @param level Level to test
     * @return true if outputMessage() would print at this level
     */
    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    /**
     * @brief Log an error (level 1)
     * @param message Error message
     */
    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }

    /**
     * @brief Log a warning (level 2)
     * @param message Warning message
     */
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }

    /**
     * @brief Log codepath detail (level 4)
     * @param message Detail message
     */
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }

    /**
     * @brief Log a debug message (level 5)
     * @param message Debug message
     */
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    /**
     * @brief Log a trace message (level 6) and flush immediately
     * @param message Trace message
     */
    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush stderr and the shared log file
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility
     *
     * @example
     * Logger::setFacilityLevel("CurlTransport", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set the level used by facilities without their own level
     * @param level New default level
     */
    static void setDefaultLevel(LogLevel level);

    /**
     * @brief Facility-specific level if set, otherwise the default level
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "CurlTransport=6,AuthScheme=3"
     * - Mixed: "4,GoogleGeocoder=6"
     * - "default=N" as a named form of the default level
     */
    static void parseLogConfig(const std::string& config);

    /**
     * @brief Remove all facility-specific levels
     */
    static void clearFacilityLevels();

    /**
     * @brief Process-wide log file shared by all facility loggers
     * @param log_file Path to append to, or nullopt to stop file logging
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Level this logger currently prints at
     */
    LogLevel getEffectiveLevel() const;

private:
    std::string component_name_;
    mutable std::mutex output_mutex_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> global_file_stream_;

    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace geocoder
