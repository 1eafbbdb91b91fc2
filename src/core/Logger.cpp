/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace geocoder {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::global_file_stream_;

namespace {

std::string level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "TRACE";
    }
}

std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\n\r");
    return value.substr(begin, end - begin + 1);
}

std::shared_ptr<std::ofstream> open_append(const std::string& path) {
    std::filesystem::path log_path(path);
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
    }
    auto stream = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        // Don't use outputMessage here to avoid recursion
        std::cerr << "Warning: Failed to open log file: " << path << std::endl;
        return nullptr;
    }
    return stream;
}

} // namespace

Logger::Logger(const std::string& component_name)
    : component_name_(component_name) {
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    doOutput(level, message);
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    // HH:MM:SS.mmm
    std::tm tm{};
    localtime_r(&time_t, &tm);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));

    std::string line = "[" + std::string(timestamp) + "] " + level_tag(level) + " ";
    if (!component_name_.empty()) {
        line += component_name_ + ": ";
    }
    line += message;

    // Diagnostics go to stderr so stdout carries only command results
    std::cerr << line << std::endl;

    // Shared between logger instances, so written under the registry lock
    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (global_file_stream_ && global_file_stream_->is_open()) {
        *global_file_stream_ << line << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cerr.flush();

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (global_file_stream_ && global_file_stream_->is_open()) {
        global_file_stream_->flush();
    }
}

// ============================================================================
// Facility-based logging implementation
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        std::string facility = equals_pos == std::string::npos ? "default" : trim(token.substr(0, equals_pos));
        std::string level_str = equals_pos == std::string::npos ? token : trim(token.substr(equals_pos + 1));

        try {
            int level_int = std::stoi(level_str);
            LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));

            if (facility == "default") {
                default_level_ = level;
            } else {
                facility_levels_[facility] = level;
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::shared_ptr<std::ofstream> stream;
    if (log_file.has_value()) {
        try {
            stream = open_append(log_file.value());
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_file_stream_ = stream;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(component_name_);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

} // namespace geocoder
