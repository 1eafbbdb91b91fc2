/**
 * @file test_logger.cpp
 * @brief Tests for facility levels and the shared log file
 */

#include "Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace geocoder;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::setGlobalLogFile(std::nullopt);
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
    }
};

TEST_F(LoggerTest, ParsesDefaultAndFacilityLevels) {
    Logger::parseLogConfig("2, CurlTransport=6, default=1, AuthScheme=9");

    EXPECT_EQ(Logger::getFacilityLevel("CurlTransport"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("AuthScheme"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("GoogleGeocoder"), LogLevel::ERROR);
}

TEST_F(LoggerTest, InvalidLevelLeavesConfigurationUnchanged) {
    Logger::parseLogConfig("CurlTransport=loud");
    EXPECT_EQ(Logger::getFacilityLevel("CurlTransport"), LogLevel::INFO);
}

TEST_F(LoggerTest, FacilityLevelControlsOutput) {
    Logger::setDefaultLevel(LogLevel::WARNING);
    Logger::setFacilityLevel("CurlTransport", LogLevel::DEBUG);

    Logger transport("CurlTransport");
    Logger geocoder_logger("GoogleGeocoder");

    EXPECT_TRUE(transport.shouldOutput(LogLevel::DEBUG));
    EXPECT_FALSE(transport.shouldOutput(LogLevel::TRACE));
    EXPECT_TRUE(geocoder_logger.shouldOutput(LogLevel::WARNING));
    EXPECT_FALSE(geocoder_logger.shouldOutput(LogLevel::DETAILED));
}

TEST_F(LoggerTest, GlobalLogFileReceivesFilteredMessages) {
    std::string path = ::testing::TempDir() + "geocoder_logger_test.log";
    std::remove(path.c_str());

    Logger::setDefaultLevel(LogLevel::DETAILED);
    Logger::setGlobalLogFile(path);

    Logger logger("GoogleGeocoder");
    logger.detailed("geocoding Paris");
    logger.debug("hidden detail");
    logger.flush();
    Logger::setGlobalLogFile(std::nullopt);

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    std::string text = contents.str();

    EXPECT_NE(text.find("DETAIL GoogleGeocoder: geocoding Paris"), std::string::npos) << text;
    EXPECT_EQ(text.find("hidden detail"), std::string::npos) << text;

    std::remove(path.c_str());
}
