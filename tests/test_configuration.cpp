/**
 * @file test_configuration.cpp
 * @brief Tests for the key=value configuration layer
 */

#include "ConfigurationManager.hpp"
#include "AuthScheme.hpp"
#include "GeocodeError.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace geocoder;

class ConfigurationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* variable : {"GOOGLE_MAPS_API_KEY", "GOOGLE_MAPS_CLIENT_ID",
                                     "GOOGLE_MAPS_PRIVATE_KEY", "GOOGLE_MAPS_CHANNEL"}) {
            unsetenv(variable);
        }
        path_ = ::testing::TempDir() + "geocoder_config_test.conf";
    }

    void TearDown() override {
        for (const char* variable : {"GOOGLE_MAPS_API_KEY", "GOOGLE_MAPS_CLIENT_ID",
                                     "GOOGLE_MAPS_PRIVATE_KEY", "GOOGLE_MAPS_CHANNEL"}) {
            unsetenv(variable);
        }
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(ConfigurationManagerTest, DefaultsToUnauthenticated) {
    GeocoderConfig config = ConfigurationManager().to_geocoder_config();
    EXPECT_EQ(config.base_url, DEFAULT_GEOCODE_URL);
    ASSERT_TRUE(config.auth_scheme);
    EXPECT_EQ(config.auth_scheme->kind(), AuthSchemeKind::UNAUTHENTICATED);
    EXPECT_EQ(config.transport.timeout_seconds, 10);
    EXPECT_FALSE(config.transport.fail_on_http_error);
}

TEST_F(ConfigurationManagerTest, InfersSchemeFromCredentials) {
    ConfigurationManager token;
    token.set_value("api_key", "K1");
    EXPECT_EQ(token.to_geocoder_config().auth_scheme->kind(), AuthSchemeKind::TOKEN);

    ConfigurationManager signed_manager;
    signed_manager.set_value("client_id", "gme-acme");
    signed_manager.set_value("private_key", "vNIXE0xscrmjlyV-12Nj_BvUPaw=");
    signed_manager.set_value("auth_scheme", "");
    EXPECT_EQ(signed_manager.to_geocoder_config().auth_scheme->kind(), AuthSchemeKind::SIGNED);
}

TEST_F(ConfigurationManagerTest, MissingCredentialsAreConfigErrors) {
    ConfigurationManager token;
    token.set_value("auth_scheme", "token");
    EXPECT_THROW(token.to_geocoder_config(), ConfigError);

    ConfigurationManager signed_manager;
    signed_manager.set_value("client_id", "gme-acme");
    EXPECT_THROW(signed_manager.to_geocoder_config(), ConfigError);

    ConfigurationManager unknown;
    unknown.set_value("auth_scheme", "oauth");
    EXPECT_THROW(unknown.to_geocoder_config(), ConfigError);
}

TEST_F(ConfigurationManagerTest, RejectsBadTimeoutAndEmptyBaseUrl) {
    ConfigurationManager timeout;
    timeout.set_value("timeout_seconds", "ten");
    EXPECT_THROW(timeout.to_geocoder_config(), ConfigError);
    timeout.set_value("timeout_seconds", "-1");
    EXPECT_THROW(timeout.to_geocoder_config(), ConfigError);
    timeout.set_value("timeout_seconds", "30");
    EXPECT_EQ(timeout.to_geocoder_config().transport.timeout_seconds, 30);

    ConfigurationManager base;
    base.set_value("base_url", "");
    EXPECT_THROW(base.to_geocoder_config(), ConfigError);
}

TEST_F(ConfigurationManagerTest, SaveAndLoadRoundTrip) {
    GeocoderConfig original;
    original.base_url = "http://localhost:8080/geocode";
    original.auth_scheme = make_signed_auth("gme-acme", "vNIXE0xscrmjlyV-12Nj_BvUPaw=", "web");
    original.transport.timeout_seconds = 3;
    original.transport.fail_on_http_error = true;

    ConfigurationManager writer;
    writer.from_geocoder_config(original);
    ASSERT_TRUE(writer.save_to_file(path_));

    ConfigurationManager reader;
    ASSERT_TRUE(reader.load_from_file(path_));
    GeocoderConfig loaded = reader.to_geocoder_config();

    EXPECT_EQ(loaded.base_url, original.base_url);
    EXPECT_EQ(loaded.transport.timeout_seconds, 3);
    EXPECT_TRUE(loaded.transport.fail_on_http_error);

    auto scheme = std::dynamic_pointer_cast<const SignedAuthScheme>(loaded.auth_scheme);
    ASSERT_TRUE(scheme);
    EXPECT_EQ(scheme->client_id(), "gme-acme");
    EXPECT_EQ(scheme->private_key(), "vNIXE0xscrmjlyV-12Nj_BvUPaw=");
    EXPECT_EQ(scheme->channel(), "web");
}

TEST_F(ConfigurationManagerTest, LoadSkipsCommentsAndTrimsWhitespace) {
    {
        std::ofstream file(path_);
        file << "# comment\n"
             << "\n"
             << "  api_key =  K1  \r\n"
             << "not a setting\n";
    }

    ConfigurationManager manager;
    ASSERT_TRUE(manager.load_from_file(path_));
    EXPECT_EQ(manager.get_string("api_key"), "K1");
    EXPECT_FALSE(manager.has_value("not a setting"));
    EXPECT_FALSE(manager.load_from_file(path_ + ".missing"));
}

TEST_F(ConfigurationManagerTest, EnvironmentFillsOnlyMissingValues) {
    setenv("GOOGLE_MAPS_API_KEY", "from-env", 1);
    setenv("GOOGLE_MAPS_CHANNEL", "env-channel", 1);

    ConfigurationManager manager;
    manager.set_value("channel", "explicit");
    manager.apply_environment();

    EXPECT_EQ(manager.get_string("api_key"), "from-env");
    EXPECT_EQ(manager.get_string("channel"), "explicit");
    EXPECT_FALSE(manager.has_value("client_id"));
}

TEST_F(ConfigurationManagerTest, ExplicitCredentialsIgnoreEnvironment) {
    setenv("GOOGLE_MAPS_CLIENT_ID", "gme-env", 1);
    setenv("GOOGLE_MAPS_PRIVATE_KEY", "vNIXE0xscrmjlyV-12Nj_BvUPaw=", 1);

    ConfigurationManager manager;
    manager.set_value("api_key", "K1");
    manager.apply_environment();

    EXPECT_FALSE(manager.has_value("client_id"));
    EXPECT_FALSE(manager.has_value("private_key"));
    EXPECT_EQ(manager.to_geocoder_config().auth_scheme->kind(), AuthSchemeKind::TOKEN);
}

TEST_F(ConfigurationManagerTest, ExplicitSchemeFillsOnlyItsCredentials) {
    setenv("GOOGLE_MAPS_API_KEY", "env-key", 1);
    setenv("GOOGLE_MAPS_CLIENT_ID", "gme-env", 1);
    setenv("GOOGLE_MAPS_CHANNEL", "env-channel", 1);

    ConfigurationManager manager;
    manager.set_value("auth_scheme", "signed");
    manager.set_value("private_key", "vNIXE0xscrmjlyV-12Nj_BvUPaw=");
    manager.set_value("client_id", "");
    manager.apply_environment();

    EXPECT_EQ(manager.get_string("client_id"), "gme-env");
    EXPECT_EQ(manager.get_string("channel"), "env-channel");
    EXPECT_FALSE(manager.has_value("api_key"));
}

TEST_F(ConfigurationManagerTest, UnknownSchemeIsRejectedBeforeEnvironment) {
    ConfigurationManager manager;
    manager.set_value("auth_scheme", "oauth");
    EXPECT_THROW(manager.apply_environment(), ConfigError);
}
