/**
 * @file test_config.cpp
 * @brief Unit tests for GnsConfig and data directory helpers
 *
 * Tests:
 * - Defaults and JSON round trip
 * - Rejection of malformed or inconsistent documents
 * - Loading from file, including GNS_DATA_DIR override
 * - Environment-derived configuration
 */

#include <gtest/gtest.h>
#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/utilities.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace gns;
namespace fs = std::filesystem;

// Test fixture for configuration tests
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "gns_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        unsetenv("GNS_DATA_DIR");
        unsetenv("GNS_LOG_LEVEL");
    }

    void TearDown() override {
        unsetenv("GNS_DATA_DIR");
        unsetenv("GNS_LOG_LEVEL");

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    std::string write_config(const std::string& content) {
        fs::path path = test_dir_ / "gns.json";
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    fs::path test_dir_;
};

// ============================================================================
// Defaults and Parsing Tests
// ============================================================================

TEST_F(ConfigTest, Defaults) {
    GnsConfig cfg;

    EXPECT_TRUE(cfg.data_directory.empty());
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.epoch_threshold, 100u);
    EXPECT_EQ(cfg.pending_capacity, 1000u);
    EXPECT_EQ(cfg.replay_window_seconds, 86400u);
    EXPECT_TRUE(cfg.trust_weights.empty());
}

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto cfg = GnsConfig::from_json("{}");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->epoch_threshold, 100u);
}

TEST_F(ConfigTest, ParsesAllFields) {
    auto cfg = GnsConfig::from_json(R"({
        "dataDirectory": "/var/lib/gns",
        "logLevel": "debug",
        "logFile": "/var/log/gns.log",
        "epochThreshold": 10,
        "pendingCapacity": 50,
        "replayWindowSeconds": 600,
        "trustWeights": { "HandleClaimed": 5, "IdentityAge": 12.5 }
    })");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->data_directory, "/var/lib/gns");
    EXPECT_EQ(cfg->log_level, "debug");
    EXPECT_EQ(cfg->log_file, "/var/log/gns.log");
    EXPECT_EQ(cfg->epoch_threshold, 10u);
    EXPECT_EQ(cfg->pending_capacity, 50u);
    EXPECT_EQ(cfg->replay_window_seconds, 600u);
    EXPECT_DOUBLE_EQ(cfg->trust_weights.at("IdentityAge"), 12.5);
}

TEST_F(ConfigTest, JsonRoundTrip) {
    GnsConfig original;
    original.log_level = "warn";
    original.epoch_threshold = 7;
    original.trust_weights["PublishedEpochs"] = 40.0;

    auto parsed = GnsConfig::from_json(original.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->log_level, "warn");
    EXPECT_EQ(parsed->epoch_threshold, 7u);
    EXPECT_DOUBLE_EQ(parsed->trust_weights.at("PublishedEpochs"), 40.0);
}

TEST_F(ConfigTest, RejectsInvalidDocuments) {
    EXPECT_FALSE(GnsConfig::from_json("not json").has_value());
    EXPECT_FALSE(GnsConfig::from_json("[1, 2]").has_value());
    EXPECT_FALSE(GnsConfig::from_json(R"({"logLevel": "verbose"})").has_value());
    EXPECT_FALSE(GnsConfig::from_json(R"({"epochThreshold": 0})").has_value());
    EXPECT_FALSE(GnsConfig::from_json(R"({"epochThreshold": 20, "pendingCapacity": 10})").has_value());
    EXPECT_FALSE(GnsConfig::from_json(R"({"replayWindowSeconds": 0})").has_value());
    EXPECT_FALSE(GnsConfig::from_json(R"({"trustWeights": {"HandleClaimed": "high"}})").has_value());
    EXPECT_FALSE(GnsConfig::from_json(R"({"trustWeights": [1, 2]})").has_value());
    EXPECT_FALSE(GnsConfig::from_json(R"({"epochThreshold": "ten"})").has_value());
}

// ============================================================================
// Loading Tests
// ============================================================================

TEST_F(ConfigTest, LoadFromFile) {
    std::string path = write_config(R"({"logLevel": "error", "epochThreshold": 25})");

    GnsConfig cfg = GnsConfig::load(path);
    EXPECT_EQ(cfg.log_level, "error");
    EXPECT_EQ(cfg.epoch_threshold, 25u);
}

TEST_F(ConfigTest, LoadMissingFileIsConfigError) {
    try {
        GnsConfig::load((test_dir_ / "absent.json").string());
        FAIL() << "Expected ConfigError";
    } catch (const GnsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    }
}

TEST_F(ConfigTest, LoadInvalidFileIsConfigError) {
    std::string path = write_config(R"({"epochThreshold": 0})");

    try {
        GnsConfig::load(path);
        FAIL() << "Expected ConfigError";
    } catch (const GnsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    }
}

TEST_F(ConfigTest, DataDirEnvironmentOverridesFile) {
    std::string path = write_config(R"({"dataDirectory": "/from/file"})");
    std::string env_dir = (test_dir_ / "env").string();
    setenv("GNS_DATA_DIR", env_dir.c_str(), 1);

    GnsConfig cfg = GnsConfig::load(path);
    EXPECT_EQ(cfg.data_directory, env_dir);
}

TEST_F(ConfigTest, FromEnvironment) {
    std::string env_dir = (test_dir_ / "env").string();
    setenv("GNS_DATA_DIR", env_dir.c_str(), 1);
    setenv("GNS_LOG_LEVEL", "debug", 1);

    GnsConfig cfg = GnsConfig::from_environment();
    EXPECT_EQ(cfg.data_directory, env_dir);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST_F(ConfigTest, FromEnvironmentIgnoresUnknownLogLevel) {
    setenv("GNS_LOG_LEVEL", "chatty", 1);
    EXPECT_EQ(GnsConfig::from_environment().log_level, "info");
}

// ============================================================================
// Directory Tests
// ============================================================================

TEST_F(ConfigTest, DataDirectoryFromEnvironmentIsCreated) {
    fs::path env_dir = test_dir_ / "data";
    setenv("GNS_DATA_DIR", env_dir.string().c_str(), 1);

    fs::path data = config::get_data_directory();
    EXPECT_EQ(data, env_dir);
    EXPECT_TRUE(fs::is_directory(data));

    EXPECT_TRUE(fs::is_directory(config::get_key_directory(data)));
    EXPECT_EQ(config::get_database_directory(data), env_dir / "db");
}

TEST_F(ConfigTest, ResolvedDataDirectoryPrefersExplicitSetting) {
    GnsConfig cfg;
    cfg.data_directory = (test_dir_ / "explicit").string();

    EXPECT_EQ(cfg.resolved_data_directory(), test_dir_ / "explicit");
    EXPECT_TRUE(fs::is_directory(test_dir_ / "explicit"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
