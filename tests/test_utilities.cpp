/**
 * @file test_utilities.cpp
 * @brief Unit tests for utility helpers
 */

#include <gtest/gtest.h>
#include "gns/utilities.hpp"
#include "gns/errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>
#include <vector>

using namespace gns;
using namespace gns::utilities;
namespace fs = std::filesystem;

// ============================================================================
// Logging Tests
// ============================================================================

TEST(UtilitiesTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level(" INFO "), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::CRITICAL);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(UtilitiesTest, LoggingToFile) {
    fs::path log_path = fs::temp_directory_path() / "gns_utilities_test.log";
    fs::remove(log_path);

    initialize_logging(log_path.string(), LogLevel::DEBUG);
    log_info("utilities test line");
    spdlog::default_logger()->flush();

    auto content = read_file(log_path.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_NE(content->find("utilities test line"), std::string::npos);

    initialize_logging();
    fs::remove(log_path);
}

TEST(UtilitiesTest, ShortKey) {
    EXPECT_EQ(short_key("abcd"), "abcd");
    EXPECT_EQ(short_key(std::string(64, 'f')), std::string(16, 'f') + "...");
}

// ============================================================================
// Time Tests
// ============================================================================

TEST(UtilitiesTest, FormatTimestamp) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(format_timestamp(1700000000123ULL), "2023-11-14T22:13:20.123Z");
}

TEST(UtilitiesTest, FormatDuration) {
    EXPECT_EQ(format_duration(0), "0s");
    EXPECT_EQ(format_duration(8130), "2h 15m 30s");
    EXPECT_EQ(format_duration(86400), "1d");
}

TEST(UtilitiesTest, CurrentTimeIsPlausible) {
    EXPECT_GT(current_time_ms(), 1600000000000ULL);
}

// ============================================================================
// File Tests
// ============================================================================

TEST(UtilitiesTest, BinaryFileRoundTrip) {
    fs::path dir = fs::temp_directory_path() / "gns_utilities_files";
    fs::remove_all(dir);
    fs::path file = dir / "nested" / "blob.bin";

    std::vector<uint8_t> data = {0, 1, 2, 255};
    ASSERT_TRUE(write_file_binary(file.string(), data, true));

    auto loaded = read_file_binary(file.string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, data);

    fs::remove_all(dir);
}

TEST(UtilitiesTest, ReadMissingFile) {
    EXPECT_FALSE(read_file("/nonexistent/gns/file").has_value());
    EXPECT_FALSE(read_file_binary("/nonexistent/gns/file").has_value());
}

// ============================================================================
// String Tests
// ============================================================================

TEST(UtilitiesTest, StringHelpers) {
    EXPECT_EQ(trim_string("  a b \n"), "a b");
    EXPECT_EQ(trim_string("   "), "");
    EXPECT_EQ(to_lowercase("MiXeD"), "mixed");
    EXPECT_TRUE(starts_with("@alice", "@"));
    EXPECT_FALSE(starts_with("a", "abc"));
}

TEST(UtilitiesTest, GetEnvDefault) {
    EXPECT_EQ(get_env("GNS_TEST_SURELY_UNSET_VARIABLE", "fallback"), "fallback");
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(UtilitiesTest, ErrorMessageCarriesKind) {
    GnsError error(ErrorKind::InvalidCoordinate, "latitude 91");

    EXPECT_EQ(error.kind(), ErrorKind::InvalidCoordinate);
    EXPECT_EQ(std::string(error.what()), "InvalidCoordinate: latitude 91");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::StorageError), "StorageError");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
