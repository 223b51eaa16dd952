/**
 * @file utilities.hpp
 * @brief Common utility functions for the GNS core
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Utility functions used throughout GNS:
 * - Logging and error reporting
 * - Time and date formatting
 * - String manipulation
 * - File I/O helpers
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace gns {
namespace utilities {

/**
 * @brief Log levels for GNS logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "critical")
 * @return Level, or std::nullopt for unknown names
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Short printable form of a hex key for log lines (first 16 chars)
 *
 * Never pass secret material here; it is meant for public keys only.
 */
std::string short_key(const std::string& hex);

/**
 * @brief Current wall-clock time as Unix milliseconds
 */
uint64_t current_time_ms();

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp_ms Unix timestamp in milliseconds
 * @return Formatted string (e.g., "2025-11-10T15:30:45.123Z")
 */
std::string format_timestamp(uint64_t timestamp_ms);

/**
 * @brief Format duration in human-readable format
 * @param seconds Duration in seconds
 * @return Formatted string (e.g., "2h 15m 30s")
 */
std::string format_duration(uint64_t seconds);

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Read entire file into byte vector
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path);

/**
 * @brief Write byte vector to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @param owner_only Restrict permissions to owner read/write
 * @return true if successful, false otherwise
 */
bool write_file_binary(const std::string& file_path,
                       const std::vector<uint8_t>& content,
                       bool owner_only = false);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase (ASCII)
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace gns
