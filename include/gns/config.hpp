/**
 * @file config.hpp
 * @brief Constants and runtime configuration for the GNS core
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace gns {
namespace config {

// ============================================================================
// Cryptographic Configuration
// ============================================================================

/// Ed25519 signature size
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

/// Ed25519 public key size
constexpr size_t ED25519_PUBKEY_SIZE = 32;

/// Ed25519 seed size (exported private key form)
constexpr size_t ED25519_SEED_SIZE = 32;

/// X25519 public key size
constexpr size_t X25519_PUBKEY_SIZE = 32;

/// ChaCha20-Poly1305 key size
constexpr size_t CHACHA20_KEY_SIZE = 32;

/// ChaCha20-Poly1305 nonce size
constexpr size_t CHACHA20_NONCE_SIZE = 12;

/// ChaCha20-Poly1305 tag size
constexpr size_t CHACHA20_TAG_SIZE = 16;

/// SHA-256 digest size (epoch chain root)
constexpr size_t CHAIN_ROOT_SIZE = 32;

// ============================================================================
// Domain Separation Labels (wire format)
// ============================================================================

constexpr const char* ENVELOPE_KDF_SALT = "gns-message-key";
constexpr const char* ENVELOPE_KDF_INFO = "gns-envelope-v1";
constexpr const char* HANDLE_CLAIM_CONTEXT = "gns-handle-claim-v1";

// ============================================================================
// Limits
// ============================================================================

/// Maximum envelope plaintext (16 MiB)
constexpr size_t MAX_ENVELOPE_PAYLOAD = 16 * 1024 * 1024;

/// Maximum payload type label length
constexpr size_t MAX_PAYLOAD_TYPE_LENGTH = 64;

/// Largest epoch sequence number (stored as a signed 64-bit SQLite integer)
constexpr uint64_t MAX_SEQUENCE_NUMBER = 0x7FFFFFFFFFFFFFFFULL;

/// Maximum JSON document accepted from a collaborator (32 MiB, base64 of a full envelope fits)
constexpr size_t MAX_JSON_SIZE = 32 * 1024 * 1024;

constexpr double MIN_LATITUDE = -90.0;
constexpr double MAX_LATITUDE = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

// ============================================================================
// Handles
// ============================================================================

constexpr size_t HANDLE_MIN_LENGTH = 3;
constexpr size_t HANDLE_MAX_LENGTH = 20;

// ============================================================================
// Defaults
// ============================================================================

/// Pending breadcrumbs that make an epoch ready to publish
constexpr size_t DEFAULT_EPOCH_THRESHOLD = 100;

/// Maximum pending breadcrumbs held by a buffer
constexpr size_t DEFAULT_PENDING_CAPACITY = 1000;

/// Envelope replay detection window
constexpr auto REPLAY_WINDOW = std::chrono::hours(24);

constexpr uint64_t MS_PER_DAY = 24ULL * 60 * 60 * 1000;

/**
 * @brief Get GNS data directory from GNS_DATA_DIR or use $HOME/.gns
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get key directory (<data>/keys)
 */
std::filesystem::path get_key_directory(const std::filesystem::path& data_dir);

/**
 * @brief Get database directory (<data>/db)
 */
std::filesystem::path get_database_directory(const std::filesystem::path& data_dir);

} // namespace config

// ============================================================================
// Runtime Configuration
// ============================================================================

/**
 * @brief Runtime configuration loaded from JSON
 *
 * Example document:
 * {
 *   "dataDirectory": "/var/lib/gns",
 *   "logLevel": "info",
 *   "logFile": "",
 *   "epochThreshold": 100,
 *   "pendingCapacity": 1000,
 *   "replayWindowSeconds": 86400,
 *   "trustWeights": { "VerifiedBreadcrumbs": 30, "PublishedEpochs": 25 }
 * }
 */
struct GnsConfig {
    std::string data_directory;          ///< Empty means config::get_data_directory()
    std::string log_level = "info";
    std::string log_file;
    size_t epoch_threshold = config::DEFAULT_EPOCH_THRESHOLD;
    size_t pending_capacity = config::DEFAULT_PENDING_CAPACITY;
    uint64_t replay_window_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(config::REPLAY_WINDOW).count();
    std::map<std::string, double> trust_weights;   ///< Signal name to weight overrides

    std::string to_json() const;

    /**
     * @brief Parse configuration document
     * @return Config, or std::nullopt for malformed or inconsistent documents
     */
    static std::optional<GnsConfig> from_json(const std::string& json);

    /**
     * @brief Load configuration file; GNS_DATA_DIR overrides dataDirectory
     * @throws GnsError(ConfigError) if unreadable or invalid
     */
    static GnsConfig load(const std::string& path);

    /**
     * @brief Defaults with environment overrides applied
     */
    static GnsConfig from_environment();

    /**
     * @brief Data directory to use (explicit setting or default)
     */
    std::filesystem::path resolved_data_directory() const;

    /**
     * @brief Initialize logging from logLevel and logFile
     */
    void apply_logging() const;
};

} // namespace gns
