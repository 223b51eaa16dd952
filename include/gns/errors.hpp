/**
 * @file errors.hpp
 * @brief Error kinds and exception type for GNS operations
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Producing operations (generate, seal, create, publish) throw GnsError for
 * malformed input. Verification operations return bool or tagged results.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace gns {

/**
 * @brief Error kinds surfaced by the GNS core
 */
enum class ErrorKind {
    InvalidKeyFormat,       ///< Key bytes or encoding have the wrong shape
    InvalidCoordinate,      ///< Latitude/longitude outside valid range
    IdentityMismatch,       ///< Breadcrumb or epoch belongs to another identity
    EncryptionError,        ///< Envelope could not be sealed
    DecryptionError,        ///< Envelope could not be opened
    SignatureInvalid,       ///< Signature did not verify
    ChainIntegrityError,    ///< Trajectory chain or ordering broken
    InvalidInput,           ///< Other malformed argument
    InvalidHandle,          ///< Handle fails format rules
    HandleUnavailable,      ///< Registry refused the handle claim
    InsufficientTrust,      ///< Trust requirements not met
    EntropyFailure,         ///< Random source unavailable
    StorageError,           ///< Ledger or key store failure
    ConfigError             ///< Invalid configuration
};

/**
 * @brief Stable name of an error kind (e.g. "InvalidKeyFormat")
 */
const char* error_kind_to_string(ErrorKind kind);

/**
 * @brief Exception carrying an ErrorKind
 */
class GnsError : public std::runtime_error {
public:
    GnsError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace gns
