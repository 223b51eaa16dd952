/**
 * @file errors.cpp
 * @brief Implementation of GNS error helpers
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/errors.hpp"

namespace gns {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidKeyFormat:    return "InvalidKeyFormat";
        case ErrorKind::InvalidCoordinate:   return "InvalidCoordinate";
        case ErrorKind::IdentityMismatch:    return "IdentityMismatch";
        case ErrorKind::EncryptionError:     return "EncryptionError";
        case ErrorKind::DecryptionError:     return "DecryptionError";
        case ErrorKind::SignatureInvalid:    return "SignatureInvalid";
        case ErrorKind::ChainIntegrityError: return "ChainIntegrityError";
        case ErrorKind::InvalidInput:        return "InvalidInput";
        case ErrorKind::InvalidHandle:       return "InvalidHandle";
        case ErrorKind::HandleUnavailable:   return "HandleUnavailable";
        case ErrorKind::InsufficientTrust:   return "InsufficientTrust";
        case ErrorKind::EntropyFailure:      return "EntropyFailure";
        case ErrorKind::StorageError:        return "StorageError";
        case ErrorKind::ConfigError:         return "ConfigError";
    }
    return "Unknown";
}

GnsError::GnsError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
    , kind_(kind)
{
}

} // namespace gns
