/**
 * @file signature.hpp
 * @brief Ed25519 signing and verification (deterministic, RFC 8032)
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#pragma once

#include "gns/crypto.hpp"
#include "gns/identity.hpp"
#include <vector>

namespace gns {

/**
 * @brief A message together with its detached signature
 */
struct SignedMessage {
    std::vector<uint8_t> message;
    std::vector<uint8_t> signature;

    /**
     * @brief Byte-exact verification against a signer key
     */
    bool verify(const PublicKey& public_key) const;
};

/**
 * @brief SignatureEngine - stateless Ed25519 operations
 *
 * Verification never throws on malformed signatures; only a malformed
 * public key is a hard error.
 */
class SignatureEngine {
public:
    /**
     * @brief Sign with a raw 32-byte seed
     * @param private_key_seed Ed25519 seed
     * @param message Message bytes
     * @return 64-byte signature
     * @throws GnsError(InvalidKeyFormat) if the seed is not 32 bytes
     */
    static std::vector<uint8_t> sign(
        const std::vector<uint8_t>& private_key_seed,
        const std::vector<uint8_t>& message
    );

    /**
     * @brief Sign with an identity's signing key
     */
    static std::vector<uint8_t> sign(const Identity& identity, const std::vector<uint8_t>& message);

    /**
     * @brief Sign and bundle message with signature
     */
    static SignedMessage sign_message(const Identity& identity, const std::vector<uint8_t>& message);

    /**
     * @brief Verify a signature given raw public key bytes
     * @return true iff signature is exactly 64 bytes and valid
     * @throws GnsError(InvalidKeyFormat) if public_key is not 32 bytes
     */
    static bool verify(
        const std::vector<uint8_t>& public_key,
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature
    );

    /**
     * @brief Verify a signature against a typed public key
     */
    static bool verify(
        const PublicKey& public_key,
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature
    );
};

} // namespace gns
