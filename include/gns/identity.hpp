/**
 * @file identity.hpp
 * @brief Identity key material: Ed25519 signing keys and derived X25519 keys
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * An identity is fully recoverable from its 32-byte signing seed. The
 * encryption key pair is derived from the seed (HKDF-SHA256 then clamped)
 * and is never generated independently.
 */

#pragma once

#include "gns/crypto.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief Boundary record for identity backup: {publicKey, privateKey, encryptionKey}
 *
 * privateKey is the signing seed in hex. SENSITIVE.
 */
struct IdentityExport {
    std::string public_key;
    std::string private_key;
    std::string encryption_key;

    std::string to_json() const;
    static std::optional<IdentityExport> from_json(const std::string& json);
};

/**
 * @brief Identity - exclusive owner of a participant's key material
 *
 * Move-only. Secret bytes are wiped on destruction and when moved from.
 */
class Identity {
public:
    /**
     * @brief Create a new identity from the system CSPRNG
     * @throws GnsError(EntropyFailure) if the random source is unavailable
     */
    static Identity generate();

    /**
     * @brief Recreate an identity from its signing seed
     * @param seed 32-byte Ed25519 seed
     * @param created_at Creation time in Unix ms (0 means now)
     * @throws GnsError(InvalidKeyFormat) if seed is not 32 bytes
     */
    static Identity restore(const std::vector<uint8_t>& seed, uint64_t created_at = 0);

    /**
     * @brief Recreate an identity from the hex form of its seed
     * @throws GnsError(InvalidKeyFormat) for bad hex or length
     */
    static Identity from_private_key_hex(const std::string& hex, uint64_t created_at = 0);

    /**
     * @brief Recreate an identity from an export record
     *
     * The publicKey field, when present, must match the restored key.
     * @throws GnsError(InvalidKeyFormat) on bad or inconsistent fields
     */
    static Identity from_export(const IdentityExport& record);

    ~Identity();

    Identity(Identity&& other) noexcept;
    Identity& operator=(Identity&& other) noexcept;

    Identity(const Identity&) = delete;
    Identity& operator=(const Identity&) = delete;

    // ========================================================================
    // Identity Information
    // ========================================================================

    const PublicKey& public_key() const { return signature_keypair_.public_key; }
    std::string public_key_hex() const;

    const EncryptionPublicKey& encryption_public_key() const { return encryption_keypair_.public_key; }
    std::string encryption_public_key_hex() const;

    const std::optional<std::string>& handle() const { return handle_; }
    void set_handle(const std::string& handle) { handle_ = handle; }

    uint64_t created_at() const { return created_at_; }

    // ========================================================================
    // Cryptographic Operations
    // ========================================================================

    /**
     * @brief Sign message with the Ed25519 key (deterministic)
     */
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

    /**
     * @brief X25519 agreement between our encryption key and a peer public key
     * @return Raw shared secret, or std::nullopt for low-order peer keys
     */
    std::optional<SharedSecret> key_exchange(const EncryptionPublicKey& peer_public_key) const;

    /**
     * @brief Signing seed (SENSITIVE - key stores only)
     */
    SigningSeed private_key_seed() const;

    /**
     * @brief Export {publicKey, privateKey, encryptionKey} in hex (SENSITIVE)
     */
    IdentityExport export_keys() const;

private:
    Identity(const SigningSeed& seed, uint64_t created_at);

    void wipe() noexcept;

    /// Ed25519 signature keypair
    SignatureKeyPair signature_keypair_;

    /// X25519 encryption keypair derived from the signing seed
    EncryptionKeyPair encryption_keypair_;

    std::optional<std::string> handle_;

    uint64_t created_at_ = 0;
};

} // namespace gns
