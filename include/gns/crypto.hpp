/**
 * @file crypto.hpp
 * @brief Cryptographic primitives for the GNS core
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Provides Ed25519 signatures, X25519 key agreement, HKDF-SHA256,
 * ChaCha20-Poly1305 encryption and SHA-256 hashing.
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace gns {

/// Ed25519 public key (the identity address)
using PublicKey = std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>;

/// Ed25519 seed, the exported form of the signing private key
using SigningSeed = std::array<uint8_t, crypto_sign_SEEDBYTES>;

/// X25519 public key
using EncryptionPublicKey = std::array<uint8_t, crypto_scalarmult_BYTES>;

/// ChaCha20-Poly1305 (IETF) key
using SymmetricKey = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_KEYBYTES>;

/// ChaCha20-Poly1305 (IETF) nonce
using Nonce = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES>;

/// SHA-256 digest
using Digest = std::array<uint8_t, crypto_hash_sha256_BYTES>;

/**
 * @brief Ed25519 signature key pair
 */
struct SignatureKeyPair {
    PublicKey public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/**
 * @brief X25519 encryption key pair
 */
struct EncryptionKeyPair {
    EncryptionPublicKey public_key;
    std::array<uint8_t, crypto_scalarmult_SCALARBYTES> secret_key;
};

/**
 * @brief Raw X25519 shared secret (input keying material, never a cipher key)
 */
struct SharedSecret {
    std::array<uint8_t, crypto_scalarmult_BYTES> key;
};

/**
 * @brief Crypto - stateless cryptographic primitives
 *
 * Thread-safe once initialize() has succeeded.
 */
class Crypto {
public:
    /**
     * @brief Initialize libsodium (safe to call multiple times)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate Ed25519 signature key pair from the system CSPRNG
     */
    static SignatureKeyPair generate_signature_keypair();

    /**
     * @brief Rebuild Ed25519 key pair from its 32-byte seed
     */
    static SignatureKeyPair signature_keypair_from_seed(const SigningSeed& seed);

    /**
     * @brief Extract the 32-byte seed from an Ed25519 secret key
     */
    static SigningSeed seed_from_secret_key(
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Derive the X25519 key pair belonging to a signing seed
     *
     * x = clamp(HKDF-SHA256(salt="gns-x25519-derive", ikm=seed, info="x25519"))
     *
     * @param seed Ed25519 seed
     * @return Derived key pair, or std::nullopt if HKDF fails
     */
    static std::optional<EncryptionKeyPair> derive_encryption_keypair(const SigningSeed& seed);

    /**
     * @brief Generate random X25519 key pair (ephemeral keys)
     */
    static EncryptionKeyPair generate_encryption_keypair();

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Sign a message with Ed25519 (deterministic)
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Signature (64 bytes)
     */
    static std::vector<uint8_t> sign_message(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 signature
     * @param message Original message
     * @param signature Signature to verify (must be exactly 64 bytes)
     * @param public_key Public key of signer
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const PublicKey& public_key
    );

    // ========================================================================
    // Key Agreement and Derivation
    // ========================================================================

    /**
     * @brief X25519 key agreement
     * @param our_secret_key Our X25519 secret key
     * @param their_public_key Their X25519 public key
     * @return Shared secret, or std::nullopt for low-order peer keys
     */
    static std::optional<SharedSecret> key_exchange(
        const std::array<uint8_t, crypto_scalarmult_SCALARBYTES>& our_secret_key,
        const EncryptionPublicKey& their_public_key
    );

    /**
     * @brief HKDF-SHA256 (RFC 5869) extract-and-expand
     * @param ikm Input keying material
     * @param salt Salt
     * @param info Context information
     * @param length Output length in bytes
     * @return Output keying material, or std::nullopt on failure
     */
    static std::optional<std::vector<uint8_t>> hkdf_sha256(
        const std::vector<uint8_t>& ikm,
        const std::string& salt,
        const std::vector<uint8_t>& info,
        size_t length
    );

    // ========================================================================
    // Encryption (ChaCha20-Poly1305 AEAD)
    // ========================================================================

    /**
     * @brief Encrypt with ChaCha20-Poly1305 (IETF)
     * @param plaintext Message to encrypt
     * @param key Symmetric key
     * @param nonce Nonce - must never be reused with the same key
     * @param associated_data Authenticated but unencrypted data
     * @return Ciphertext with authentication tag appended
     */
    static std::optional<std::vector<uint8_t>> encrypt(
        const std::vector<uint8_t>& plaintext,
        const SymmetricKey& key,
        const Nonce& nonce,
        const std::vector<uint8_t>& associated_data = {}
    );

    /**
     * @brief Decrypt with ChaCha20-Poly1305 (IETF)
     * @return Plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> decrypt(
        const std::vector<uint8_t>& ciphertext,
        const SymmetricKey& key,
        const Nonce& nonce,
        const std::vector<uint8_t>& associated_data = {}
    );

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief SHA-256 of arbitrary bytes
     */
    static Digest sha256(const std::vector<uint8_t>& data);

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     */
    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Constant-time comparison of byte arrays (prevents timing attacks)
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    /**
     * @brief Convert bytes to lowercase hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    template <size_t N>
    static std::string bytes_to_hex(const std::array<uint8_t, N>& bytes) {
        return bytes_to_hex(std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }

    /**
     * @brief Convert bytes to base64 string (standard alphabet, padded)
     */
    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @return Decoded bytes, or std::nullopt if not strictly hex
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Decode hexadecimal string into a fixed-size array
     * @return Array, or std::nullopt on bad hex or wrong length
     */
    template <size_t N>
    static std::optional<std::array<uint8_t, N>> hex_to_array(const std::string& hex) {
        auto bytes = hex_to_bytes(hex);
        if (!bytes || bytes->size() != N) {
            return std::nullopt;
        }
        std::array<uint8_t, N> out;
        std::copy(bytes->begin(), bytes->end(), out.begin());
        return out;
    }

    /**
     * @brief Convert base64 string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Securely zero memory (not removed by the optimizer)
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace gns
