/**
 * @file crypto.cpp
 * @brief Implementation of cryptographic primitives for the GNS core
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * - Ed25519: Digital signatures (deterministic, RFC 8032)
 * - X25519: Key agreement (ECDH)
 * - HKDF-SHA256: Key derivation (OpenSSL EVP_PKEY_HKDF)
 * - ChaCha20-Poly1305: AEAD cipher
 * - SHA-256: Trajectory chain hashing
 */

#include "gns/crypto.hpp"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <iomanip>
#include <sstream>

namespace gns {

namespace {
    const char* const ENCRYPTION_DERIVE_SALT = "gns-x25519-derive";
    const char* const ENCRYPTION_DERIVE_INFO = "x25519";
}

// ============================================================================
// Initialization
// ============================================================================

bool Crypto::initialize() {
    // Initialize libsodium (safe to call multiple times)
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Key Generation
// ============================================================================

SignatureKeyPair Crypto::generate_signature_keypair() {
    SignatureKeyPair keypair;

    crypto_sign_keypair(
        keypair.public_key.data(),
        keypair.secret_key.data()
    );

    return keypair;
}

SignatureKeyPair Crypto::signature_keypair_from_seed(const SigningSeed& seed) {
    SignatureKeyPair keypair;

    crypto_sign_seed_keypair(
        keypair.public_key.data(),
        keypair.secret_key.data(),
        seed.data()
    );

    return keypair;
}

SigningSeed Crypto::seed_from_secret_key(
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    SigningSeed seed;
    crypto_sign_ed25519_sk_to_seed(seed.data(), secret_key.data());
    return seed;
}

std::optional<EncryptionKeyPair> Crypto::derive_encryption_keypair(const SigningSeed& seed) {
    std::vector<uint8_t> ikm(seed.begin(), seed.end());
    std::string info_str(ENCRYPTION_DERIVE_INFO);
    std::vector<uint8_t> info(info_str.begin(), info_str.end());

    auto okm = hkdf_sha256(ikm, ENCRYPTION_DERIVE_SALT, info, crypto_scalarmult_SCALARBYTES);
    secure_zero(ikm.data(), ikm.size());

    if (!okm) {
        return std::nullopt;
    }

    EncryptionKeyPair keypair;
    std::copy(okm->begin(), okm->end(), keypair.secret_key.begin());
    secure_zero(okm->data(), okm->size());

    // Clamp into the X25519 scalar space
    keypair.secret_key[0] &= 248;
    keypair.secret_key[31] &= 127;
    keypair.secret_key[31] |= 64;

    if (crypto_scalarmult_base(keypair.public_key.data(), keypair.secret_key.data()) != 0) {
        secure_zero(keypair.secret_key.data(), keypair.secret_key.size());
        return std::nullopt;
    }

    return keypair;
}

EncryptionKeyPair Crypto::generate_encryption_keypair() {
    EncryptionKeyPair keypair;

    crypto_box_keypair(
        keypair.public_key.data(),
        keypair.secret_key.data()
    );

    return keypair;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

std::vector<uint8_t> Crypto::sign_message(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    unsigned long long signature_len;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);

    return signature;
}

bool Crypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const PublicKey& public_key
) {
    // Signature must be exactly 64 bytes, no truncated acceptance
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    int result = crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    );

    return result == 0;
}

// ============================================================================
// Key Agreement and Derivation
// ============================================================================

std::optional<SharedSecret> Crypto::key_exchange(
    const std::array<uint8_t, crypto_scalarmult_SCALARBYTES>& our_secret_key,
    const EncryptionPublicKey& their_public_key
) {
    SharedSecret shared;

    // Fails for low-order points (all-zero output)
    int result = crypto_scalarmult(
        shared.key.data(),
        our_secret_key.data(),
        their_public_key.data()
    );

    if (result != 0) {
        secure_zero(shared.key.data(), shared.key.size());
        return std::nullopt;
    }

    return shared;
}

std::optional<std::vector<uint8_t>> Crypto::hkdf_sha256(
    const std::vector<uint8_t>& ikm,
    const std::string& salt,
    const std::vector<uint8_t>& info,
    size_t length
) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (ctx == nullptr) {
        return std::nullopt;
    }

    std::vector<uint8_t> okm(length);
    size_t okm_len = length;

    bool ok = EVP_PKEY_derive_init(ctx) > 0
        && EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) > 0
        && EVP_PKEY_CTX_set1_hkdf_salt(ctx,
               reinterpret_cast<const unsigned char*>(salt.data()),
               static_cast<int>(salt.size())) > 0
        && EVP_PKEY_CTX_set1_hkdf_key(ctx, ikm.data(), static_cast<int>(ikm.size())) > 0
        && EVP_PKEY_CTX_add1_hkdf_info(ctx, info.data(), static_cast<int>(info.size())) > 0
        && EVP_PKEY_derive(ctx, okm.data(), &okm_len) > 0
        && okm_len == length;

    EVP_PKEY_CTX_free(ctx);

    if (!ok) {
        secure_zero(okm.data(), okm.size());
        return std::nullopt;
    }

    return okm;
}

// ============================================================================
// Encryption (ChaCha20-Poly1305 AEAD)
// ============================================================================

std::optional<std::vector<uint8_t>> Crypto::encrypt(
    const std::vector<uint8_t>& plaintext,
    const SymmetricKey& key,
    const Nonce& nonce,
    const std::vector<uint8_t>& associated_data
) {
    // Plaintext + authentication tag
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long ciphertext_len;

    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        associated_data.empty() ? nullptr : associated_data.data(),
        associated_data.size(),
        nullptr,  // No secret nonce
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    ciphertext.resize(ciphertext_len);

    return ciphertext;
}

std::optional<std::vector<uint8_t>> Crypto::decrypt(
    const std::vector<uint8_t>& ciphertext,
    const SymmetricKey& key,
    const Nonce& nonce,
    const std::vector<uint8_t>& associated_data
) {
    // Ciphertext must be at least as long as the authentication tag
    if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long plaintext_len;

    // Fails if the authentication tag doesn't match (tampering detected)
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr,  // No secret nonce
        ciphertext.data(),
        ciphertext.size(),
        associated_data.empty() ? nullptr : associated_data.data(),
        associated_data.size(),
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    plaintext.resize(plaintext_len);

    return plaintext;
}

// ============================================================================
// Hashing
// ============================================================================

Digest Crypto::sha256(const std::vector<uint8_t>& data) {
    Digest digest;
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<uint8_t> Crypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

bool Crypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Crypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string Crypto::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> Crypto::hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.length() / 2);
    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_hex2bin(
        bytes.data(),
        bytes.size(),
        hex.c_str(),
        hex.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr
    );

    // Reject anything that stops short of the full string
    if (result != 0 || decoded_len != bytes.size() || end_ptr != hex.c_str() + hex.length()) {
        return std::nullopt;
    }

    return bytes;
}

std::optional<std::vector<uint8_t>> Crypto::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0 || end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);

    return bytes;
}

void Crypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace gns
