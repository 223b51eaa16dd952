/**
 * @file identity.cpp
 * @brief Implementation of identity key material
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/identity.hpp"
#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/utilities.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gns {

// ============================================================================
// IdentityExport Serialization
// ============================================================================

std::string IdentityExport::to_json() const {
    try {
        json j;
        j["publicKey"] = public_key;
        j["privateKey"] = private_key;
        j["encryptionKey"] = encryption_key;

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<IdentityExport> IdentityExport::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        IdentityExport record;
        record.public_key = j.at("publicKey").get<std::string>();
        record.private_key = j.at("privateKey").get<std::string>();
        record.encryption_key = j.value("encryptionKey", std::string());

        if (record.private_key.length() != config::ED25519_SEED_SIZE * 2) {
            return std::nullopt;
        }

        return record;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Constructors
// ============================================================================

Identity::Identity(const SigningSeed& seed, uint64_t created_at)
    : signature_keypair_(Crypto::signature_keypair_from_seed(seed))
    , created_at_(created_at == 0 ? utilities::current_time_ms() : created_at)
{
    auto encryption = Crypto::derive_encryption_keypair(seed);
    if (!encryption) {
        wipe();
        throw GnsError(ErrorKind::InvalidKeyFormat, "Encryption key derivation failed");
    }

    encryption_keypair_ = *encryption;
    Crypto::secure_zero(encryption->secret_key.data(), encryption->secret_key.size());
}

Identity Identity::generate() {
    if (!Crypto::initialize()) {
        throw GnsError(ErrorKind::EntropyFailure, "libsodium initialization failed");
    }

    auto random = Crypto::generate_random_bytes(config::ED25519_SEED_SIZE);

    SigningSeed seed;
    std::copy(random.begin(), random.end(), seed.begin());
    Crypto::secure_zero(random.data(), random.size());

    Identity identity(seed, 0);
    Crypto::secure_zero(seed.data(), seed.size());

    utilities::log_debug("Generated identity " + utilities::short_key(identity.public_key_hex()));
    return identity;
}

Identity Identity::restore(const std::vector<uint8_t>& seed_bytes, uint64_t created_at) {
    if (seed_bytes.size() != config::ED25519_SEED_SIZE) {
        throw GnsError(ErrorKind::InvalidKeyFormat,
            "Private key must be " + std::to_string(config::ED25519_SEED_SIZE) +
            " bytes, got " + std::to_string(seed_bytes.size()));
    }

    if (!Crypto::initialize()) {
        throw GnsError(ErrorKind::EntropyFailure, "libsodium initialization failed");
    }

    SigningSeed seed;
    std::copy(seed_bytes.begin(), seed_bytes.end(), seed.begin());

    Identity identity(seed, created_at);
    Crypto::secure_zero(seed.data(), seed.size());

    return identity;
}

Identity Identity::from_private_key_hex(const std::string& hex, uint64_t created_at) {
    auto bytes = Crypto::hex_to_bytes(hex);
    if (!bytes) {
        throw GnsError(ErrorKind::InvalidKeyFormat, "Private key is not valid hex");
    }

    try {
        Identity identity = restore(*bytes, created_at);
        Crypto::secure_zero(bytes->data(), bytes->size());
        return identity;
    } catch (const GnsError&) {
        Crypto::secure_zero(bytes->data(), bytes->size());
        throw;
    }
}

Identity Identity::from_export(const IdentityExport& record) {
    Identity identity = from_private_key_hex(record.private_key);

    if (!record.public_key.empty() && record.public_key != identity.public_key_hex()) {
        throw GnsError(ErrorKind::InvalidKeyFormat, "Exported public key does not match private key");
    }
    if (!record.encryption_key.empty() && record.encryption_key != identity.encryption_public_key_hex()) {
        throw GnsError(ErrorKind::InvalidKeyFormat, "Exported encryption key does not match private key");
    }

    return identity;
}

Identity::~Identity() {
    wipe();
}

Identity::Identity(Identity&& other) noexcept
    : signature_keypair_(other.signature_keypair_)
    , encryption_keypair_(other.encryption_keypair_)
    , handle_(std::move(other.handle_))
    , created_at_(other.created_at_)
{
    other.wipe();
}

Identity& Identity::operator=(Identity&& other) noexcept {
    if (this != &other) {
        wipe();
        signature_keypair_ = other.signature_keypair_;
        encryption_keypair_ = other.encryption_keypair_;
        handle_ = std::move(other.handle_);
        created_at_ = other.created_at_;
        other.wipe();
    }
    return *this;
}

void Identity::wipe() noexcept {
    Crypto::secure_zero(signature_keypair_.secret_key.data(), signature_keypair_.secret_key.size());
    Crypto::secure_zero(encryption_keypair_.secret_key.data(), encryption_keypair_.secret_key.size());
}

// ============================================================================
// Identity Information
// ============================================================================

std::string Identity::public_key_hex() const {
    return Crypto::bytes_to_hex(signature_keypair_.public_key);
}

std::string Identity::encryption_public_key_hex() const {
    return Crypto::bytes_to_hex(encryption_keypair_.public_key);
}

// ============================================================================
// Cryptographic Operations
// ============================================================================

std::vector<uint8_t> Identity::sign(const std::vector<uint8_t>& message) const {
    return Crypto::sign_message(message, signature_keypair_.secret_key);
}

std::optional<SharedSecret> Identity::key_exchange(const EncryptionPublicKey& peer_public_key) const {
    return Crypto::key_exchange(encryption_keypair_.secret_key, peer_public_key);
}

SigningSeed Identity::private_key_seed() const {
    return Crypto::seed_from_secret_key(signature_keypair_.secret_key);
}

IdentityExport Identity::export_keys() const {
    SigningSeed seed = private_key_seed();

    IdentityExport record;
    record.public_key = public_key_hex();
    record.private_key = Crypto::bytes_to_hex(seed);
    record.encryption_key = encryption_public_key_hex();

    Crypto::secure_zero(seed.data(), seed.size());
    return record;
}

} // namespace gns
