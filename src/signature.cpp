/**
 * @file signature.cpp
 * @brief Implementation of the signature engine
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/signature.hpp"
#include "gns/config.hpp"
#include "gns/errors.hpp"

namespace gns {

bool SignedMessage::verify(const PublicKey& public_key) const {
    return SignatureEngine::verify(public_key, message, signature);
}

std::vector<uint8_t> SignatureEngine::sign(
    const std::vector<uint8_t>& private_key_seed,
    const std::vector<uint8_t>& message
) {
    if (private_key_seed.size() != config::ED25519_SEED_SIZE) {
        throw GnsError(ErrorKind::InvalidKeyFormat,
            "Signing key must be " + std::to_string(config::ED25519_SEED_SIZE) + " bytes");
    }

    SigningSeed seed;
    std::copy(private_key_seed.begin(), private_key_seed.end(), seed.begin());

    SignatureKeyPair keypair = Crypto::signature_keypair_from_seed(seed);
    auto signature = Crypto::sign_message(message, keypair.secret_key);

    Crypto::secure_zero(seed.data(), seed.size());
    Crypto::secure_zero(keypair.secret_key.data(), keypair.secret_key.size());

    return signature;
}

std::vector<uint8_t> SignatureEngine::sign(const Identity& identity, const std::vector<uint8_t>& message) {
    return identity.sign(message);
}

SignedMessage SignatureEngine::sign_message(const Identity& identity, const std::vector<uint8_t>& message) {
    SignedMessage signed_message;
    signed_message.message = message;
    signed_message.signature = identity.sign(message);
    return signed_message;
}

bool SignatureEngine::verify(
    const std::vector<uint8_t>& public_key,
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature
) {
    if (public_key.size() != config::ED25519_PUBKEY_SIZE) {
        throw GnsError(ErrorKind::InvalidKeyFormat,
            "Public key must be " + std::to_string(config::ED25519_PUBKEY_SIZE) + " bytes");
    }

    PublicKey key;
    std::copy(public_key.begin(), public_key.end(), key.begin());

    return verify(key, message, signature);
}

bool SignatureEngine::verify(
    const PublicKey& public_key,
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature
) {
    return Crypto::verify_signature(message, signature, public_key);
}

} // namespace gns
