/**
 * @file envelope.cpp
 * @brief Implementation of the envelope protocol
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/envelope.hpp"
#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/signature.hpp"
#include "gns/utilities.hpp"
#include "gns/wire.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gns {

namespace {
    std::vector<uint8_t> to_bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    OpenedEnvelope rejected(const Envelope& envelope, OpenStatus status, bool signature_valid) {
        OpenedEnvelope result;
        result.status = status;
        result.from_public_key = envelope.sender_public_key;
        result.payload_type = envelope.payload_type;
        result.signature_valid = signature_valid;
        return result;
    }
}

// ============================================================================
// Envelope
// ============================================================================

std::vector<uint8_t> Envelope::signed_bytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(ephemeral_public_key.size() + nonce.size() + 8 +
                  ciphertext.size() + payload_type.size());

    wire::append_bytes(bytes, ephemeral_public_key);
    wire::append_bytes(bytes, nonce);
    wire::append_length_prefixed(bytes, ciphertext);
    wire::append_length_prefixed(bytes, payload_type);

    return bytes;
}

std::string Envelope::id() const {
    return Crypto::bytes_to_hex(Crypto::sha256(signature));
}

std::string Envelope::to_json() const {
    try {
        json j;
        j["senderPublicKey"] = Crypto::bytes_to_hex(sender_public_key);
        j["ephemeralPublicKey"] = Crypto::bytes_to_hex(ephemeral_public_key);
        j["nonce"] = Crypto::bytes_to_hex(nonce);
        j["ciphertext"] = Crypto::bytes_to_base64(ciphertext);
        j["payloadType"] = payload_type;
        j["signature"] = Crypto::bytes_to_hex(signature);

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<Envelope> Envelope::from_json(const std::string& json_str) {
    if (json_str.size() > config::MAX_JSON_SIZE) {
        return std::nullopt;
    }

    try {
        json j = json::parse(json_str);

        auto sender = Crypto::hex_to_array<crypto_sign_PUBLICKEYBYTES>(
            j.at("senderPublicKey").get<std::string>());
        auto ephemeral = Crypto::hex_to_array<crypto_scalarmult_BYTES>(
            j.at("ephemeralPublicKey").get<std::string>());
        auto nonce = Crypto::hex_to_array<crypto_aead_chacha20poly1305_ietf_NPUBBYTES>(
            j.at("nonce").get<std::string>());
        auto ciphertext = Crypto::base64_to_bytes(j.at("ciphertext").get<std::string>());
        auto signature = Crypto::hex_to_bytes(j.at("signature").get<std::string>());

        if (!sender || !ephemeral || !nonce || !ciphertext || !signature) {
            return std::nullopt;
        }
        if (signature->size() != config::ED25519_SIGNATURE_SIZE ||
            ciphertext->size() < config::CHACHA20_TAG_SIZE) {
            return std::nullopt;
        }

        Envelope envelope;
        envelope.sender_public_key = *sender;
        envelope.ephemeral_public_key = *ephemeral;
        envelope.nonce = *nonce;
        envelope.ciphertext = std::move(*ciphertext);
        envelope.payload_type = j.at("payloadType").get<std::string>();
        envelope.signature = std::move(*signature);

        return envelope;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// OpenedEnvelope
// ============================================================================

const char* open_status_to_string(OpenStatus status) {
    switch (status) {
        case OpenStatus::Opened:           return "Opened";
        case OpenStatus::SignatureInvalid: return "SignatureInvalid";
        case OpenStatus::DecryptionFailed: return "DecryptionFailed";
    }
    return "Unknown";
}

std::string OpenedEnvelope::to_json() const {
    try {
        json j;
        j["fromPublicKey"] = Crypto::bytes_to_hex(from_public_key);
        j["payloadType"] = payload_type;
        j["payload"] = Crypto::bytes_to_base64(payload);
        j["signatureValid"] = signature_valid;

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

// ============================================================================
// Sealing
// ============================================================================

Envelope EnvelopeProtocol::seal(
    const Identity& sender,
    const EncryptionPublicKey& recipient_encryption_key,
    const PublicKey& recipient_signing_key,
    const std::string& payload_type,
    const std::vector<uint8_t>& plaintext
) {
    if (plaintext.size() > config::MAX_ENVELOPE_PAYLOAD) {
        throw GnsError(ErrorKind::EncryptionError,
            "Payload exceeds " + std::to_string(config::MAX_ENVELOPE_PAYLOAD) + " bytes");
    }
    if (payload_type.size() > config::MAX_PAYLOAD_TYPE_LENGTH) {
        throw GnsError(ErrorKind::EncryptionError, "Payload type label too long");
    }

    // Fresh ephemeral key pair for every envelope
    EncryptionKeyPair ephemeral = Crypto::generate_encryption_keypair();

    auto shared = Crypto::key_exchange(ephemeral.secret_key, recipient_encryption_key);
    Crypto::secure_zero(ephemeral.secret_key.data(), ephemeral.secret_key.size());
    if (!shared) {
        throw GnsError(ErrorKind::EncryptionError, "Recipient encryption key is not usable");
    }

    auto keys = derive_message_keys(*shared, ephemeral.public_key, recipient_encryption_key);
    Crypto::secure_zero(shared->key.data(), shared->key.size());
    if (!keys) {
        throw GnsError(ErrorKind::EncryptionError, "Message key derivation failed");
    }

    auto ciphertext = Crypto::encrypt(plaintext, keys->key, keys->nonce, to_bytes(payload_type));
    Crypto::secure_zero(keys->key.data(), keys->key.size());
    if (!ciphertext) {
        throw GnsError(ErrorKind::EncryptionError, "Payload encryption failed");
    }

    Envelope envelope;
    envelope.sender_public_key = sender.public_key();
    envelope.ephemeral_public_key = ephemeral.public_key;
    envelope.nonce = keys->nonce;
    envelope.ciphertext = std::move(*ciphertext);
    envelope.payload_type = payload_type;
    envelope.signature = sender.sign(envelope.signed_bytes());

    utilities::log_debug("Sealed envelope " + utilities::short_key(envelope.id()) +
                         " from " + utilities::short_key(sender.public_key_hex()) +
                         " to " + utilities::short_key(Crypto::bytes_to_hex(recipient_signing_key)));

    return envelope;
}

Envelope EnvelopeProtocol::seal(
    const Identity& sender,
    const std::vector<uint8_t>& recipient_encryption_key,
    const std::vector<uint8_t>& recipient_signing_key,
    const std::string& payload_type,
    const std::vector<uint8_t>& plaintext
) {
    if (recipient_encryption_key.size() != config::X25519_PUBKEY_SIZE) {
        throw GnsError(ErrorKind::EncryptionError,
            "Recipient encryption key must be " + std::to_string(config::X25519_PUBKEY_SIZE) + " bytes");
    }
    if (recipient_signing_key.size() != config::ED25519_PUBKEY_SIZE) {
        throw GnsError(ErrorKind::EncryptionError,
            "Recipient signing key must be " + std::to_string(config::ED25519_PUBKEY_SIZE) + " bytes");
    }

    EncryptionPublicKey encryption_key;
    std::copy(recipient_encryption_key.begin(), recipient_encryption_key.end(), encryption_key.begin());

    PublicKey signing_key;
    std::copy(recipient_signing_key.begin(), recipient_signing_key.end(), signing_key.begin());

    return seal(sender, encryption_key, signing_key, payload_type, plaintext);
}

// ============================================================================
// Opening
// ============================================================================

OpenedEnvelope EnvelopeProtocol::open(const Identity& recipient, const Envelope& envelope) {
    // Authenticity first: a forged envelope is never decrypted
    if (!SignatureEngine::verify(envelope.sender_public_key, envelope.signed_bytes(), envelope.signature)) {
        utilities::log_warn("Rejected envelope with invalid signature from " +
                            utilities::short_key(Crypto::bytes_to_hex(envelope.sender_public_key)));
        return rejected(envelope, OpenStatus::SignatureInvalid, false);
    }

    auto shared = recipient.key_exchange(envelope.ephemeral_public_key);
    if (!shared) {
        return rejected(envelope, OpenStatus::DecryptionFailed, true);
    }

    auto keys = derive_message_keys(*shared, envelope.ephemeral_public_key, recipient.encryption_public_key());
    Crypto::secure_zero(shared->key.data(), shared->key.size());
    if (!keys) {
        return rejected(envelope, OpenStatus::DecryptionFailed, true);
    }

    bool nonce_matches = Crypto::constant_time_compare(
        std::vector<uint8_t>(keys->nonce.begin(), keys->nonce.end()),
        std::vector<uint8_t>(envelope.nonce.begin(), envelope.nonce.end())
    );

    std::optional<std::vector<uint8_t>> plaintext;
    if (nonce_matches) {
        plaintext = Crypto::decrypt(envelope.ciphertext, keys->key, keys->nonce,
                                    to_bytes(envelope.payload_type));
    }
    Crypto::secure_zero(keys->key.data(), keys->key.size());

    if (!plaintext) {
        utilities::log_warn("Envelope " + utilities::short_key(envelope.id()) + " could not be decrypted");
        return rejected(envelope, OpenStatus::DecryptionFailed, true);
    }

    OpenedEnvelope result;
    result.status = OpenStatus::Opened;
    result.from_public_key = envelope.sender_public_key;
    result.payload_type = envelope.payload_type;
    result.payload = std::move(*plaintext);
    result.signature_valid = true;

    return result;
}

OpenedEnvelope EnvelopeProtocol::open_or_throw(const Identity& recipient, const Envelope& envelope) {
    OpenedEnvelope result = open(recipient, envelope);

    switch (result.status) {
        case OpenStatus::Opened:
            return result;
        case OpenStatus::SignatureInvalid:
            throw GnsError(ErrorKind::SignatureInvalid, "Envelope signature invalid");
        case OpenStatus::DecryptionFailed:
            break;
    }

    throw GnsError(ErrorKind::DecryptionError, "Envelope could not be opened");
}

// ============================================================================
// Key Derivation
// ============================================================================

std::optional<EnvelopeProtocol::MessageKeys> EnvelopeProtocol::derive_message_keys(
    const SharedSecret& shared,
    const EncryptionPublicKey& ephemeral_public_key,
    const EncryptionPublicKey& recipient_encryption_key
) {
    std::vector<uint8_t> ikm(shared.key.begin(), shared.key.end());

    std::vector<uint8_t> info;
    wire::append_string(info, config::ENVELOPE_KDF_INFO);
    wire::append_bytes(info, ephemeral_public_key);
    wire::append_bytes(info, recipient_encryption_key);

    MessageKeys keys;
    auto okm = Crypto::hkdf_sha256(ikm, config::ENVELOPE_KDF_SALT, info, keys.key.size() + keys.nonce.size());
    Crypto::secure_zero(ikm.data(), ikm.size());

    if (!okm) {
        return std::nullopt;
    }

    std::copy(okm->begin(), okm->begin() + keys.key.size(), keys.key.begin());
    std::copy(okm->begin() + keys.key.size(), okm->end(), keys.nonce.begin());
    Crypto::secure_zero(okm->data(), okm->size());

    return keys;
}

} // namespace gns
