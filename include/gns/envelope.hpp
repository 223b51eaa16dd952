/**
 * @file envelope.hpp
 * @brief Hybrid encrypted, signed message envelopes
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Sealing:
 *   eph = fresh X25519 key pair
 *   shared = X25519(eph.secret, recipient.encryption_public)
 *   okm = HKDF-SHA256(salt="gns-message-key", ikm=shared,
 *                     info="gns-envelope-v1" || eph.public || recipient.encryption_public, L=44)
 *   key = okm[0..32), nonce = okm[32..44)
 *   ciphertext = ChaCha20-Poly1305(key, nonce, aad=payloadType, plaintext)
 *   signature = Ed25519(sender, eph.public || nonce || u32be(|ct|) || ct
 *                               || u32be(|type|) || type)
 *
 * Opening verifies the signature before any decryption is attempted.
 */

#pragma once

#include "gns/crypto.hpp"
#include "gns/identity.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief Sealed envelope, immutable once created
 */
struct Envelope {
    PublicKey sender_public_key;
    EncryptionPublicKey ephemeral_public_key;
    Nonce nonce;
    std::vector<uint8_t> ciphertext;
    std::string payload_type;
    std::vector<uint8_t> signature;

    /**
     * @brief Canonical tuple covered by the sender signature
     */
    std::vector<uint8_t> signed_bytes() const;

    /**
     * @brief Stable identifier: hex(SHA-256(signature))
     */
    std::string id() const;

    std::string to_json() const;
    static std::optional<Envelope> from_json(const std::string& json);
};

/**
 * @brief Outcome tag of EnvelopeProtocol::open
 */
enum class OpenStatus {
    Opened,             ///< Signature valid and payload decrypted
    SignatureInvalid,   ///< Signature failed; nothing was decrypted
    DecryptionFailed    ///< Signature valid but decryption failed
};

const char* open_status_to_string(OpenStatus status);

/**
 * @brief Result of opening an envelope
 *
 * payload is empty unless status is Opened.
 */
struct OpenedEnvelope {
    OpenStatus status = OpenStatus::DecryptionFailed;
    PublicKey from_public_key{};
    std::string payload_type;
    std::vector<uint8_t> payload;
    bool signature_valid = false;

    bool ok() const { return status == OpenStatus::Opened; }

    /**
     * @brief Payload interpreted as UTF-8 text
     */
    std::string payload_text() const { return std::string(payload.begin(), payload.end()); }

    /// {fromPublicKey, payloadType, payload, signatureValid}
    std::string to_json() const;
};

/**
 * @brief EnvelopeProtocol - seal and open envelopes between identities
 *
 * Stateless; safe to call concurrently for different identities.
 */
class EnvelopeProtocol {
public:
    /**
     * @brief Seal a payload for a recipient
     * @param sender Sender identity (signs the envelope)
     * @param recipient_encryption_key Recipient X25519 public key
     * @param recipient_signing_key Recipient Ed25519 public key
     * @param payload_type Application payload label (authenticated, not encrypted)
     * @param plaintext Payload bytes (may be empty)
     * @return Complete envelope
     * @throws GnsError(EncryptionError) on malformed recipient keys or oversized payload
     */
    static Envelope seal(
        const Identity& sender,
        const EncryptionPublicKey& recipient_encryption_key,
        const PublicKey& recipient_signing_key,
        const std::string& payload_type,
        const std::vector<uint8_t>& plaintext
    );

    /**
     * @brief Seal with recipient keys given as raw bytes
     * @throws GnsError(EncryptionError) if either key is not 32 bytes
     */
    static Envelope seal(
        const Identity& sender,
        const std::vector<uint8_t>& recipient_encryption_key,
        const std::vector<uint8_t>& recipient_signing_key,
        const std::string& payload_type,
        const std::vector<uint8_t>& plaintext
    );

    /**
     * @brief Open an envelope addressed to recipient
     *
     * Pure: the same envelope yields the same result every time.
     */
    static OpenedEnvelope open(const Identity& recipient, const Envelope& envelope);

    /**
     * @brief Open, converting failures to exceptions
     *
     * A modified ciphertext byte raises SignatureInvalid, since the signature
     * covers the ciphertext and is checked before decryption.
     * @throws GnsError(SignatureInvalid) or GnsError(DecryptionError)
     */
    static OpenedEnvelope open_or_throw(const Identity& recipient, const Envelope& envelope);

private:
    struct MessageKeys {
        SymmetricKey key;
        Nonce nonce;
    };

    static std::optional<MessageKeys> derive_message_keys(
        const SharedSecret& shared,
        const EncryptionPublicKey& ephemeral_public_key,
        const EncryptionPublicKey& recipient_encryption_key
    );
};

} // namespace gns
