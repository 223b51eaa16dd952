/**
 * @file test_envelope.cpp
 * @brief Unit tests for EnvelopeProtocol
 *
 * Tests:
 * - Seal/open between two identities
 * - Payload sizes from empty to 64 KiB
 * - Tamper detection (signature first, then AEAD)
 * - Wrong recipient and malformed recipient keys
 * - JSON transport round trip
 */

#include <gtest/gtest.h>
#include "gns/envelope.hpp"
#include "gns/crypto.hpp"
#include "gns/signature.hpp"
#include "test_helpers.hpp"
#include <set>
#include <string>
#include <vector>

using namespace gns;
using gns::testing::thrown_kind;
using gns::testing::identity_from_fill;

// Test fixture for envelope tests
class EnvelopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(Crypto::initialize());
    }

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    Envelope seal_hello() {
        return EnvelopeProtocol::seal(alice_, bob_.encryption_public_key(), bob_.public_key(),
                                      "text", bytes("hello"));
    }

    Identity alice_ = identity_from_fill(0xA1);
    Identity bob_ = identity_from_fill(0xB0);
};

// ============================================================================
// Seal and Open Tests
// ============================================================================

TEST_F(EnvelopeTest, SealAndOpenHello) {
    Envelope envelope = seal_hello();
    OpenedEnvelope opened = EnvelopeProtocol::open(bob_, envelope);

    ASSERT_TRUE(opened.ok());
    EXPECT_EQ(opened.status, OpenStatus::Opened);
    EXPECT_TRUE(opened.signature_valid);
    EXPECT_EQ(opened.payload_text(), "hello");
    EXPECT_EQ(opened.payload_type, "text");
    EXPECT_EQ(opened.from_public_key, alice_.public_key());
}

TEST_F(EnvelopeTest, EnvelopeShape) {
    Envelope envelope = seal_hello();

    EXPECT_EQ(envelope.sender_public_key, alice_.public_key());
    EXPECT_EQ(envelope.signature.size(), 64u);
    EXPECT_EQ(envelope.ciphertext.size(), 5u + 16u);
    EXPECT_EQ(envelope.id().size(), 64u);
    EXPECT_TRUE(SignatureEngine::verify(alice_.public_key(), envelope.signed_bytes(), envelope.signature));
}

TEST_F(EnvelopeTest, PayloadSizes) {
    for (size_t size : {size_t(0), size_t(1), size_t(65536)}) {
        std::vector<uint8_t> payload(size);
        for (size_t i = 0; i < size; ++i) {
            payload[i] = static_cast<uint8_t>(i * 31);
        }

        Envelope envelope = EnvelopeProtocol::seal(alice_, bob_.encryption_public_key(), bob_.public_key(),
                                                   "application/octet-stream", payload);
        OpenedEnvelope opened = EnvelopeProtocol::open(bob_, envelope);

        ASSERT_TRUE(opened.ok()) << "size " << size;
        EXPECT_EQ(opened.payload, payload) << "size " << size;
    }
}

TEST_F(EnvelopeTest, EphemeralKeysAreFresh) {
    std::set<std::string> ephemeral_keys;
    std::set<std::string> ids;

    for (int i = 0; i < 10; ++i) {
        Envelope envelope = seal_hello();
        ephemeral_keys.insert(Crypto::bytes_to_hex(envelope.ephemeral_public_key));
        ids.insert(envelope.id());
    }

    EXPECT_EQ(ephemeral_keys.size(), 10u);
    EXPECT_EQ(ids.size(), 10u);
}

TEST_F(EnvelopeTest, OpenIsRepeatable) {
    Envelope envelope = seal_hello();

    OpenedEnvelope first = EnvelopeProtocol::open(bob_, envelope);
    OpenedEnvelope second = EnvelopeProtocol::open(bob_, envelope);

    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.payload, second.payload);
}

TEST_F(EnvelopeTest, SealWithRawKeyBytes) {
    std::vector<uint8_t> enc(bob_.encryption_public_key().begin(), bob_.encryption_public_key().end());
    std::vector<uint8_t> sig(bob_.public_key().begin(), bob_.public_key().end());

    Envelope envelope = EnvelopeProtocol::seal(alice_, enc, sig, "text/plain", bytes("raw"));
    EXPECT_EQ(EnvelopeProtocol::open(bob_, envelope).payload_text(), "raw");
}

TEST_F(EnvelopeTest, OpenOrThrowReturnsPayload) {
    OpenedEnvelope opened = EnvelopeProtocol::open_or_throw(bob_, seal_hello());
    EXPECT_EQ(opened.payload_text(), "hello");
}

// ============================================================================
// Tamper Tests
// ============================================================================

TEST_F(EnvelopeTest, CiphertextTamperFailsSignature) {
    Envelope envelope = seal_hello();
    envelope.ciphertext[0] ^= 0x01;

    OpenedEnvelope opened = EnvelopeProtocol::open(bob_, envelope);
    EXPECT_EQ(opened.status, OpenStatus::SignatureInvalid);
    EXPECT_FALSE(opened.signature_valid);
    EXPECT_TRUE(opened.payload.empty());

    EXPECT_EQ(thrown_kind([&] { EnvelopeProtocol::open_or_throw(bob_, envelope); }),
              ErrorKind::SignatureInvalid);
}

TEST_F(EnvelopeTest, PayloadTypeTamperFailsSignature) {
    Envelope envelope = seal_hello();
    envelope.payload_type = "text/html";

    EXPECT_EQ(EnvelopeProtocol::open(bob_, envelope).status, OpenStatus::SignatureInvalid);
}

TEST_F(EnvelopeTest, NonceAndEphemeralTamperFailSignature) {
    Envelope nonce_tampered = seal_hello();
    nonce_tampered.nonce[0] ^= 0x01;
    EXPECT_EQ(EnvelopeProtocol::open(bob_, nonce_tampered).status, OpenStatus::SignatureInvalid);

    Envelope key_tampered = seal_hello();
    key_tampered.ephemeral_public_key[0] ^= 0x01;
    EXPECT_EQ(EnvelopeProtocol::open(bob_, key_tampered).status, OpenStatus::SignatureInvalid);
}

TEST_F(EnvelopeTest, ResignedCiphertextTamperFailsDecryption) {
    Envelope envelope = seal_hello();
    envelope.ciphertext[0] ^= 0x01;
    envelope.signature = alice_.sign(envelope.signed_bytes());

    OpenedEnvelope opened = EnvelopeProtocol::open(bob_, envelope);
    EXPECT_EQ(opened.status, OpenStatus::DecryptionFailed);
    EXPECT_TRUE(opened.signature_valid);
    EXPECT_TRUE(opened.payload.empty());

    EXPECT_EQ(thrown_kind([&] { EnvelopeProtocol::open_or_throw(bob_, envelope); }),
              ErrorKind::DecryptionError);
}

TEST_F(EnvelopeTest, SenderSubstitutionFailsDecryption) {
    Identity mallory = identity_from_fill(0x66);

    Envelope envelope = seal_hello();
    envelope.payload_type = "text/html";
    envelope.sender_public_key = mallory.public_key();
    envelope.signature = mallory.sign(envelope.signed_bytes());

    OpenedEnvelope opened = EnvelopeProtocol::open(bob_, envelope);
    EXPECT_EQ(opened.status, OpenStatus::DecryptionFailed);
    EXPECT_EQ(opened.from_public_key, mallory.public_key());
}

TEST_F(EnvelopeTest, WrongRecipientCannotDecrypt) {
    Identity carol = identity_from_fill(0xC0);
    Envelope envelope = seal_hello();

    OpenedEnvelope opened = EnvelopeProtocol::open(carol, envelope);
    EXPECT_EQ(opened.status, OpenStatus::DecryptionFailed);
    EXPECT_TRUE(opened.signature_valid);
    EXPECT_FALSE(opened.ok());
}

// ============================================================================
// Seal Validation Tests
// ============================================================================

TEST_F(EnvelopeTest, BadRecipientKeyLengthIsEncryptionError) {
    std::vector<uint8_t> short_key(31, 1);
    std::vector<uint8_t> good(32, 1);

    EXPECT_EQ(thrown_kind([&] { EnvelopeProtocol::seal(alice_, short_key, good, "t", bytes("x")); }),
              ErrorKind::EncryptionError);
    EXPECT_EQ(thrown_kind([&] { EnvelopeProtocol::seal(alice_, good, short_key, "t", bytes("x")); }),
              ErrorKind::EncryptionError);
}

TEST_F(EnvelopeTest, LowOrderRecipientKeyIsEncryptionError) {
    EncryptionPublicKey zero{};
    EXPECT_EQ(thrown_kind([&] {
        EnvelopeProtocol::seal(alice_, zero, bob_.public_key(), "t", bytes("x"));
    }), ErrorKind::EncryptionError);
}

TEST_F(EnvelopeTest, OversizedPayloadTypeIsEncryptionError) {
    std::string label(65, 'a');
    EXPECT_EQ(thrown_kind([&] {
        EnvelopeProtocol::seal(alice_, bob_.encryption_public_key(), bob_.public_key(), label, bytes("x"));
    }), ErrorKind::EncryptionError);
}

// ============================================================================
// JSON Tests
// ============================================================================

TEST_F(EnvelopeTest, JsonRoundTrip) {
    Envelope envelope = seal_hello();

    auto parsed = Envelope::from_json(envelope.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id(), envelope.id());
    EXPECT_EQ(parsed->ciphertext, envelope.ciphertext);

    EXPECT_EQ(EnvelopeProtocol::open(bob_, *parsed).payload_text(), "hello");
}

TEST_F(EnvelopeTest, JsonRejectsMalformedDocuments) {
    EXPECT_FALSE(Envelope::from_json("").has_value());
    EXPECT_FALSE(Envelope::from_json("{}").has_value());

    std::string json = seal_hello().to_json();
    std::string::size_type pos = json.find("\"signature\":\"");
    ASSERT_NE(pos, std::string::npos);
    json.insert(pos + 13, "zz");
    EXPECT_FALSE(Envelope::from_json(json).has_value());
}

TEST_F(EnvelopeTest, OpenedEnvelopeJson) {
    OpenedEnvelope opened = EnvelopeProtocol::open(bob_, seal_hello());
    std::string json = opened.to_json();

    EXPECT_NE(json.find("\"signatureValid\":true"), std::string::npos);
    EXPECT_NE(json.find(alice_.public_key_hex()), std::string::npos);
}

TEST_F(EnvelopeTest, OpenStatusNames) {
    EXPECT_STREQ(open_status_to_string(OpenStatus::Opened), "Opened");
    EXPECT_STREQ(open_status_to_string(OpenStatus::SignatureInvalid), "SignatureInvalid");
    EXPECT_STREQ(open_status_to_string(OpenStatus::DecryptionFailed), "DecryptionFailed");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
