/**
 * @file test_identity.cpp
 * @brief Unit tests for Identity
 *
 * Tests:
 * - Generation and deterministic restore
 * - Seed length and hex validation
 * - Export/import round trip and consistency checks
 * - Move semantics
 */

#include <gtest/gtest.h>
#include "gns/identity.hpp"
#include "gns/crypto.hpp"
#include "test_helpers.hpp"
#include <string>
#include <vector>

using namespace gns;
using gns::testing::thrown_kind;
using gns::testing::identity_from_fill;

// Test fixture for Identity tests
class IdentityTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(Crypto::initialize());
    }
};

// ============================================================================
// Generation Tests
// ============================================================================

TEST_F(IdentityTest, GenerateProducesDistinctIdentities) {
    Identity a = Identity::generate();
    Identity b = Identity::generate();

    EXPECT_NE(a.public_key(), b.public_key());
    EXPECT_NE(a.encryption_public_key(), b.encryption_public_key());
}

TEST_F(IdentityTest, GenerateSetsCreationTime) {
    Identity identity = Identity::generate();
    EXPECT_GT(identity.created_at(), 0u);
    EXPECT_FALSE(identity.handle().has_value());
}

TEST_F(IdentityTest, HexFormsAreLowercase64Chars) {
    Identity identity = Identity::generate();

    std::string pk = identity.public_key_hex();
    std::string enc = identity.encryption_public_key_hex();

    EXPECT_EQ(pk.size(), 64u);
    EXPECT_EQ(enc.size(), 64u);
    EXPECT_EQ(pk.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(pk, enc);
}

// ============================================================================
// Restore Tests
// ============================================================================

TEST_F(IdentityTest, RestoreIsDeterministic) {
    Identity a = identity_from_fill(0x42);
    Identity b = identity_from_fill(0x42);

    EXPECT_EQ(a.public_key(), b.public_key());
    EXPECT_EQ(a.encryption_public_key(), b.encryption_public_key());
}

TEST_F(IdentityTest, RestoreKeepsExplicitCreationTime) {
    Identity identity = identity_from_fill(1, 1700000000000ULL);
    EXPECT_EQ(identity.created_at(), 1700000000000ULL);
}

TEST_F(IdentityTest, RestoreFromGeneratedSeed) {
    Identity original = Identity::generate();
    SigningSeed seed = original.private_key_seed();

    Identity restored = Identity::restore(std::vector<uint8_t>(seed.begin(), seed.end()));

    EXPECT_EQ(restored.public_key(), original.public_key());
    EXPECT_EQ(restored.encryption_public_key(), original.encryption_public_key());
}

TEST_F(IdentityTest, RestoreRejectsWrongSeedLength) {
    EXPECT_EQ(thrown_kind([] { Identity::restore(std::vector<uint8_t>(31, 1)); }),
              ErrorKind::InvalidKeyFormat);
    EXPECT_EQ(thrown_kind([] { Identity::restore(std::vector<uint8_t>(64, 1)); }),
              ErrorKind::InvalidKeyFormat);
    EXPECT_EQ(thrown_kind([] { Identity::restore({}); }),
              ErrorKind::InvalidKeyFormat);
}

TEST_F(IdentityTest, FromPrivateKeyHex) {
    Identity original = identity_from_fill(0x10);
    std::string hex = Crypto::bytes_to_hex(original.private_key_seed());

    Identity restored = Identity::from_private_key_hex(hex);
    EXPECT_EQ(restored.public_key(), original.public_key());
}

TEST_F(IdentityTest, FromPrivateKeyHexRejectsGarbage) {
    EXPECT_EQ(thrown_kind([] { Identity::from_private_key_hex("not hex"); }),
              ErrorKind::InvalidKeyFormat);
    EXPECT_EQ(thrown_kind([] { Identity::from_private_key_hex("abcd"); }),
              ErrorKind::InvalidKeyFormat);
}

// ============================================================================
// Signing Tests
// ============================================================================

TEST_F(IdentityTest, SignVerifiesUnderPublicKey) {
    Identity identity = Identity::generate();
    std::vector<uint8_t> message = {'g', 'n', 's'};

    auto signature = identity.sign(message);
    ASSERT_EQ(signature.size(), 64u);
    EXPECT_TRUE(Crypto::verify_signature(message, signature, identity.public_key()));
}

TEST_F(IdentityTest, KeyExchangeIsSymmetric) {
    Identity alice = identity_from_fill(0xA1);
    Identity bob = identity_from_fill(0xB0);

    auto ab = alice.key_exchange(bob.encryption_public_key());
    auto ba = bob.key_exchange(alice.encryption_public_key());

    ASSERT_TRUE(ab && ba);
    EXPECT_EQ(ab->key, ba->key);
}

// ============================================================================
// Export Tests
// ============================================================================

TEST_F(IdentityTest, ExportRoundTrip) {
    Identity original = Identity::generate();
    IdentityExport record = original.export_keys();

    EXPECT_EQ(record.public_key, original.public_key_hex());
    EXPECT_EQ(record.encryption_key, original.encryption_public_key_hex());
    EXPECT_EQ(record.private_key.size(), 64u);

    auto parsed = IdentityExport::from_json(record.to_json());
    ASSERT_TRUE(parsed.has_value());

    Identity restored = Identity::from_export(*parsed);
    EXPECT_EQ(restored.public_key(), original.public_key());
    EXPECT_EQ(restored.encryption_public_key(), original.encryption_public_key());
}

TEST_F(IdentityTest, ExportJsonUsesCamelCaseFields) {
    Identity identity = identity_from_fill(5);
    std::string json = identity.export_keys().to_json();

    EXPECT_NE(json.find("\"publicKey\""), std::string::npos);
    EXPECT_NE(json.find("\"privateKey\""), std::string::npos);
    EXPECT_NE(json.find("\"encryptionKey\""), std::string::npos);
}

TEST_F(IdentityTest, ExportWithoutEncryptionKeyIsAccepted) {
    Identity original = identity_from_fill(6);
    IdentityExport record = original.export_keys();
    record.encryption_key.clear();

    Identity restored = Identity::from_export(record);
    EXPECT_EQ(restored.encryption_public_key(), original.encryption_public_key());
}

TEST_F(IdentityTest, ExportMismatchIsRejected) {
    Identity a = identity_from_fill(7);
    Identity b = identity_from_fill(8);

    IdentityExport record = a.export_keys();
    record.public_key = b.public_key_hex();
    EXPECT_EQ(thrown_kind([&] { Identity::from_export(record); }), ErrorKind::InvalidKeyFormat);

    record = a.export_keys();
    record.encryption_key = b.encryption_public_key_hex();
    EXPECT_EQ(thrown_kind([&] { Identity::from_export(record); }), ErrorKind::InvalidKeyFormat);
}

TEST_F(IdentityTest, ExportFromJsonRejectsMalformedDocuments) {
    EXPECT_FALSE(IdentityExport::from_json("not json").has_value());
    EXPECT_FALSE(IdentityExport::from_json("{}").has_value());
    EXPECT_FALSE(IdentityExport::from_json(R"({"publicKey":"00","privateKey":"abcd"})").has_value());
}

// ============================================================================
// Ownership Tests
// ============================================================================

TEST_F(IdentityTest, MoveTransfersKeys) {
    Identity original = identity_from_fill(9);
    PublicKey expected = original.public_key();
    original.set_handle("alice");

    Identity moved(std::move(original));
    EXPECT_EQ(moved.public_key(), expected);
    ASSERT_TRUE(moved.handle().has_value());
    EXPECT_EQ(*moved.handle(), "alice");

    std::vector<uint8_t> message = {1, 2, 3};
    EXPECT_TRUE(Crypto::verify_signature(message, moved.sign(message), expected));
}

TEST_F(IdentityTest, MoveAssignmentReplacesKeys) {
    Identity a = identity_from_fill(10);
    Identity b = identity_from_fill(11);
    PublicKey b_key = b.public_key();

    a = std::move(b);
    EXPECT_EQ(a.public_key(), b_key);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
