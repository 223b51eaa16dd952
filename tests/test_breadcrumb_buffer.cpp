/**
 * @file test_breadcrumb_buffer.cpp
 * @brief Unit tests for BreadcrumbBuffer
 *
 * Tests:
 * - Threshold and capacity limits
 * - Ownership and ordering checks on append
 * - Flushing into consecutive epochs
 * - Resuming after a stored epoch
 * - Concurrent recording
 */

#include <gtest/gtest.h>
#include "gns/breadcrumb_buffer.hpp"
#include "gns/crypto.hpp"
#include "test_helpers.hpp"
#include <thread>
#include <vector>

using namespace gns;
using gns::testing::thrown_kind;
using gns::testing::identity_from_fill;

// Test fixture for breadcrumb buffer tests
class BreadcrumbBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(Crypto::initialize());
    }

    Breadcrumb crumb(uint64_t timestamp) {
        return BreadcrumbEngine::create(identity_, 48.8566, 2.3522, timestamp);
    }

    Identity identity_ = identity_from_fill(0x88);
};

// ============================================================================
// Configuration Tests
// ============================================================================

TEST_F(BreadcrumbBufferTest, Defaults) {
    BreadcrumbBuffer buffer(identity_.public_key());

    EXPECT_EQ(buffer.threshold(), 100u);
    EXPECT_EQ(buffer.capacity(), 1000u);
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.ready());
    EXPECT_EQ(buffer.last_sequence_number(), 0u);
}

TEST_F(BreadcrumbBufferTest, InvalidLimitsAreConfigError) {
    EXPECT_EQ(thrown_kind([&] { BreadcrumbBuffer buffer(identity_.public_key(), 0, 10); }),
              ErrorKind::ConfigError);
    EXPECT_EQ(thrown_kind([&] { BreadcrumbBuffer buffer(identity_.public_key(), 11, 10); }),
              ErrorKind::ConfigError);
}

TEST_F(BreadcrumbBufferTest, LimitsFromConfig) {
    GnsConfig cfg;
    cfg.epoch_threshold = 5;
    cfg.pending_capacity = 8;

    BreadcrumbBuffer buffer(identity_.public_key(), cfg);
    EXPECT_EQ(buffer.threshold(), 5u);
    EXPECT_EQ(buffer.capacity(), 8u);
}

// ============================================================================
// Append Tests
// ============================================================================

TEST_F(BreadcrumbBufferTest, ReadyAtThreshold) {
    BreadcrumbBuffer buffer(identity_.public_key(), 3, 10);

    buffer.append(crumb(1000));
    buffer.append(crumb(2000));
    EXPECT_FALSE(buffer.ready());

    buffer.append(crumb(3000));
    EXPECT_TRUE(buffer.ready());
    EXPECT_EQ(buffer.size(), 3u);
}

TEST_F(BreadcrumbBufferTest, CapacityIsEnforced) {
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 3);

    buffer.append(crumb(1000));
    buffer.append(crumb(2000));
    buffer.append(crumb(3000));

    EXPECT_EQ(thrown_kind([&] { buffer.append(crumb(4000)); }), ErrorKind::InvalidInput);
    EXPECT_EQ(buffer.size(), 3u);
}

TEST_F(BreadcrumbBufferTest, ForeignBreadcrumbIsIdentityMismatch) {
    Identity other = identity_from_fill(0x89);
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);

    EXPECT_EQ(thrown_kind([&] { buffer.append(BreadcrumbEngine::create(other, 0.0, 0.0, 1000)); }),
              ErrorKind::IdentityMismatch);
    EXPECT_EQ(thrown_kind([&] { buffer.record(other, 0.0, 0.0); }),
              ErrorKind::IdentityMismatch);
    EXPECT_TRUE(buffer.empty());
}

TEST_F(BreadcrumbBufferTest, ForgedBreadcrumbIsRejected) {
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);
    Breadcrumb forged = crumb(1000);
    forged.latitude = 1.0;

    EXPECT_EQ(thrown_kind([&] { buffer.append(forged); }), ErrorKind::ChainIntegrityError);
}

TEST_F(BreadcrumbBufferTest, OutOfOrderBreadcrumbIsRejected) {
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);
    buffer.append(crumb(5000));

    EXPECT_EQ(thrown_kind([&] { buffer.append(crumb(4000)); }), ErrorKind::ChainIntegrityError);

    // Equal timestamps are accepted
    buffer.append(crumb(5000));
    EXPECT_EQ(buffer.size(), 2u);
}

TEST_F(BreadcrumbBufferTest, RecordCreatesSignedBreadcrumb) {
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);

    Breadcrumb recorded = buffer.record(identity_, 51.5074, -0.1278);
    EXPECT_TRUE(BreadcrumbEngine::verify(recorded));

    auto pending = buffer.pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].signature, recorded.signature);

    EXPECT_EQ(thrown_kind([&] { buffer.record(identity_, 100.0, 0.0); }), ErrorKind::InvalidCoordinate);
}

// ============================================================================
// Flush Tests
// ============================================================================

TEST_F(BreadcrumbBufferTest, FlushEmptyIsInvalidInput) {
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);
    EXPECT_EQ(thrown_kind([&] { buffer.flush(identity_); }), ErrorKind::InvalidInput);
}

TEST_F(BreadcrumbBufferTest, FlushPublishesConsecutiveEpochs) {
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);

    buffer.append(crumb(1000));
    buffer.append(crumb(2000));
    Epoch first = buffer.flush(identity_);

    EXPECT_EQ(first.sequence_number, 1u);
    EXPECT_EQ(first.breadcrumbs.size(), 2u);
    EXPECT_TRUE(buffer.empty());
    EXPECT_TRUE(TrajectoryEpochEngine::verify_chain(first));

    buffer.append(crumb(3000));
    Epoch second = buffer.flush(identity_);

    EXPECT_EQ(second.sequence_number, 2u);
    EXPECT_EQ(buffer.last_sequence_number(), 2u);
    EXPECT_TRUE(TrajectoryEpochEngine::verify_succession(first, second));
}

TEST_F(BreadcrumbBufferTest, FlushKeepsOrder) {
    BreadcrumbBuffer buffer(identity_.public_key(), 3, 10);
    std::vector<Breadcrumb> crumbs = {crumb(1000), crumb(2000), crumb(3000)};
    for (const auto& b : crumbs) {
        buffer.append(b);
    }

    Epoch epoch = buffer.flush(identity_);
    EXPECT_EQ(epoch.chain_root, TrajectoryEpochEngine::compute_chain_root(crumbs));
}

TEST_F(BreadcrumbBufferTest, FlushByOtherIdentityKeepsPending) {
    Identity other = identity_from_fill(0x8A);
    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);
    buffer.append(crumb(1000));

    EXPECT_EQ(thrown_kind([&] { buffer.flush(other); }), ErrorKind::IdentityMismatch);
    EXPECT_EQ(buffer.size(), 1u);
}

TEST_F(BreadcrumbBufferTest, ResumeAfterStoredEpoch) {
    Epoch stored = TrajectoryEpochEngine::publish_epoch(identity_, {crumb(1000), crumb(9000)}, 4);

    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);
    buffer.resume_after(stored);
    EXPECT_EQ(buffer.last_sequence_number(), 5u);

    EXPECT_EQ(thrown_kind([&] { buffer.append(crumb(8000)); }), ErrorKind::ChainIntegrityError);

    buffer.append(crumb(10000));
    Epoch next = buffer.flush(identity_);
    EXPECT_EQ(next.sequence_number, 6u);
    EXPECT_TRUE(TrajectoryEpochEngine::verify_succession(stored, next));
}

TEST_F(BreadcrumbBufferTest, ResumeAfterForeignEpochIsIdentityMismatch) {
    Identity other = identity_from_fill(0x8B);
    Epoch foreign = TrajectoryEpochEngine::publish_epoch(
        other, {BreadcrumbEngine::create(other, 0.0, 0.0, 1000)}, 0);

    BreadcrumbBuffer buffer(identity_.public_key(), 2, 10);
    EXPECT_EQ(thrown_kind([&] { buffer.resume_after(foreign); }), ErrorKind::IdentityMismatch);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(BreadcrumbBufferTest, ConcurrentRecording) {
    BreadcrumbBuffer buffer(identity_.public_key(), 50, 200);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&buffer, this, t]() {
            for (int i = 0; i < 25; ++i) {
                buffer.record(identity_, 10.0 + t, 20.0 + i * 0.01);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(buffer.size(), 100u);
    EXPECT_TRUE(buffer.ready());

    Epoch epoch = buffer.flush(identity_);
    EXPECT_EQ(epoch.breadcrumbs.size(), 100u);
    EXPECT_TRUE(TrajectoryEpochEngine::verify_chain(epoch));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
