/**
 * @file breadcrumb_buffer.cpp
 * @brief Implementation of the pending-breadcrumb queue
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/breadcrumb_buffer.hpp"
#include "gns/errors.hpp"
#include "gns/utilities.hpp"
#include <algorithm>

namespace gns {

// ============================================================================
// Constructor
// ============================================================================

BreadcrumbBuffer::BreadcrumbBuffer(const PublicKey& owner, size_t threshold, size_t capacity)
    : owner_(owner)
    , threshold_(threshold)
    , capacity_(capacity)
{
    if (threshold_ == 0 || threshold_ > capacity_) {
        throw GnsError(ErrorKind::ConfigError,
            "Epoch threshold must be between 1 and capacity (" + std::to_string(capacity_) + ")");
    }
    pending_.reserve(threshold_);
}

BreadcrumbBuffer::BreadcrumbBuffer(const PublicKey& owner, const GnsConfig& config)
    : BreadcrumbBuffer(owner, config.epoch_threshold, config.pending_capacity)
{
}

// ============================================================================
// Queueing
// ============================================================================

void BreadcrumbBuffer::append(const Breadcrumb& breadcrumb) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(breadcrumb);
}

Breadcrumb BreadcrumbBuffer::record(const Identity& identity, double latitude, double longitude) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (identity.public_key() != owner_) {
        throw GnsError(ErrorKind::IdentityMismatch, "Identity does not own this buffer");
    }

    Breadcrumb breadcrumb = BreadcrumbEngine::create(identity, latitude, longitude);
    append_locked(breadcrumb);

    return breadcrumb;
}

void BreadcrumbBuffer::append_locked(const Breadcrumb& breadcrumb) {
    if (breadcrumb.public_key != owner_) {
        throw GnsError(ErrorKind::IdentityMismatch, "Breadcrumb belongs to another identity");
    }
    if (!BreadcrumbEngine::verify(breadcrumb)) {
        throw GnsError(ErrorKind::ChainIntegrityError, "Breadcrumb signature is invalid");
    }
    if (breadcrumb.timestamp < latest_timestamp_) {
        throw GnsError(ErrorKind::ChainIntegrityError,
            "Breadcrumb at " + utilities::format_timestamp(breadcrumb.timestamp) +
            " is older than " + utilities::format_timestamp(latest_timestamp_));
    }
    if (pending_.size() >= capacity_) {
        throw GnsError(ErrorKind::InvalidInput,
            "Pending buffer full (" + std::to_string(capacity_) + " breadcrumbs)");
    }

    pending_.push_back(breadcrumb);
    latest_timestamp_ = breadcrumb.timestamp;

    if (pending_.size() == threshold_) {
        utilities::log_debug("Pending breadcrumbs reached threshold " + std::to_string(threshold_));
    }
}

// ============================================================================
// Publishing
// ============================================================================

Epoch BreadcrumbBuffer::flush(const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (identity.public_key() != owner_) {
        throw GnsError(ErrorKind::IdentityMismatch, "Identity does not own this buffer");
    }
    if (pending_.empty()) {
        throw GnsError(ErrorKind::InvalidInput, "No pending breadcrumbs to publish");
    }

    Epoch epoch = last_epoch_
        ? TrajectoryEpochEngine::publish_next_epoch(identity, pending_, *last_epoch_)
        : TrajectoryEpochEngine::publish_epoch(identity, pending_, 0);

    last_epoch_ = epoch;
    pending_.clear();

    return epoch;
}

void BreadcrumbBuffer::resume_after(const Epoch& previous) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (previous.public_key != owner_) {
        throw GnsError(ErrorKind::IdentityMismatch, "Epoch belongs to another identity");
    }

    last_epoch_ = previous;
    latest_timestamp_ = std::max(latest_timestamp_, previous.latest_timestamp());
}

// ============================================================================
// Queries
// ============================================================================

bool BreadcrumbBuffer::ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size() >= threshold_;
}

size_t BreadcrumbBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool BreadcrumbBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty();
}

std::vector<Breadcrumb> BreadcrumbBuffer::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

uint64_t BreadcrumbBuffer::last_sequence_number() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_epoch_ ? last_epoch_->sequence_number : 0;
}

} // namespace gns
