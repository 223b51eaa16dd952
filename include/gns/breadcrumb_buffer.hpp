/**
 * @file breadcrumb_buffer.hpp
 * @brief Bounded pending-breadcrumb queue owned by the caller
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Serializes writers for one identity so that published epochs keep a
 * monotonic trajectory. No timers or background threads: the caller
 * decides when to flush (typically once ready() reports the threshold).
 */

#pragma once

#include "gns/breadcrumb.hpp"
#include "gns/config.hpp"
#include "gns/epoch.hpp"
#include "gns/identity.hpp"
#include <mutex>
#include <optional>
#include <vector>

namespace gns {

/**
 * @brief BreadcrumbBuffer - single-writer pending queue for one identity
 *
 * Thread-safe.
 */
class BreadcrumbBuffer {
public:
    /**
     * @brief Construct buffer for an identity key
     * @param owner Public key every breadcrumb must carry
     * @param threshold Pending count at which ready() turns true
     * @param capacity Maximum pending breadcrumbs
     * @throws GnsError(ConfigError) if threshold is 0 or exceeds capacity
     */
    explicit BreadcrumbBuffer(
        const PublicKey& owner,
        size_t threshold = config::DEFAULT_EPOCH_THRESHOLD,
        size_t capacity = config::DEFAULT_PENDING_CAPACITY
    );

    /**
     * @brief Construct buffer with epochThreshold and pendingCapacity from configuration
     */
    BreadcrumbBuffer(const PublicKey& owner, const GnsConfig& config);

    ~BreadcrumbBuffer() = default;

    BreadcrumbBuffer(const BreadcrumbBuffer&) = delete;
    BreadcrumbBuffer& operator=(const BreadcrumbBuffer&) = delete;
    BreadcrumbBuffer(BreadcrumbBuffer&&) = delete;
    BreadcrumbBuffer& operator=(BreadcrumbBuffer&&) = delete;

    /**
     * @brief Queue an already-signed breadcrumb
     * @throws GnsError(IdentityMismatch) for foreign breadcrumbs
     * @throws GnsError(ChainIntegrityError) for invalid or out-of-order breadcrumbs
     * @throws GnsError(InvalidInput) when the buffer is full
     */
    void append(const Breadcrumb& breadcrumb);

    /**
     * @brief Create a breadcrumb now and queue it under the same lock
     */
    Breadcrumb record(const Identity& identity, double latitude, double longitude);

    /**
     * @brief Publish pending breadcrumbs as the next epoch
     *
     * Pending breadcrumbs are drained only if publishing succeeds.
     * @throws GnsError(InvalidInput) if nothing is pending
     * @throws GnsError(IdentityMismatch) if identity does not own the buffer
     */
    Epoch flush(const Identity& identity);

    /**
     * @brief Continue the sequence after a previously published epoch
     * @throws GnsError(IdentityMismatch) if the epoch belongs to another key
     */
    void resume_after(const Epoch& previous);

    /// Threshold reached
    bool ready() const;

    size_t size() const;
    bool empty() const;
    size_t threshold() const { return threshold_; }
    size_t capacity() const { return capacity_; }

    std::vector<Breadcrumb> pending() const;

    /// Sequence number of the last flushed epoch (0 if none)
    uint64_t last_sequence_number() const;

private:
    void append_locked(const Breadcrumb& breadcrumb);

    PublicKey owner_;
    size_t threshold_;
    size_t capacity_;

    std::vector<Breadcrumb> pending_;
    std::optional<Epoch> last_epoch_;

    /// Newest accepted timestamp (floor for the next breadcrumb)
    uint64_t latest_timestamp_ = 0;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;
};

} // namespace gns
