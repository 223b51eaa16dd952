/**
 * @file epoch.hpp
 * @brief Hash-chained, signed batches of breadcrumbs (trajectory epochs)
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * chainRoot: h0 = 32 zero bytes, h(i) = SHA-256(h(i-1) || signature(i))
 * epochSignature: Ed25519 over chainRoot || u64be(sequenceNumber) || publicKey
 */

#pragma once

#include "gns/breadcrumb.hpp"
#include "gns/crypto.hpp"
#include "gns/identity.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief A published trajectory segment, immutable once signed
 */
struct Epoch {
    PublicKey public_key;
    std::vector<Breadcrumb> breadcrumbs;
    Digest chain_root;
    std::vector<uint8_t> epoch_signature;
    uint64_t sequence_number = 0;

    /**
     * @brief Canonical bytes covered by epoch_signature
     */
    std::vector<uint8_t> signed_bytes() const;

    /// Smallest breadcrumb timestamp (0 when empty)
    uint64_t earliest_timestamp() const;

    /// Largest breadcrumb timestamp (0 when empty)
    uint64_t latest_timestamp() const;

    std::string to_json() const;
    static std::optional<Epoch> from_json(const std::string& json);
};

/**
 * @brief Verified evidence extracted from a set of epochs
 */
struct EpochSummary {
    size_t verified_epochs = 0;
    size_t verified_breadcrumbs = 0;
    size_t rejected_epochs = 0;
    std::optional<uint64_t> latest_epoch_timestamp;   ///< Unix ms of newest verified breadcrumb
};

/**
 * @brief TrajectoryEpochEngine - publish and verify epochs
 *
 * Stateless. The pending breadcrumb buffer belongs to the caller; see
 * BreadcrumbBuffer for a ready-made one.
 */
class TrajectoryEpochEngine {
public:
    /**
     * @brief Left-fold SHA-256 over breadcrumb signatures, in order
     */
    static Digest compute_chain_root(const std::vector<Breadcrumb>& breadcrumbs);

    /**
     * @brief Seal breadcrumbs into a signed epoch
     *
     * Deterministic: identical inputs give a byte-identical epoch.
     *
     * @param identity Owner of every breadcrumb
     * @param breadcrumbs Pending breadcrumbs in the order they were recorded
     * @param previous_sequence_number Sequence number of the last published epoch (0 if none)
     * @throws GnsError(InvalidInput) if breadcrumbs is empty
     * @throws GnsError(IdentityMismatch) if a breadcrumb belongs to another key
     * @throws GnsError(ChainIntegrityError) if a breadcrumb signature is invalid
     */
    static Epoch publish_epoch(
        const Identity& identity,
        const std::vector<Breadcrumb>& breadcrumbs,
        uint64_t previous_sequence_number
    );

    /**
     * @brief Publish the epoch following previous, enforcing monotonic timestamps
     * @throws GnsError(ChainIntegrityError) if a breadcrumb predates previous
     */
    static Epoch publish_next_epoch(
        const Identity& identity,
        const std::vector<Breadcrumb>& breadcrumbs,
        const Epoch& previous
    );

    /**
     * @brief Full verification: breadcrumbs, chain root and epoch signature
     */
    static bool verify_chain(const Epoch& epoch);

    /**
     * @brief Check that next legitimately follows previous
     */
    static bool verify_succession(const Epoch& previous, const Epoch& next);

    /**
     * @brief Count verified evidence belonging to owner
     *
     * Each sequence number counts at most once. Epochs that fail verify_chain,
     * belong to another key or repeat a counted sequence number are rejected.
     */
    static EpochSummary summarize(const PublicKey& owner, const std::vector<Epoch>& epochs);
};

} // namespace gns
