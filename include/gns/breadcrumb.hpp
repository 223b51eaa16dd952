/**
 * @file breadcrumb.hpp
 * @brief Signed location attestations
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Signed tuple (fixed):
 *   publicKey (32) || f64be(latitude) || f64be(longitude) || u64be(timestamp)
 */

#pragma once

#include "gns/crypto.hpp"
#include "gns/identity.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief A signed location-and-time attestation
 */
struct Breadcrumb {
    PublicKey public_key;
    double latitude = 0.0;
    double longitude = 0.0;
    uint64_t timestamp = 0;          ///< Unix milliseconds
    std::vector<uint8_t> signature;

    /**
     * @brief Canonical bytes covered by the signature
     */
    std::vector<uint8_t> signed_bytes() const;

    std::string to_json() const;
    static std::optional<Breadcrumb> from_json(const std::string& json);
};

/**
 * @brief BreadcrumbEngine - create and verify breadcrumbs
 */
class BreadcrumbEngine {
public:
    /**
     * @brief Create a breadcrumb stamped with the current time
     * @throws GnsError(InvalidCoordinate) for NaN or out-of-range coordinates
     */
    static Breadcrumb create(const Identity& identity, double latitude, double longitude);

    /**
     * @brief Create a breadcrumb with an explicit timestamp (Unix ms)
     * @throws GnsError(InvalidCoordinate) for NaN or out-of-range coordinates
     */
    static Breadcrumb create(const Identity& identity, double latitude, double longitude, uint64_t timestamp);

    /**
     * @brief Recompute the signed tuple and check the signature
     *
     * Never throws; malformed signatures or coordinates return false.
     */
    static bool verify(const Breadcrumb& breadcrumb);

    /**
     * @brief Check coordinate bounds (NaN is invalid)
     */
    static bool valid_coordinates(double latitude, double longitude);
};

} // namespace gns
