/**
 * @file handle.hpp
 * @brief Human-readable handle claims bound to an identity key
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Handles are 3-20 characters of [a-z0-9_]. Global uniqueness is the
 * registry's job; this module validates, signs and verifies claims.
 *
 * Signed bytes: "gns-handle-claim-v1" || u32be(len) || handle || publicKey || u64be(timestamp)
 */

#pragma once

#include "gns/crypto.hpp"
#include "gns/identity.hpp"
#include "gns/trust_scorer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief Signed claim of a handle by a public key
 */
struct HandleClaim {
    std::string handle;
    PublicKey public_key;
    uint64_t timestamp = 0;     ///< Unix milliseconds
    std::vector<uint8_t> signature;

    std::vector<uint8_t> signed_bytes() const;

    std::string to_json() const;
    static std::optional<HandleClaim> from_json(const std::string& json);
};

/**
 * @brief Registry answer for a handle lookup
 */
struct HandleResolution {
    std::string handle;
    PublicKey public_key;
};

/**
 * @brief Handle registry collaborator (network service, local cache, ...)
 */
class HandleRegistry {
public:
    virtual ~HandleRegistry() = default;

    /**
     * @brief Submit a signed claim
     * @return true if the registry accepted the claim
     */
    virtual bool submit(const HandleClaim& claim) = 0;

    /**
     * @brief Look up the current owner of a handle
     */
    virtual std::optional<HandleResolution> resolve(const std::string& handle) = 0;
};

/**
 * @brief HandleClaims - validate, sign, verify and register handles
 */
class HandleClaims {
public:
    /**
     * @brief Trim, strip one leading '@', lowercase
     */
    static std::string normalize_handle(const std::string& handle);

    /**
     * @brief Why a normalized handle is unacceptable
     * @return Reason, or std::nullopt if the handle is valid
     */
    static std::optional<std::string> validation_error(const std::string& normalized);

    static bool is_valid_handle(const std::string& normalized);

    static bool is_reserved(const std::string& normalized);

    /**
     * @brief Create a signed claim stamped with the current time
     * @throws GnsError(InvalidHandle) if the handle fails the format rules
     */
    static HandleClaim create(const Identity& identity, const std::string& handle);

    static HandleClaim create(const Identity& identity, const std::string& handle, uint64_t timestamp);

    /**
     * @brief Check format rules and signature
     */
    static bool verify(const HandleClaim& claim);

    /**
     * @brief Claim a handle through a registry
     *
     * Requires TrustRequirements::for_handle_claim(). On success the handle
     * is recorded on the identity.
     *
     * @throws GnsError(InvalidHandle) for bad handles
     * @throws GnsError(InsufficientTrust) if evidence falls short
     * @throws GnsError(HandleUnavailable) if the identity already holds another
     *         handle, the handle belongs to another key, or the registry refuses
     */
    static HandleClaim claim(
        Identity& identity,
        const std::string& handle,
        HandleRegistry& registry,
        const TrustEvidence& evidence,
        const TrustPolicy& policy = TrustPolicy()
    );
};

} // namespace gns
