/**
 * @file handle.cpp
 * @brief Implementation of handle claims
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/handle.hpp"
#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/signature.hpp"
#include "gns/utilities.hpp"
#include "gns/wire.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace gns {

namespace {
    const char* const RESERVED_HANDLES[] = {
        "admin", "root", "system", "gns", "gcrumbs", "support",
        "help", "info", "contact", "null", "undefined", "localhost",
        "api", "www", "mail", "smtp", "ftp", "ssh"
    };
}

// ============================================================================
// HandleClaim
// ============================================================================

std::vector<uint8_t> HandleClaim::signed_bytes() const {
    std::vector<uint8_t> bytes;
    wire::append_string(bytes, config::HANDLE_CLAIM_CONTEXT);
    wire::append_length_prefixed(bytes, handle);
    wire::append_bytes(bytes, public_key);
    wire::append_u64_be(bytes, timestamp);
    return bytes;
}

std::string HandleClaim::to_json() const {
    try {
        json j;
        j["handle"] = handle;
        j["publicKey"] = Crypto::bytes_to_hex(public_key);
        j["timestamp"] = timestamp;
        j["signature"] = Crypto::bytes_to_hex(signature);

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<HandleClaim> HandleClaim::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        auto public_key = Crypto::hex_to_array<crypto_sign_PUBLICKEYBYTES>(
            j.at("publicKey").get<std::string>());
        auto signature = Crypto::hex_to_bytes(j.at("signature").get<std::string>());

        if (!public_key || !signature || signature->size() != config::ED25519_SIGNATURE_SIZE) {
            return std::nullopt;
        }

        HandleClaim claim;
        claim.handle = j.at("handle").get<std::string>();
        claim.public_key = *public_key;
        claim.timestamp = j.at("timestamp").get<uint64_t>();
        claim.signature = std::move(*signature);

        return claim;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Validation
// ============================================================================

std::string HandleClaims::normalize_handle(const std::string& handle) {
    std::string clean = utilities::trim_string(handle);
    if (utilities::starts_with(clean, "@")) {
        clean = clean.substr(1);
    }
    return utilities::to_lowercase(clean);
}

bool HandleClaims::is_reserved(const std::string& normalized) {
    return std::any_of(std::begin(RESERVED_HANDLES), std::end(RESERVED_HANDLES),
        [&normalized](const char* reserved) { return normalized == reserved; });
}

std::optional<std::string> HandleClaims::validation_error(const std::string& normalized) {
    if (normalized.empty()) {
        return std::string("Handle is empty");
    }
    if (normalized.length() < config::HANDLE_MIN_LENGTH) {
        return "Handle must be at least " + std::to_string(config::HANDLE_MIN_LENGTH) + " characters";
    }
    if (normalized.length() > config::HANDLE_MAX_LENGTH) {
        return "Handle must be at most " + std::to_string(config::HANDLE_MAX_LENGTH) + " characters";
    }

    for (char c : normalized) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!allowed) {
            return std::string("Handle may only contain a-z, 0-9 and underscore");
        }
    }

    if (is_reserved(normalized)) {
        return std::string("Handle is reserved");
    }

    return std::nullopt;
}

bool HandleClaims::is_valid_handle(const std::string& normalized) {
    return !validation_error(normalized).has_value();
}

// ============================================================================
// Claims
// ============================================================================

HandleClaim HandleClaims::create(const Identity& identity, const std::string& handle) {
    return create(identity, handle, utilities::current_time_ms());
}

HandleClaim HandleClaims::create(const Identity& identity, const std::string& handle, uint64_t timestamp) {
    std::string normalized = normalize_handle(handle);

    auto error = validation_error(normalized);
    if (error) {
        throw GnsError(ErrorKind::InvalidHandle, *error + ": '" + handle + "'");
    }

    HandleClaim claim;
    claim.handle = normalized;
    claim.public_key = identity.public_key();
    claim.timestamp = timestamp;
    claim.signature = identity.sign(claim.signed_bytes());

    return claim;
}

bool HandleClaims::verify(const HandleClaim& claim) {
    if (!is_valid_handle(claim.handle)) {
        return false;
    }
    return SignatureEngine::verify(claim.public_key, claim.signed_bytes(), claim.signature);
}

HandleClaim HandleClaims::claim(
    Identity& identity,
    const std::string& handle,
    HandleRegistry& registry,
    const TrustEvidence& evidence,
    const TrustPolicy& policy
) {
    HandleClaim claim = create(identity, handle);

    if (identity.handle() && *identity.handle() != claim.handle) {
        throw GnsError(ErrorKind::HandleUnavailable,
            "Identity already holds @" + *identity.handle());
    }

    TrustVerification verification = TrustScorer::check(evidence, TrustRequirements::for_handle_claim(), policy);
    if (!verification.is_verified) {
        throw GnsError(ErrorKind::InsufficientTrust,
            "Cannot claim @" + claim.handle + ": " + verification.failed_checks());
    }

    auto existing = registry.resolve(claim.handle);
    if (existing && existing->public_key != identity.public_key()) {
        throw GnsError(ErrorKind::HandleUnavailable, "@" + claim.handle + " is taken");
    }

    if (!registry.submit(claim)) {
        throw GnsError(ErrorKind::HandleUnavailable, "Registry rejected @" + claim.handle);
    }

    identity.set_handle(claim.handle);
    utilities::log_info("Claimed @" + claim.handle + " for " + utilities::short_key(identity.public_key_hex()));

    return claim;
}

} // namespace gns
