/**
 * @file epoch.cpp
 * @brief Implementation of trajectory epochs
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/epoch.hpp"
#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/signature.hpp"
#include "gns/utilities.hpp"
#include "gns/wire.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <set>

using json = nlohmann::json;

namespace gns {

// ============================================================================
// Epoch
// ============================================================================

std::vector<uint8_t> Epoch::signed_bytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(chain_root.size() + 8 + public_key.size());

    wire::append_bytes(bytes, chain_root);
    wire::append_u64_be(bytes, sequence_number);
    wire::append_bytes(bytes, public_key);

    return bytes;
}

uint64_t Epoch::earliest_timestamp() const {
    if (breadcrumbs.empty()) {
        return 0;
    }
    return std::min_element(breadcrumbs.begin(), breadcrumbs.end(),
        [](const Breadcrumb& a, const Breadcrumb& b) { return a.timestamp < b.timestamp; })->timestamp;
}

uint64_t Epoch::latest_timestamp() const {
    if (breadcrumbs.empty()) {
        return 0;
    }
    return std::max_element(breadcrumbs.begin(), breadcrumbs.end(),
        [](const Breadcrumb& a, const Breadcrumb& b) { return a.timestamp < b.timestamp; })->timestamp;
}

std::string Epoch::to_json() const {
    try {
        json j;
        j["publicKey"] = Crypto::bytes_to_hex(public_key);
        j["sequenceNumber"] = sequence_number;
        j["chainRoot"] = Crypto::bytes_to_hex(chain_root);
        j["epochSignature"] = Crypto::bytes_to_hex(epoch_signature);

        json crumbs = json::array();
        for (const auto& breadcrumb : breadcrumbs) {
            crumbs.push_back(json::parse(breadcrumb.to_json()));
        }
        j["breadcrumbs"] = crumbs;

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<Epoch> Epoch::from_json(const std::string& json_str) {
    if (json_str.size() > config::MAX_JSON_SIZE) {
        return std::nullopt;
    }

    try {
        json j = json::parse(json_str);

        auto public_key = Crypto::hex_to_array<crypto_sign_PUBLICKEYBYTES>(
            j.at("publicKey").get<std::string>());
        auto chain_root = Crypto::hex_to_array<crypto_hash_sha256_BYTES>(
            j.at("chainRoot").get<std::string>());
        auto signature = Crypto::hex_to_bytes(j.at("epochSignature").get<std::string>());

        if (!public_key || !chain_root || !signature ||
            signature->size() != config::ED25519_SIGNATURE_SIZE) {
            return std::nullopt;
        }

        const auto& crumbs = j.at("breadcrumbs");
        if (!crumbs.is_array()) {
            return std::nullopt;
        }

        Epoch epoch;
        epoch.public_key = *public_key;
        epoch.chain_root = *chain_root;
        epoch.epoch_signature = std::move(*signature);
        epoch.sequence_number = j.at("sequenceNumber").get<uint64_t>();

        for (const auto& item : crumbs) {
            auto breadcrumb = Breadcrumb::from_json(item.dump());
            if (!breadcrumb) {
                return std::nullopt;
            }
            epoch.breadcrumbs.push_back(std::move(*breadcrumb));
        }

        return epoch;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Publishing
// ============================================================================

Digest TrajectoryEpochEngine::compute_chain_root(const std::vector<Breadcrumb>& breadcrumbs) {
    Digest running{};

    std::vector<uint8_t> step;
    for (const auto& breadcrumb : breadcrumbs) {
        step.clear();
        wire::append_bytes(step, running);
        wire::append_bytes(step, breadcrumb.signature);
        running = Crypto::sha256(step);
    }

    return running;
}

Epoch TrajectoryEpochEngine::publish_epoch(
    const Identity& identity,
    const std::vector<Breadcrumb>& breadcrumbs,
    uint64_t previous_sequence_number
) {
    if (breadcrumbs.empty()) {
        throw GnsError(ErrorKind::InvalidInput, "Cannot publish an empty epoch");
    }
    if (previous_sequence_number >= config::MAX_SEQUENCE_NUMBER) {
        throw GnsError(ErrorKind::InvalidInput, "Sequence number exhausted");
    }

    for (size_t i = 0; i < breadcrumbs.size(); ++i) {
        const auto& breadcrumb = breadcrumbs[i];
        if (breadcrumb.public_key != identity.public_key()) {
            throw GnsError(ErrorKind::IdentityMismatch,
                "Breadcrumb " + std::to_string(i) + " belongs to " +
                utilities::short_key(Crypto::bytes_to_hex(breadcrumb.public_key)));
        }
        if (!BreadcrumbEngine::verify(breadcrumb)) {
            throw GnsError(ErrorKind::ChainIntegrityError,
                "Breadcrumb " + std::to_string(i) + " has an invalid signature");
        }
    }

    Epoch epoch;
    epoch.public_key = identity.public_key();
    epoch.breadcrumbs = breadcrumbs;
    epoch.chain_root = compute_chain_root(breadcrumbs);
    epoch.sequence_number = previous_sequence_number + 1;
    epoch.epoch_signature = identity.sign(epoch.signed_bytes());

    utilities::log_info("Published epoch " + std::to_string(epoch.sequence_number) +
                        " for " + utilities::short_key(identity.public_key_hex()) +
                        " with " + std::to_string(breadcrumbs.size()) + " breadcrumbs");

    return epoch;
}

Epoch TrajectoryEpochEngine::publish_next_epoch(
    const Identity& identity,
    const std::vector<Breadcrumb>& breadcrumbs,
    const Epoch& previous
) {
    if (previous.public_key != identity.public_key()) {
        throw GnsError(ErrorKind::IdentityMismatch, "Previous epoch belongs to another identity");
    }

    uint64_t floor = previous.latest_timestamp();
    for (const auto& breadcrumb : breadcrumbs) {
        if (breadcrumb.public_key == identity.public_key() && breadcrumb.timestamp < floor) {
            throw GnsError(ErrorKind::ChainIntegrityError,
                "Breadcrumb at " + utilities::format_timestamp(breadcrumb.timestamp) +
                " predates epoch " + std::to_string(previous.sequence_number));
        }
    }

    return publish_epoch(identity, breadcrumbs, previous.sequence_number);
}

// ============================================================================
// Verification
// ============================================================================

bool TrajectoryEpochEngine::verify_chain(const Epoch& epoch) {
    if (epoch.breadcrumbs.empty()) {
        return false;
    }

    // The root only means something if every input is authentic
    for (const auto& breadcrumb : epoch.breadcrumbs) {
        if (breadcrumb.public_key != epoch.public_key || !BreadcrumbEngine::verify(breadcrumb)) {
            return false;
        }
    }

    Digest recomputed = compute_chain_root(epoch.breadcrumbs);
    if (sodium_memcmp(recomputed.data(), epoch.chain_root.data(), recomputed.size()) != 0) {
        return false;
    }

    return SignatureEngine::verify(epoch.public_key, epoch.signed_bytes(), epoch.epoch_signature);
}

bool TrajectoryEpochEngine::verify_succession(const Epoch& previous, const Epoch& next) {
    if (previous.public_key != next.public_key) {
        return false;
    }
    if (next.sequence_number <= previous.sequence_number) {
        return false;
    }
    return next.earliest_timestamp() >= previous.latest_timestamp();
}

EpochSummary TrajectoryEpochEngine::summarize(const PublicKey& owner, const std::vector<Epoch>& epochs) {
    EpochSummary summary;
    std::set<uint64_t> counted;

    for (const auto& epoch : epochs) {
        if (epoch.public_key != owner || !verify_chain(epoch)) {
            summary.rejected_epochs++;
            continue;
        }
        if (!counted.insert(epoch.sequence_number).second) {
            summary.rejected_epochs++;
            continue;
        }

        summary.verified_epochs++;
        summary.verified_breadcrumbs += epoch.breadcrumbs.size();

        uint64_t latest = epoch.latest_timestamp();
        if (!summary.latest_epoch_timestamp || latest > *summary.latest_epoch_timestamp) {
            summary.latest_epoch_timestamp = latest;
        }
    }

    return summary;
}

} // namespace gns
