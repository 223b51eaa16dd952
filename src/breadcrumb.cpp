/**
 * @file breadcrumb.cpp
 * @brief Implementation of breadcrumb creation and verification
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/breadcrumb.hpp"
#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/signature.hpp"
#include "gns/utilities.hpp"
#include "gns/wire.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace gns {

// ============================================================================
// Breadcrumb
// ============================================================================

std::vector<uint8_t> Breadcrumb::signed_bytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(public_key.size() + 24);

    wire::append_bytes(bytes, public_key);
    wire::append_f64_be(bytes, latitude);
    wire::append_f64_be(bytes, longitude);
    wire::append_u64_be(bytes, timestamp);

    return bytes;
}

std::string Breadcrumb::to_json() const {
    try {
        json j;
        j["publicKey"] = Crypto::bytes_to_hex(public_key);
        j["latitude"] = latitude;
        j["longitude"] = longitude;
        j["timestamp"] = timestamp;
        j["signature"] = Crypto::bytes_to_hex(signature);

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<Breadcrumb> Breadcrumb::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        auto public_key = Crypto::hex_to_array<crypto_sign_PUBLICKEYBYTES>(
            j.at("publicKey").get<std::string>());
        auto signature = Crypto::hex_to_bytes(j.at("signature").get<std::string>());

        if (!public_key || !signature || signature->size() != config::ED25519_SIGNATURE_SIZE) {
            return std::nullopt;
        }

        Breadcrumb breadcrumb;
        breadcrumb.public_key = *public_key;
        breadcrumb.latitude = j.at("latitude").get<double>();
        breadcrumb.longitude = j.at("longitude").get<double>();
        breadcrumb.timestamp = j.at("timestamp").get<uint64_t>();
        breadcrumb.signature = std::move(*signature);

        return breadcrumb;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// BreadcrumbEngine
// ============================================================================

bool BreadcrumbEngine::valid_coordinates(double latitude, double longitude) {
    if (std::isnan(latitude) || std::isnan(longitude)) {
        return false;
    }
    return latitude >= config::MIN_LATITUDE && latitude <= config::MAX_LATITUDE &&
           longitude >= config::MIN_LONGITUDE && longitude <= config::MAX_LONGITUDE;
}

Breadcrumb BreadcrumbEngine::create(const Identity& identity, double latitude, double longitude) {
    return create(identity, latitude, longitude, utilities::current_time_ms());
}

Breadcrumb BreadcrumbEngine::create(
    const Identity& identity,
    double latitude,
    double longitude,
    uint64_t timestamp
) {
    if (!valid_coordinates(latitude, longitude)) {
        std::ostringstream oss;
        oss << "Coordinates out of range: (" << latitude << ", " << longitude << ")";
        throw GnsError(ErrorKind::InvalidCoordinate, oss.str());
    }

    Breadcrumb breadcrumb;
    breadcrumb.public_key = identity.public_key();
    breadcrumb.latitude = latitude;
    breadcrumb.longitude = longitude;
    breadcrumb.timestamp = timestamp;
    breadcrumb.signature = identity.sign(breadcrumb.signed_bytes());

    return breadcrumb;
}

bool BreadcrumbEngine::verify(const Breadcrumb& breadcrumb) {
    if (!valid_coordinates(breadcrumb.latitude, breadcrumb.longitude)) {
        return false;
    }
    return SignatureEngine::verify(breadcrumb.public_key, breadcrumb.signed_bytes(), breadcrumb.signature);
}

} // namespace gns
