/**
 * @file key_store.cpp
 * @brief Implementation of the file key store
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/key_store.hpp"
#include "gns/errors.hpp"
#include "gns/utilities.hpp"
#include <algorithm>

namespace gns {

namespace {
    const char* const KEY_EXTENSION = ".key";
}

FileKeyStore::FileKeyStore(const std::filesystem::path& directory)
    : directory_(directory)
{
    try {
        if (!std::filesystem::exists(directory_)) {
            std::filesystem::create_directories(directory_);
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        throw GnsError(ErrorKind::StorageError,
            "Cannot create key directory " + directory_.string() + ": " + ex.what());
    }
}

std::optional<std::filesystem::path> FileKeyStore::key_path(const std::string& public_key_hex) const {
    // Strict decoding doubles as path traversal protection
    std::string normalized = utilities::to_lowercase(public_key_hex);
    if (!Crypto::hex_to_array<crypto_sign_PUBLICKEYBYTES>(normalized)) {
        return std::nullopt;
    }
    return directory_ / (normalized + KEY_EXTENSION);
}

bool FileKeyStore::save(const Identity& identity) {
    auto path = key_path(identity.public_key_hex());
    if (!path) {
        return false;
    }

    SigningSeed seed = identity.private_key_seed();
    std::vector<uint8_t> content(seed.begin(), seed.end());
    Crypto::secure_zero(seed.data(), seed.size());

    bool ok = utilities::write_file_binary(path->string(), content, true);
    Crypto::secure_zero(content.data(), content.size());

    if (ok) {
        utilities::log_info("Saved key for " + utilities::short_key(identity.public_key_hex()));
    }
    return ok;
}

std::optional<Identity> FileKeyStore::load(const std::string& public_key_hex) {
    auto path = key_path(public_key_hex);
    if (!path || !std::filesystem::exists(*path)) {
        return std::nullopt;
    }

    auto content = utilities::read_file_binary(path->string());
    if (!content) {
        return std::nullopt;
    }

    try {
        Identity identity = Identity::restore(*content);
        Crypto::secure_zero(content->data(), content->size());

        // A seed stored under the wrong name is treated as corrupt
        if (identity.public_key_hex() != utilities::to_lowercase(public_key_hex)) {
            utilities::log_error("Key file " + path->filename().string() + " does not match its name");
            return std::nullopt;
        }

        return std::optional<Identity>(std::move(identity));
    } catch (const GnsError& ex) {
        Crypto::secure_zero(content->data(), content->size());
        utilities::log_error("Key file " + path->filename().string() + " is unreadable: " + ex.what());
        return std::nullopt;
    }
}

bool FileKeyStore::remove(const std::string& public_key_hex) {
    auto path = key_path(public_key_hex);
    if (!path) {
        return false;
    }

    try {
        return std::filesystem::remove(*path);
    } catch (const std::filesystem::filesystem_error& ex) {
        utilities::log_error("Failed to remove key file: " + std::string(ex.what()));
        return false;
    }
}

std::vector<std::string> FileKeyStore::list() const {
    std::vector<std::string> keys;

    try {
        for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
            if (!entry.is_regular_file() || entry.path().extension() != KEY_EXTENSION) {
                continue;
            }
            std::string stem = entry.path().stem().string();
            if (Crypto::hex_to_array<crypto_sign_PUBLICKEYBYTES>(stem)) {
                keys.push_back(stem);
            }
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        utilities::log_error("Failed to list key directory: " + std::string(ex.what()));
    }

    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace gns
