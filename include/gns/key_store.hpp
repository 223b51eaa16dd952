/**
 * @file key_store.hpp
 * @brief Persistent storage of identity private keys
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Only the 32-byte signing seed is persisted; the encryption keys are
 * re-derived on load. Key bytes are never logged.
 */

#pragma once

#include "gns/identity.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief Key store collaborator contract
 */
class KeyStore {
public:
    virtual ~KeyStore() = default;

    /**
     * @brief Persist an identity's private key
     * @return true if successful, false otherwise
     */
    virtual bool save(const Identity& identity) = 0;

    /**
     * @brief Load the identity with the given public key
     * @return Identity, or std::nullopt if not stored or unreadable
     */
    virtual std::optional<Identity> load(const std::string& public_key_hex) = 0;

    /**
     * @brief Delete a stored key
     * @return true if a key was removed
     */
    virtual bool remove(const std::string& public_key_hex) = 0;
};

/**
 * @brief FileKeyStore - one owner-only seed file per identity
 *
 * Layout: <directory>/<publicKeyHex>.key (32 raw bytes, mode 0600)
 */
class FileKeyStore : public KeyStore {
public:
    /**
     * @brief Construct key store rooted at a directory (created if missing)
     * @throws GnsError(StorageError) if the directory cannot be created
     */
    explicit FileKeyStore(const std::filesystem::path& directory);

    bool save(const Identity& identity) override;
    std::optional<Identity> load(const std::string& public_key_hex) override;
    bool remove(const std::string& public_key_hex) override;

    /**
     * @brief Public keys (hex) of all stored identities
     */
    std::vector<std::string> list() const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    /**
     * @brief Key file path, or std::nullopt if the key text is not a public key
     */
    std::optional<std::filesystem::path> key_path(const std::string& public_key_hex) const;

    std::filesystem::path directory_;
};

} // namespace gns
