/**
 * @file epoch_ledger.hpp
 * @brief SQLite persistence of published epochs
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Local record of the epochs an identity has published (or received from
 * peers). Only self-verifying epochs that extend the stored chain are kept.
 */

#pragma once

#include "gns/crypto.hpp"
#include "gns/epoch.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief EpochLedger - per-identity epoch chains in SQLite
 *
 * Thread-safe for concurrent access
 */
class EpochLedger {
public:
    /**
     * @brief Open (or create) the ledger database
     * @param database_path Path to SQLite database file (":memory:" for tests)
     * @throws GnsError(StorageError) if the database cannot be opened or initialized
     */
    explicit EpochLedger(const std::string& database_path);

    /**
     * @brief Destructor - closes database
     */
    ~EpochLedger();

    // Disable copy and move
    EpochLedger(const EpochLedger&) = delete;
    EpochLedger& operator=(const EpochLedger&) = delete;
    EpochLedger(EpochLedger&&) = delete;
    EpochLedger& operator=(EpochLedger&&) = delete;

    /**
     * @brief Store an epoch
     *
     * The epoch must pass verify_chain and, when earlier epochs exist for
     * its key, verify_succession against the latest one. Storing an epoch
     * identical to one already stored succeeds without change.
     *
     * @return true if stored (or already present), false otherwise
     */
    bool store(const Epoch& epoch);

    /**
     * @brief Get epoch by key and sequence number
     */
    std::optional<Epoch> get_epoch(const PublicKey& public_key, uint64_t sequence_number) const;

    /**
     * @brief Get the epoch with the highest sequence number for a key
     */
    std::optional<Epoch> get_latest_epoch(const PublicKey& public_key) const;

    /**
     * @brief All epochs for a key in ascending sequence order
     */
    std::vector<Epoch> get_history(const PublicKey& public_key) const;

    /**
     * @brief Number of stored epochs for a key
     */
    size_t epoch_count(const PublicKey& public_key) const;

    /**
     * @brief Re-verify every stored epoch and each succession
     * @return true if the stored chain is intact (an empty chain is intact)
     */
    bool verify_history(const PublicKey& public_key) const;

    /**
     * @brief Evidence summary of the stored chain
     */
    EpochSummary summarize(const PublicKey& public_key) const;

private:
    /// Path to SQLite database
    std::string database_path_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    bool initialize_database();

    std::optional<Epoch> load_epoch_locked(const std::string& key_hex, uint64_t sequence_number) const;
    std::optional<uint64_t> latest_sequence_locked(const std::string& key_hex) const;
    std::vector<uint64_t> sequence_numbers_locked(const std::string& key_hex) const;
    bool insert_epoch_locked(const std::string& key_hex, const Epoch& epoch);
};

} // namespace gns
