/**
 * @file epoch_ledger.cpp
 * @brief Implementation of the SQLite epoch ledger
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/epoch_ledger.hpp"
#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/utilities.hpp"
#include <sqlite3.h>

namespace gns {

namespace {
    std::vector<uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
        int size = sqlite3_column_bytes(stmt, column);
        if (data == nullptr || size <= 0) {
            return {};
        }
        return std::vector<uint8_t>(data, data + size);
    }

    bool exec(sqlite3* db, const char* sql) {
        char* error_msg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK) {
            if (error_msg) {
                utilities::log_error(std::string("Epoch ledger SQL error: ") + error_msg);
                sqlite3_free(error_msg);
            }
            return false;
        }
        return true;
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

EpochLedger::EpochLedger(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    // Open SQLite database
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw GnsError(ErrorKind::StorageError, "Failed to open epoch ledger database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    // Initialize database schema
    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw GnsError(ErrorKind::StorageError, "Failed to initialize epoch ledger schema");
    }
}

EpochLedger::~EpochLedger() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool EpochLedger::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* create_epochs_table = R"(
        CREATE TABLE IF NOT EXISTS epochs (
            public_key TEXT NOT NULL,
            sequence_number INTEGER NOT NULL,
            chain_root BLOB NOT NULL,
            epoch_signature BLOB NOT NULL,
            breadcrumb_count INTEGER NOT NULL,
            earliest_timestamp INTEGER NOT NULL,
            latest_timestamp INTEGER NOT NULL,
            stored_at INTEGER NOT NULL,
            PRIMARY KEY (public_key, sequence_number)
        );
    )";

    const char* create_breadcrumbs_table = R"(
        CREATE TABLE IF NOT EXISTS breadcrumbs (
            public_key TEXT NOT NULL,
            sequence_number INTEGER NOT NULL,
            position INTEGER NOT NULL,
            latitude REAL NOT NULL,
            longitude REAL NOT NULL,
            timestamp INTEGER NOT NULL,
            signature BLOB NOT NULL,
            PRIMARY KEY (public_key, sequence_number, position),
            FOREIGN KEY (public_key, sequence_number) REFERENCES epochs(public_key, sequence_number)
        );
        CREATE INDEX IF NOT EXISTS idx_breadcrumbs_timestamp ON breadcrumbs(public_key, timestamp);
    )";

    return exec(db, create_epochs_table) && exec(db, create_breadcrumbs_table);
}

// ============================================================================
// Storage
// ============================================================================

bool EpochLedger::store(const Epoch& epoch) {
    if (!TrajectoryEpochEngine::verify_chain(epoch)) {
        utilities::log_warn("Refusing to store epoch " + std::to_string(epoch.sequence_number) +
                            ": chain verification failed");
        return false;
    }
    if (epoch.sequence_number > config::MAX_SEQUENCE_NUMBER) {
        utilities::log_warn("Refusing to store epoch " + std::to_string(epoch.sequence_number) +
                            ": sequence number out of range");
        return false;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string key_hex = Crypto::bytes_to_hex(epoch.public_key);

    // Idempotent re-store of an identical epoch
    auto existing = load_epoch_locked(key_hex, epoch.sequence_number);
    if (existing) {
        return existing->epoch_signature == epoch.epoch_signature;
    }

    auto latest_sequence = latest_sequence_locked(key_hex);
    if (latest_sequence) {
        auto latest = load_epoch_locked(key_hex, *latest_sequence);
        if (!latest || !TrajectoryEpochEngine::verify_succession(*latest, epoch)) {
            utilities::log_warn("Refusing to store epoch " + std::to_string(epoch.sequence_number) +
                                " for " + utilities::short_key(key_hex) + ": does not extend chain");
            return false;
        }
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    if (!exec(db, "BEGIN TRANSACTION;")) {
        return false;
    }

    if (!insert_epoch_locked(key_hex, epoch)) {
        exec(db, "ROLLBACK;");
        return false;
    }

    return exec(db, "COMMIT;");
}

bool EpochLedger::insert_epoch_locked(const std::string& key_hex, const Epoch& epoch) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* epoch_sql = R"(
        INSERT INTO epochs
        (public_key, sequence_number, chain_root, epoch_signature,
         breadcrumb_count, earliest_timestamp, latest_timestamp, stored_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, epoch_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key_hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(epoch.sequence_number));
    sqlite3_bind_blob(stmt, 3, epoch.chain_root.data(), static_cast<int>(epoch.chain_root.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 4, epoch.epoch_signature.data(), static_cast<int>(epoch.epoch_signature.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(epoch.breadcrumbs.size()));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(epoch.earliest_timestamp()));
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(epoch.latest_timestamp()));
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(utilities::current_time_ms()));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return false;
    }

    const char* breadcrumb_sql = R"(
        INSERT INTO breadcrumbs
        (public_key, sequence_number, position, latitude, longitude, timestamp, signature)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )";

    if (sqlite3_prepare_v2(db, breadcrumb_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = true;
    for (size_t i = 0; i < epoch.breadcrumbs.size() && ok; ++i) {
        const auto& breadcrumb = epoch.breadcrumbs[i];

        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, key_hex.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(epoch.sequence_number));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(i));
        sqlite3_bind_double(stmt, 4, breadcrumb.latitude);
        sqlite3_bind_double(stmt, 5, breadcrumb.longitude);
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(breadcrumb.timestamp));
        sqlite3_bind_blob(stmt, 7, breadcrumb.signature.data(), static_cast<int>(breadcrumb.signature.size()), SQLITE_TRANSIENT);

        ok = sqlite3_step(stmt) == SQLITE_DONE;
    }

    sqlite3_finalize(stmt);
    return ok;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Epoch> EpochLedger::load_epoch_locked(const std::string& key_hex, uint64_t sequence_number) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    auto public_key = Crypto::hex_to_array<crypto_sign_PUBLICKEYBYTES>(key_hex);
    if (!public_key) {
        return std::nullopt;
    }

    const char* epoch_sql = R"(
        SELECT chain_root, epoch_signature
        FROM epochs
        WHERE public_key = ? AND sequence_number = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, epoch_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key_hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(sequence_number));

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    Epoch epoch;
    epoch.public_key = *public_key;
    epoch.sequence_number = sequence_number;

    auto root = column_blob(stmt, 0);
    epoch.epoch_signature = column_blob(stmt, 1);
    sqlite3_finalize(stmt);

    if (root.size() != epoch.chain_root.size()) {
        return std::nullopt;
    }
    std::copy(root.begin(), root.end(), epoch.chain_root.begin());

    const char* breadcrumb_sql = R"(
        SELECT latitude, longitude, timestamp, signature
        FROM breadcrumbs
        WHERE public_key = ? AND sequence_number = ?
        ORDER BY position ASC
    )";

    if (sqlite3_prepare_v2(db, breadcrumb_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key_hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(sequence_number));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Breadcrumb breadcrumb;
        breadcrumb.public_key = *public_key;
        breadcrumb.latitude = sqlite3_column_double(stmt, 0);
        breadcrumb.longitude = sqlite3_column_double(stmt, 1);
        breadcrumb.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        breadcrumb.signature = column_blob(stmt, 3);

        epoch.breadcrumbs.push_back(std::move(breadcrumb));
    }

    sqlite3_finalize(stmt);

    return epoch;
}

std::optional<uint64_t> EpochLedger::latest_sequence_locked(const std::string& key_hex) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT MAX(sequence_number) FROM epochs WHERE public_key = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key_hex.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<uint64_t> latest;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        latest = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return latest;
}

std::vector<uint64_t> EpochLedger::sequence_numbers_locked(const std::string& key_hex) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::vector<uint64_t> sequences;

    const char* sql = R"(
        SELECT sequence_number FROM epochs
        WHERE public_key = ?
        ORDER BY sequence_number ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sequences;
    }

    sqlite3_bind_text(stmt, 1, key_hex.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        sequences.push_back(static_cast<uint64_t>(sqlite3_column_int64(stmt, 0)));
    }

    sqlite3_finalize(stmt);
    return sequences;
}

std::optional<Epoch> EpochLedger::get_epoch(const PublicKey& public_key, uint64_t sequence_number) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return load_epoch_locked(Crypto::bytes_to_hex(public_key), sequence_number);
}

std::optional<Epoch> EpochLedger::get_latest_epoch(const PublicKey& public_key) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string key_hex = Crypto::bytes_to_hex(public_key);
    auto latest = latest_sequence_locked(key_hex);
    if (!latest) {
        return std::nullopt;
    }
    return load_epoch_locked(key_hex, *latest);
}

std::vector<Epoch> EpochLedger::get_history(const PublicKey& public_key) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string key_hex = Crypto::bytes_to_hex(public_key);
    std::vector<Epoch> history;

    for (uint64_t sequence : sequence_numbers_locked(key_hex)) {
        auto epoch = load_epoch_locked(key_hex, sequence);
        if (epoch) {
            history.push_back(std::move(*epoch));
        }
    }

    return history;
}

size_t EpochLedger::epoch_count(const PublicKey& public_key) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return sequence_numbers_locked(Crypto::bytes_to_hex(public_key)).size();
}

bool EpochLedger::verify_history(const PublicKey& public_key) const {
    std::vector<Epoch> history = get_history(public_key);

    for (size_t i = 0; i < history.size(); ++i) {
        if (!TrajectoryEpochEngine::verify_chain(history[i])) {
            return false;
        }
        if (i > 0 && !TrajectoryEpochEngine::verify_succession(history[i - 1], history[i])) {
            return false;
        }
    }

    return true;
}

EpochSummary EpochLedger::summarize(const PublicKey& public_key) const {
    return TrajectoryEpochEngine::summarize(public_key, get_history(public_key));
}

} // namespace gns
