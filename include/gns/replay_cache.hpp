/**
 * @file replay_cache.hpp
 * @brief Detection of envelopes delivered more than once
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Envelopes are identified by hex(SHA-256(signature)). Opening is pure, so
 * duplicate suppression is a transport concern kept outside the protocol.
 */

#pragma once

#include "gns/config.hpp"
#include "gns/envelope.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace gns {

/**
 * @brief EnvelopeReplayCache - remembers envelope ids for a time window
 *
 * Thread-safe.
 */
class EnvelopeReplayCache {
public:
    /**
     * @brief Construct cache with configurable window
     * @param window How long an envelope id is remembered (default: 24h)
     */
    explicit EnvelopeReplayCache(
        std::chrono::seconds window = std::chrono::duration_cast<std::chrono::seconds>(config::REPLAY_WINDOW)
    );

    ~EnvelopeReplayCache() = default;

    EnvelopeReplayCache(const EnvelopeReplayCache&) = delete;
    EnvelopeReplayCache& operator=(const EnvelopeReplayCache&) = delete;
    EnvelopeReplayCache(EnvelopeReplayCache&&) = delete;
    EnvelopeReplayCache& operator=(EnvelopeReplayCache&&) = delete;

    /**
     * @brief Record envelope if new
     * @return true the first time an envelope is seen, false for a replay
     */
    bool check_and_record(const Envelope& envelope);

    /**
     * @brief Record an envelope id if new
     * @return true the first time an id is seen within the window
     */
    bool check_and_record(const std::string& envelope_id);

    /**
     * @brief Check without recording
     */
    bool has_seen(const std::string& envelope_id) const;

    std::chrono::seconds get_window() const { return window_; }

    size_t size() const;

    /**
     * @brief Remove expired entries
     * @return Number of entries removed
     */
    size_t cleanup_expired();

    void clear();

private:
    size_t cleanup_expired_locked();

    std::chrono::seconds window_;

    /// Envelope id to expiry
    std::map<std::string, std::chrono::system_clock::time_point> seen_;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;
};

} // namespace gns
