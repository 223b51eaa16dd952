/**
 * @file replay_cache.cpp
 * @brief Implementation of envelope replay detection
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/replay_cache.hpp"
#include "gns/utilities.hpp"

namespace gns {

EnvelopeReplayCache::EnvelopeReplayCache(std::chrono::seconds window)
    : window_(window)
{
    uint64_t seconds = window_.count() > 0 ? static_cast<uint64_t>(window_.count()) : 0;
    utilities::log_debug("Replay window " + utilities::format_duration(seconds));
}

bool EnvelopeReplayCache::check_and_record(const Envelope& envelope) {
    return check_and_record(envelope.id());
}

bool EnvelopeReplayCache::check_and_record(const std::string& envelope_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();

    auto it = seen_.find(envelope_id);
    if (it != seen_.end() && it->second >= now) {
        utilities::log_warn("Replayed envelope " + utilities::short_key(envelope_id));
        return false;
    }

    seen_[envelope_id] = now + window_;

    // Opportunistic cleanup
    if (seen_.size() % 100 == 0) {
        cleanup_expired_locked();
    }

    return true;
}

bool EnvelopeReplayCache::has_seen(const std::string& envelope_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = seen_.find(envelope_id);
    return it != seen_.end() && it->second >= std::chrono::system_clock::now();
}

size_t EnvelopeReplayCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

size_t EnvelopeReplayCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleanup_expired_locked();
}

size_t EnvelopeReplayCache::cleanup_expired_locked() {
    auto now = std::chrono::system_clock::now();
    size_t removed = 0;

    for (auto it = seen_.begin(); it != seen_.end(); ) {
        if (it->second < now) {
            it = seen_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

void EnvelopeReplayCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.clear();
}

} // namespace gns
