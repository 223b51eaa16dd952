/**
 * @file trust_scorer.hpp
 * @brief Evidence-based trust scores and trust requirement checks
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Trust is a pure function of verified evidence. Each signal is normalized
 * into [0, 1] and multiplied by its policy weight:
 *
 *   score = clamp(round(sum(weight * normalized)), 0, 100)
 *
 * Weights are never negative, so adding evidence never lowers the score.
 */

#pragma once

#include "gns/config.hpp"
#include "gns/epoch.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gns {

/**
 * @brief Evidence signals combined by the scorer
 */
enum class TrustSignal {
    VerifiedBreadcrumbs,
    PublishedEpochs,
    EpochRecency,
    HandleClaimed,
    IdentityAge
};

const char* trust_signal_to_string(TrustSignal signal);
std::optional<TrustSignal> string_to_trust_signal(const std::string& name);

/**
 * @brief Ordered trust tiers
 */
enum class TrustTier {
    Seedling,       ///< 0-19: new identity, minimal trajectory
    Rooted,         ///< 20-39: building trajectory
    Established,    ///< 40-59: established presence
    Trusted,        ///< 60-79: trusted identity
    Verified        ///< 80-100: extensive verified trajectory
};

const char* trust_tier_to_string(TrustTier tier);

/**
 * @brief Points at which a signal reaches its full weight
 */
struct TrustSaturation {
    uint64_t breadcrumbs = 500;
    uint64_t epochs = 10;
    uint64_t recency_window_ms = 30 * config::MS_PER_DAY;
    uint64_t identity_age_ms = 90 * config::MS_PER_DAY;
};

/**
 * @brief Policy table {signal -> weight} plus saturation points
 */
class TrustPolicy {
public:
    /**
     * @brief Default policy: 30 / 25 / 15 / 10 / 20
     */
    TrustPolicy();

    /**
     * @brief Custom policy; signals missing from weights get weight 0
     * @throws GnsError(ConfigError) for negative or non-finite weights, or zero saturation
     */
    explicit TrustPolicy(const std::map<TrustSignal, double>& weights,
                         const TrustSaturation& saturation = TrustSaturation());

    /**
     * @brief Default policy with trustWeights overrides from configuration
     * @throws GnsError(ConfigError) for unknown signal names or invalid weights
     */
    static TrustPolicy from_config(const GnsConfig& config);

    double weight(TrustSignal signal) const;
    const std::map<TrustSignal, double>& weights() const { return weights_; }
    const TrustSaturation& saturation() const { return saturation_; }

    /**
     * @brief Tier for a score: Seedling 0, Rooted 20, Established 40, Trusted 60, Verified 80
     */
    static TrustTier tier_for_score(int score);

    /**
     * @brief Minimum score of a tier
     */
    static int tier_min_score(TrustTier tier);

private:
    std::map<TrustSignal, double> weights_;
    TrustSaturation saturation_;
};

/**
 * @brief Scorer input: counts of verified evidence
 */
struct TrustEvidence {
    uint64_t verified_breadcrumbs = 0;
    uint64_t published_epochs = 0;
    std::optional<uint64_t> latest_epoch_at;   ///< Unix ms, empty when no epoch exists
    bool handle_claimed = false;
    uint64_t identity_created_at = 0;           ///< Unix ms
    uint64_t now = 0;                           ///< Unix ms at evaluation

    uint64_t identity_age_ms() const;
    uint64_t identity_age_days() const;

    /**
     * @brief Adapt an epoch summary into scorer input
     */
    static TrustEvidence from_summary(const EpochSummary& summary,
                                      bool handle_claimed,
                                      uint64_t identity_created_at,
                                      uint64_t now);
};

/**
 * @brief Derived score; always recomputed, never stored as ground truth
 */
struct TrustScore {
    int score = 0;
    TrustTier tier = TrustTier::Seedling;
    std::map<TrustSignal, double> components;   ///< Weighted contribution per signal

    std::string to_json() const;
};

/**
 * @brief Thresholds an identity must meet for an operation
 */
struct TrustRequirements {
    int min_trust_score = 0;
    uint64_t min_breadcrumbs = 0;
    uint64_t min_account_age_days = 0;
    std::optional<TrustTier> required_tier;

    /// Basic messaging: nothing required
    static TrustRequirements none();

    /// Handle claims: 20 / 100 breadcrumbs / 7 days / Rooted
    static TrustRequirements for_handle_claim();

    /// Payments: 40 / 200 breadcrumbs / 14 days / Established
    static TrustRequirements for_payment();
};

/**
 * @brief One named requirement check
 */
struct TrustCheck {
    std::string name;
    bool passed = false;
    std::string required;
    std::string actual;
};

/**
 * @brief Outcome of checking evidence against requirements
 */
struct TrustVerification {
    bool is_verified = false;
    TrustScore trust_score;
    std::vector<TrustCheck> checks;

    /**
     * @brief Names of failed checks, comma separated (empty if verified)
     */
    std::string failed_checks() const;
};

/**
 * @brief TrustScorer - pure scoring functions
 */
class TrustScorer {
public:
    static TrustScore score(const TrustEvidence& evidence, const TrustPolicy& policy = TrustPolicy());

    static TrustVerification check(const TrustEvidence& evidence,
                                   const TrustRequirements& requirements,
                                   const TrustPolicy& policy = TrustPolicy());

    /**
     * @brief Normalized value in [0, 1] for one signal
     */
    static double normalize(TrustSignal signal, const TrustEvidence& evidence, const TrustSaturation& saturation);
};

} // namespace gns
