/**
 * @file trust_scorer.cpp
 * @brief Implementation of trust scoring
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/trust_scorer.hpp"
#include "gns/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace gns {

namespace {
    const TrustSignal ALL_SIGNALS[] = {
        TrustSignal::VerifiedBreadcrumbs,
        TrustSignal::PublishedEpochs,
        TrustSignal::EpochRecency,
        TrustSignal::HandleClaimed,
        TrustSignal::IdentityAge
    };

    double ratio(uint64_t value, uint64_t saturation) {
        return std::min(1.0, static_cast<double>(value) / static_cast<double>(saturation));
    }

    void validate_weight(TrustSignal signal, double weight) {
        if (!std::isfinite(weight) || weight < 0.0) {
            throw GnsError(ErrorKind::ConfigError,
                std::string("Invalid weight for ") + trust_signal_to_string(signal));
        }
    }
}

// ============================================================================
// String Conversion
// ============================================================================

const char* trust_signal_to_string(TrustSignal signal) {
    switch (signal) {
        case TrustSignal::VerifiedBreadcrumbs: return "VerifiedBreadcrumbs";
        case TrustSignal::PublishedEpochs:     return "PublishedEpochs";
        case TrustSignal::EpochRecency:        return "EpochRecency";
        case TrustSignal::HandleClaimed:       return "HandleClaimed";
        case TrustSignal::IdentityAge:         return "IdentityAge";
    }
    return "Unknown";
}

std::optional<TrustSignal> string_to_trust_signal(const std::string& name) {
    for (TrustSignal signal : ALL_SIGNALS) {
        if (name == trust_signal_to_string(signal)) {
            return signal;
        }
    }
    return std::nullopt;
}

const char* trust_tier_to_string(TrustTier tier) {
    switch (tier) {
        case TrustTier::Seedling:    return "Seedling";
        case TrustTier::Rooted:      return "Rooted";
        case TrustTier::Established: return "Established";
        case TrustTier::Trusted:     return "Trusted";
        case TrustTier::Verified:    return "Verified";
    }
    return "Unknown";
}

// ============================================================================
// TrustPolicy
// ============================================================================

TrustPolicy::TrustPolicy()
    : weights_{
          {TrustSignal::VerifiedBreadcrumbs, 30.0},
          {TrustSignal::PublishedEpochs, 25.0},
          {TrustSignal::EpochRecency, 15.0},
          {TrustSignal::HandleClaimed, 10.0},
          {TrustSignal::IdentityAge, 20.0}
      }
{
}

TrustPolicy::TrustPolicy(const std::map<TrustSignal, double>& weights, const TrustSaturation& saturation)
    : saturation_(saturation)
{
    for (TrustSignal signal : ALL_SIGNALS) {
        auto it = weights.find(signal);
        double weight = (it != weights.end()) ? it->second : 0.0;
        validate_weight(signal, weight);
        weights_[signal] = weight;
    }

    if (saturation_.breadcrumbs == 0 || saturation_.epochs == 0 ||
        saturation_.recency_window_ms == 0 || saturation_.identity_age_ms == 0) {
        throw GnsError(ErrorKind::ConfigError, "Trust saturation points must be positive");
    }
}

TrustPolicy TrustPolicy::from_config(const GnsConfig& config) {
    TrustPolicy defaults;
    std::map<TrustSignal, double> weights = defaults.weights();

    for (const auto& entry : config.trust_weights) {
        auto signal = string_to_trust_signal(entry.first);
        if (!signal) {
            throw GnsError(ErrorKind::ConfigError, "Unknown trust signal: " + entry.first);
        }
        weights[*signal] = entry.second;
    }

    return TrustPolicy(weights, defaults.saturation());
}

double TrustPolicy::weight(TrustSignal signal) const {
    auto it = weights_.find(signal);
    return (it != weights_.end()) ? it->second : 0.0;
}

TrustTier TrustPolicy::tier_for_score(int score) {
    if (score >= 80) return TrustTier::Verified;
    if (score >= 60) return TrustTier::Trusted;
    if (score >= 40) return TrustTier::Established;
    if (score >= 20) return TrustTier::Rooted;
    return TrustTier::Seedling;
}

int TrustPolicy::tier_min_score(TrustTier tier) {
    switch (tier) {
        case TrustTier::Seedling:    return 0;
        case TrustTier::Rooted:      return 20;
        case TrustTier::Established: return 40;
        case TrustTier::Trusted:     return 60;
        case TrustTier::Verified:    return 80;
    }
    return 0;
}

// ============================================================================
// TrustEvidence
// ============================================================================

uint64_t TrustEvidence::identity_age_ms() const {
    return (now > identity_created_at) ? now - identity_created_at : 0;
}

uint64_t TrustEvidence::identity_age_days() const {
    return identity_age_ms() / config::MS_PER_DAY;
}

TrustEvidence TrustEvidence::from_summary(
    const EpochSummary& summary,
    bool handle_claimed,
    uint64_t identity_created_at,
    uint64_t now
) {
    TrustEvidence evidence;
    evidence.verified_breadcrumbs = summary.verified_breadcrumbs;
    evidence.published_epochs = summary.verified_epochs;
    evidence.latest_epoch_at = summary.latest_epoch_timestamp;
    evidence.handle_claimed = handle_claimed;
    evidence.identity_created_at = identity_created_at;
    evidence.now = now;
    return evidence;
}

// ============================================================================
// TrustScore
// ============================================================================

std::string TrustScore::to_json() const {
    try {
        json j;
        j["score"] = score;
        j["tier"] = trust_tier_to_string(tier);

        json parts = json::object();
        for (const auto& entry : components) {
            parts[trust_signal_to_string(entry.first)] = entry.second;
        }
        j["components"] = parts;

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

// ============================================================================
// TrustRequirements
// ============================================================================

TrustRequirements TrustRequirements::none() {
    return TrustRequirements();
}

TrustRequirements TrustRequirements::for_handle_claim() {
    TrustRequirements requirements;
    requirements.min_trust_score = 20;
    requirements.min_breadcrumbs = 100;
    requirements.min_account_age_days = 7;
    requirements.required_tier = TrustTier::Rooted;
    return requirements;
}

TrustRequirements TrustRequirements::for_payment() {
    TrustRequirements requirements;
    requirements.min_trust_score = 40;
    requirements.min_breadcrumbs = 200;
    requirements.min_account_age_days = 14;
    requirements.required_tier = TrustTier::Established;
    return requirements;
}

std::string TrustVerification::failed_checks() const {
    std::string names;
    for (const auto& check : checks) {
        if (!check.passed) {
            if (!names.empty()) names += ", ";
            names += check.name;
        }
    }
    return names;
}

// ============================================================================
// TrustScorer
// ============================================================================

double TrustScorer::normalize(TrustSignal signal, const TrustEvidence& evidence, const TrustSaturation& saturation) {
    switch (signal) {
        case TrustSignal::VerifiedBreadcrumbs:
            return ratio(evidence.verified_breadcrumbs, saturation.breadcrumbs);

        case TrustSignal::PublishedEpochs:
            return ratio(evidence.published_epochs, saturation.epochs);

        case TrustSignal::EpochRecency: {
            if (evidence.published_epochs == 0 || !evidence.latest_epoch_at) {
                return 0.0;
            }
            uint64_t age = (evidence.now > *evidence.latest_epoch_at)
                ? evidence.now - *evidence.latest_epoch_at : 0;
            return std::max(0.0, 1.0 - ratio(age, saturation.recency_window_ms));
        }

        case TrustSignal::HandleClaimed:
            return evidence.handle_claimed ? 1.0 : 0.0;

        case TrustSignal::IdentityAge:
            return ratio(evidence.identity_age_ms(), saturation.identity_age_ms);
    }
    return 0.0;
}

TrustScore TrustScorer::score(const TrustEvidence& evidence, const TrustPolicy& policy) {
    TrustScore result;
    double total = 0.0;

    for (const auto& entry : policy.weights()) {
        double contribution = entry.second * normalize(entry.first, evidence, policy.saturation());
        result.components[entry.first] = contribution;
        total += contribution;
    }

    long rounded = std::lround(total);
    result.score = static_cast<int>(std::clamp(rounded, 0L, 100L));
    result.tier = TrustPolicy::tier_for_score(result.score);

    return result;
}

TrustVerification TrustScorer::check(
    const TrustEvidence& evidence,
    const TrustRequirements& requirements,
    const TrustPolicy& policy
) {
    TrustVerification verification;
    verification.trust_score = score(evidence, policy);
    verification.is_verified = true;

    auto add_check = [&verification](const std::string& name, bool passed,
                                     const std::string& required, const std::string& actual) {
        verification.checks.push_back(TrustCheck{name, passed, required, actual});
        if (!passed) {
            verification.is_verified = false;
        }
    };

    if (requirements.min_trust_score > 0) {
        add_check("Minimum Trust Score",
                  verification.trust_score.score >= requirements.min_trust_score,
                  std::to_string(requirements.min_trust_score),
                  std::to_string(verification.trust_score.score));
    }

    if (requirements.min_breadcrumbs > 0) {
        add_check("Minimum Breadcrumbs",
                  evidence.verified_breadcrumbs >= requirements.min_breadcrumbs,
                  std::to_string(requirements.min_breadcrumbs),
                  std::to_string(evidence.verified_breadcrumbs));
    }

    if (requirements.min_account_age_days > 0) {
        add_check("Account Age",
                  evidence.identity_age_days() >= requirements.min_account_age_days,
                  std::to_string(requirements.min_account_age_days) + " days",
                  std::to_string(evidence.identity_age_days()) + " days");
    }

    if (requirements.required_tier) {
        add_check("Trust Tier",
                  verification.trust_score.tier >= *requirements.required_tier,
                  trust_tier_to_string(*requirements.required_tier),
                  trust_tier_to_string(verification.trust_score.tier));
    }

    return verification;
}

} // namespace gns
