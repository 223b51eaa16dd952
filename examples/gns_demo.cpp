/**
 * @file gns_demo.cpp
 * @brief End-to-end walkthrough of the GNS core
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * Demonstrates:
 * - Loading configuration and logging setup
 * - Creating and persisting identities
 * - Sealing and opening an envelope, with replay detection
 * - Recording breadcrumbs and publishing epochs into a ledger
 * - Scoring trust and claiming a handle
 */

#include "gns/breadcrumb_buffer.hpp"
#include "gns/config.hpp"
#include "gns/crypto.hpp"
#include "gns/envelope.hpp"
#include "gns/epoch_ledger.hpp"
#include "gns/errors.hpp"
#include "gns/handle.hpp"
#include "gns/key_store.hpp"
#include "gns/replay_cache.hpp"
#include "gns/trust_scorer.hpp"
#include "gns/utilities.hpp"
#include <iostream>
#include <map>
#include <string>

using namespace gns;

namespace {
    // Registry kept in process memory for the demo
    class LocalRegistry : public HandleRegistry {
    public:
        bool submit(const HandleClaim& claim) override {
            if (!HandleClaims::verify(claim)) {
                return false;
            }
            auto it = claims_.find(claim.handle);
            if (it != claims_.end() && it->second.public_key != claim.public_key) {
                return false;
            }
            claims_[claim.handle] = claim;
            return true;
        }

        std::optional<HandleResolution> resolve(const std::string& handle) override {
            auto it = claims_.find(handle);
            if (it == claims_.end()) {
                return std::nullopt;
            }
            return HandleResolution{it->second.handle, it->second.public_key};
        }

    private:
        std::map<std::string, HandleClaim> claims_;
    };

    std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

int main(int argc, char** argv) {
    try {
        GnsConfig cfg = argc >= 2 ? GnsConfig::load(argv[1]) : GnsConfig::from_environment();
        cfg.apply_logging();

        if (!Crypto::initialize()) {
            std::cerr << "Error: libsodium initialization failed\n";
            return 1;
        }

        std::cout << "\n=== GNS Core Demo ===\n\n";

        auto data_dir = cfg.resolved_data_directory();
        std::cout << "Data directory: " << data_dir.string() << "\n\n";

        // Identities
        Identity alice = Identity::generate();
        Identity bob = Identity::generate();

        std::cout << "Alice: " << utilities::short_key(alice.public_key_hex()) << "\n";
        std::cout << "Bob:   " << utilities::short_key(bob.public_key_hex()) << "\n\n";

        FileKeyStore keys(config::get_key_directory(data_dir));
        if (!keys.save(alice)) {
            std::cerr << "Warning: could not persist Alice's key\n";
        }

        // Envelope
        Envelope envelope = EnvelopeProtocol::seal(
            alice, bob.encryption_public_key(), bob.public_key(), "text/plain", bytes("hello"));
        std::cout << "Sealed envelope " << utilities::short_key(envelope.id())
                  << " (" << envelope.ciphertext.size() << " ciphertext bytes)\n";

        EnvelopeReplayCache replay_cache(std::chrono::seconds(cfg.replay_window_seconds));
        if (replay_cache.check_and_record(envelope)) {
            OpenedEnvelope opened = EnvelopeProtocol::open_or_throw(bob, envelope);
            std::cout << "Bob opened: \"" << opened.payload_text() << "\" ["
                      << opened.payload_type << "]\n";
        }
        std::cout << "Replay accepted: " << (replay_cache.check_and_record(envelope) ? "yes" : "no") << "\n\n";

        // Trajectory
        BreadcrumbBuffer buffer(alice.public_key(), cfg);
        EpochLedger ledger((config::get_database_directory(data_dir) / "epochs.db").string());

        uint64_t start = utilities::current_time_ms();
        for (size_t i = 0; i < 2 * buffer.threshold(); ++i) {
            buffer.append(BreadcrumbEngine::create(
                alice, 37.7749 + i * 0.0001, -122.4194, start + i * 60000));

            if (buffer.ready()) {
                Epoch epoch = buffer.flush(alice);
                if (!ledger.store(epoch)) {
                    std::cerr << "Warning: ledger refused epoch " << epoch.sequence_number << "\n";
                }
                std::cout << "Published epoch " << epoch.sequence_number << " with "
                          << epoch.breadcrumbs.size() << " breadcrumbs, root "
                          << utilities::short_key(Crypto::bytes_to_hex(epoch.chain_root)) << "\n";
            }
        }
        std::cout << "Ledger history verifies: "
                  << (ledger.verify_history(alice.public_key()) ? "yes" : "no") << "\n\n";

        // Trust and handle
        TrustPolicy policy = TrustPolicy::from_config(cfg);
        TrustEvidence evidence = TrustEvidence::from_summary(
            ledger.summarize(alice.public_key()), false, alice.created_at(), utilities::current_time_ms());

        TrustScore score = TrustScorer::score(evidence, policy);
        std::cout << "Trust score: " << score.score << " (" << trust_tier_to_string(score.tier) << ")\n";

        LocalRegistry registry;
        try {
            HandleClaim claim = HandleClaims::claim(alice, "@alice", registry, evidence, policy);
            std::cout << "Claimed @" << claim.handle << "\n";
        } catch (const GnsError& e) {
            std::cout << "Handle claim refused: " << e.what() << "\n";
        }

        std::cout << "\nDone.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
