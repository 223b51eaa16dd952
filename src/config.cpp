/**
 * @file config.cpp
 * @brief Implementation of GNS configuration
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 */

#include "gns/config.hpp"
#include "gns/errors.hpp"
#include "gns/utilities.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>

using json = nlohmann::json;

namespace gns {
namespace config {

namespace {
    std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
        if (!std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }
        return dir;
    }
}

std::filesystem::path get_data_directory() {
    // Check for environment variable GNS_DATA_DIR
    std::string env_data_dir = utilities::get_env("GNS_DATA_DIR");
    if (!env_data_dir.empty()) {
        return ensure_directory(env_data_dir);
    }

    std::string home = utilities::get_env("HOME");
    if (!home.empty()) {
        return ensure_directory(std::filesystem::path(home) / ".gns");
    }

    return ensure_directory(std::filesystem::current_path() / ".gns");
}

std::filesystem::path get_key_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "keys");
}

std::filesystem::path get_database_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "db");
}

} // namespace config

// ============================================================================
// GnsConfig
// ============================================================================

std::string GnsConfig::to_json() const {
    try {
        json j;
        j["dataDirectory"] = data_directory;
        j["logLevel"] = log_level;
        j["logFile"] = log_file;
        j["epochThreshold"] = epoch_threshold;
        j["pendingCapacity"] = pending_capacity;
        j["replayWindowSeconds"] = replay_window_seconds;
        j["trustWeights"] = trust_weights;

        return j.dump(2);
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<GnsConfig> GnsConfig::from_json(const std::string& json_str) {
    if (json_str.size() > config::MAX_JSON_SIZE) {
        return std::nullopt;
    }

    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        GnsConfig cfg;

        // Every field is optional; present fields must have the right type
        if (j.contains("dataDirectory")) {
            cfg.data_directory = j.at("dataDirectory").get<std::string>();
        }
        if (j.contains("logLevel")) {
            cfg.log_level = j.at("logLevel").get<std::string>();
        }
        if (j.contains("logFile")) {
            cfg.log_file = j.at("logFile").get<std::string>();
        }
        if (j.contains("epochThreshold")) {
            cfg.epoch_threshold = j.at("epochThreshold").get<size_t>();
        }
        if (j.contains("pendingCapacity")) {
            cfg.pending_capacity = j.at("pendingCapacity").get<size_t>();
        }
        if (j.contains("replayWindowSeconds")) {
            cfg.replay_window_seconds = j.at("replayWindowSeconds").get<uint64_t>();
        }
        if (j.contains("trustWeights")) {
            const auto& weights = j.at("trustWeights");
            if (!weights.is_object()) {
                return std::nullopt;
            }
            for (auto it = weights.begin(); it != weights.end(); ++it) {
                if (!it.value().is_number()) {
                    return std::nullopt;
                }
                cfg.trust_weights[it.key()] = it.value().get<double>();
            }
        }

        if (!utilities::parse_log_level(cfg.log_level)) {
            return std::nullopt;
        }
        if (cfg.epoch_threshold == 0 || cfg.pending_capacity < cfg.epoch_threshold) {
            return std::nullopt;
        }
        if (cfg.replay_window_seconds == 0) {
            return std::nullopt;
        }

        return cfg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

GnsConfig GnsConfig::load(const std::string& path) {
    auto content = utilities::read_file(path);
    if (!content) {
        throw GnsError(ErrorKind::ConfigError, "Cannot read configuration file: " + path);
    }

    auto cfg = from_json(*content);
    if (!cfg) {
        throw GnsError(ErrorKind::ConfigError, "Invalid configuration file: " + path);
    }

    std::string env_data_dir = utilities::get_env("GNS_DATA_DIR");
    if (!env_data_dir.empty()) {
        cfg->data_directory = env_data_dir;
    }

    return *cfg;
}

GnsConfig GnsConfig::from_environment() {
    GnsConfig cfg;
    cfg.data_directory = utilities::get_env("GNS_DATA_DIR");

    std::string level = utilities::get_env("GNS_LOG_LEVEL");
    if (!level.empty() && utilities::parse_log_level(level)) {
        cfg.log_level = level;
    }

    return cfg;
}

std::filesystem::path GnsConfig::resolved_data_directory() const {
    if (data_directory.empty()) {
        return config::get_data_directory();
    }

    std::filesystem::path dir(data_directory);
    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
    return dir;
}

void GnsConfig::apply_logging() const {
    auto level = utilities::parse_log_level(log_level);
    utilities::initialize_logging(log_file, level.value_or(utilities::LogLevel::INFO));
}

} // namespace gns
