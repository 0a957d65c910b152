#include "config/engine_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>
#include <vector>

using json = nlohmann::json;

namespace tg {

// ============================================================================
// EngineConfig Implementation
// ============================================================================

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    EngineConfig config;

    // Persistence config
    if (j.contains("database_path")) config.database_path = j["database_path"];
    if (j.contains("async_persistence")) config.async_persistence = j["async_persistence"];
    if (j.contains("load_node_limit")) config.load_node_limit = j["load_node_limit"];
    if (j.contains("load_edge_limit")) config.load_edge_limit = j["load_edge_limit"];

    // Query config
    if (j.contains("default_depth")) config.default_depth = j["default_depth"];
    if (j.contains("max_paths")) config.max_paths = j["max_paths"];

    // Context thresholds, nested under "context"
    if (j.contains("context")) {
        const auto& ctx = j["context"];
        if (ctx.contains("density_normalizer")) config.density_normalizer = ctx["density_normalizer"];
        if (ctx.contains("trending_cve_min_exclusive")) {
            config.trending_cve_min_exclusive = ctx["trending_cve_min_exclusive"];
        }
        if (ctx.contains("active_campaign_min_exclusive")) {
            config.active_campaign_min_exclusive = ctx["active_campaign_min_exclusive"];
        }
    }

    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

nlohmann::json EngineConfig::to_json() const {
    json j;

    j["database_path"] = database_path;
    j["async_persistence"] = async_persistence;
    j["load_node_limit"] = load_node_limit;
    j["load_edge_limit"] = load_edge_limit;

    j["default_depth"] = default_depth;
    j["max_paths"] = max_paths;

    j["context"] = {
        {"density_normalizer", density_normalizer},
        {"trending_cve_min_exclusive", trending_cve_min_exclusive},
        {"active_campaign_min_exclusive", active_campaign_min_exclusive}
    };

    j["verbose"] = verbose;
    return j;
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    const char* db_path = std::getenv("TG_DATABASE_PATH");
    if (db_path && *db_path) config.database_path = db_path;

    const char* verbose = std::getenv("TG_VERBOSE");
    if (verbose) {
        std::string value = verbose;
        config.verbose = (value == "1" || value == "true" || value == "TRUE" || value == "yes");
    }

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (database_path.empty()) {
        error_message = "database_path must not be empty";
        return false;
    }

    if (load_node_limit < 0 || load_edge_limit < 0) {
        error_message = "load limits must be >= 0";
        return false;
    }

    if (default_depth < 1 || default_depth > 5) {
        error_message = "default_depth must be between 1 and 5";
        return false;
    }

    if (max_paths < 1) {
        error_message = "max_paths must be >= 1";
        return false;
    }

    if (!(density_normalizer > 0.0)) {
        error_message = "context.density_normalizer must be > 0";
        return false;
    }

    if (trending_cve_min_exclusive < 0 || active_campaign_min_exclusive < 0) {
        error_message = "context thresholds must be >= 0";
        return false;
    }

    return true;
}

ContextThresholds EngineConfig::context_thresholds() const {
    ContextThresholds thresholds;
    thresholds.density_normalizer = density_normalizer;
    thresholds.trending_cve_min_exclusive = static_cast<size_t>(trending_cve_min_exclusive);
    thresholds.active_campaign_min_exclusive = static_cast<size_t>(active_campaign_min_exclusive);
    return thresholds;
}

// ============================================================================
// Utility Functions
// ============================================================================

EngineConfig load_config(const std::string& config_path) {
    // An explicitly named file must load; a broken one is an error, not a fallback
    if (!config_path.empty()) {
        return EngineConfig::from_json_file(config_path);
    }

    std::vector<std::string> paths_to_try = {
        ".threatgraph.json",
        "../.threatgraph.json"
    };

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) == 0) {
            try {
                return EngineConfig::from_json_file(path);
            } catch (const std::exception& e) {
                std::cerr << "Warning: ignoring config " << path << ": " << e.what() << std::endl;
            }
        }
    }

    return EngineConfig::from_environment();
}

} // namespace tg
