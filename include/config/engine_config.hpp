#pragma once

#include "query/graph_context.hpp"
#include <string>

namespace tg {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Configuration for the knowledge graph engine and CLI
 */
struct EngineConfig {
    // Persistence
    std::string database_path = "threatgraph.db";  ///< SQLite file (":memory:" allowed)
    bool async_persistence = true;          ///< Mirror writes on a worker thread
    long load_node_limit = 0;               ///< Nodes read on load, 0 = unlimited
    long load_edge_limit = 0;               ///< Edges read on load, 0 = unlimited

    // Queries
    int default_depth = 2;                  ///< Subgraph depth when none is given
    int max_paths = 3;                      ///< Shortest paths returned per query

    // Context thresholds
    double density_normalizer = 10.0;       ///< connection_density = min(1, count / this)
    long trending_cve_min_exclusive = 2;    ///< CVE is trending above this many articles
    long active_campaign_min_exclusive = 1; ///< Actor is active above this many articles

    bool verbose = false;                   ///< Informational logging on stderr

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by TG_* environment variables
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Thresholds in the form the context extractor consumes
     */
    ContextThresholds context_thresholds() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Load configuration from a path, then .threatgraph.json in the
 *        working or parent directory, falling back to the environment
 */
EngineConfig load_config(const std::string& config_path = "");

} // namespace tg
