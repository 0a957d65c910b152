#pragma once

#include "graph/graph_store.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief Fixed normalization constants for the context signals
 *
 * These have no derivation beyond being the values the forecasting side was
 * tuned against; they are configurable rather than computed.
 */
struct ContextThresholds {
    double density_normalizer = 10.0;                  // connection_density = min(1, count / this)
    size_t trending_cve_min_exclusive = 2;             // is_trending when mentions > this
    size_t active_campaign_min_exclusive = 1;          // active_campaigns when mentions > this
};

/**
 * @brief Article reached through an outgoing edge
 */
struct ArticleConnection {
    std::string article_id;
    std::string label;
    RelationshipType relationship = RelationshipType::RelatedTo;
};

/**
 * @brief Entity reached through an outgoing edge
 */
struct EntityConnection {
    std::string entity_id;
    NodeType type = NodeType::Entity;
    std::string label;
};

/**
 * @brief Everything an article points at, split into articles and entities
 */
struct ArticleConnections {
    std::vector<ArticleConnection> connections;
    std::vector<EntityConnection> entities;

    nlohmann::json to_json() const;
};

struct CveContext {
    std::string cve;
    size_t article_count = 0;
    bool is_trending = false;
};

struct ThreatActorContext {
    std::string actor;
    size_t article_count = 0;
    bool active_campaigns = false;
};

struct RelatedArticle {
    std::string id;
    std::string title;
    RelationshipType relationship = RelationshipType::RelatedTo;
};

/**
 * @brief Connectivity signals for one article, consumed as an opaque scoring input
 *
 * has_graph_data == false means "no signal" (article not in the graph);
 * every other field is then empty or zero.
 */
struct GraphContext {
    bool has_graph_data = false;
    size_t connection_count = 0;
    double connection_density = 0.0;
    std::vector<std::string> related_cves;
    std::vector<std::string> related_threat_actors;
    std::vector<RelatedArticle> related_articles;
    std::vector<ThreatActorContext> threat_actor_history;
    std::vector<CveContext> cve_severity_context;

    nlohmann::json to_json() const;
};

/**
 * @brief Derives GraphContext bundles from the in-memory graph
 */
class GraphContextExtractor {
public:
    explicit GraphContextExtractor(const GraphStore& store, ContextThresholds thresholds = {})
        : store_(store), thresholds_(thresholds) {}

    /**
     * @brief Successors of an article split into articles and entities
     */
    ArticleConnections get_article_connections(const std::string& article_id) const;

    /**
     * @brief Signal bundle for an article; has_graph_data is false when it is unknown
     */
    GraphContext extract(const std::string& article_id) const;

    const ContextThresholds& thresholds() const { return thresholds_; }

private:
    const GraphStore& store_;
    ContextThresholds thresholds_;

    static ArticleConnections collect_connections(const GraphIndex& graph, const std::string& article_id);
    static size_t count_mentioning_articles(const GraphIndex& graph, const std::string& entity_id);
};

} // namespace tg
