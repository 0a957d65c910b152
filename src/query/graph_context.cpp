#include "query/graph_context.hpp"
#include <algorithm>

namespace tg {

// ==========================================
// JSON Rendering
// ==========================================

nlohmann::json ArticleConnections::to_json() const {
    nlohmann::json conns = nlohmann::json::array();
    for (const auto& c : connections) {
        conns.push_back({
            {"article_id", c.article_id},
            {"label", c.label},
            {"relationship", to_string(c.relationship)}
        });
    }

    nlohmann::json ents = nlohmann::json::array();
    for (const auto& e : entities) {
        ents.push_back({
            {"entity_id", e.entity_id},
            {"type", to_string(e.type)},
            {"label", e.label}
        });
    }

    return {{"connections", conns}, {"entities", ents}};
}

nlohmann::json GraphContext::to_json() const {
    nlohmann::json j;
    j["has_graph_data"] = has_graph_data;
    j["connection_count"] = connection_count;
    j["connection_density"] = connection_density;
    j["related_cves"] = related_cves;
    j["related_threat_actors"] = related_threat_actors;

    j["related_articles"] = nlohmann::json::array();
    for (const auto& article : related_articles) {
        j["related_articles"].push_back({
            {"id", article.id},
            {"title", article.title},
            {"relationship", to_string(article.relationship)}
        });
    }

    j["threat_actor_history"] = nlohmann::json::array();
    for (const auto& actor : threat_actor_history) {
        j["threat_actor_history"].push_back({
            {"actor", actor.actor},
            {"article_count", actor.article_count},
            {"active_campaigns", actor.active_campaigns}
        });
    }

    j["cve_severity_context"] = nlohmann::json::array();
    for (const auto& cve : cve_severity_context) {
        j["cve_severity_context"].push_back({
            {"cve", cve.cve},
            {"article_count", cve.article_count},
            {"is_trending", cve.is_trending}
        });
    }

    return j;
}

// ==========================================
// GraphContextExtractor
// ==========================================

ArticleConnections GraphContextExtractor::get_article_connections(const std::string& article_id) const {
    return store_.read([&](const GraphIndex& graph) {
        return collect_connections(graph, article_id);
    });
}

GraphContext GraphContextExtractor::extract(const std::string& article_id) const {
    return store_.read([&](const GraphIndex& graph) {
        GraphContext context;
        if (!graph.has_node(article_id)) {
            return context;
        }

        context.has_graph_data = true;
        ArticleConnections connections = collect_connections(graph, article_id);

        for (const auto& entity : connections.entities) {
            if (entity.type == NodeType::Vulnerability) {
                size_t mentions = count_mentioning_articles(graph, entity.entity_id);
                context.related_cves.push_back(entity.label);
                context.cve_severity_context.push_back({
                    entity.label,
                    mentions,
                    mentions > thresholds_.trending_cve_min_exclusive
                });
            } else if (entity.type == NodeType::ThreatActor) {
                size_t mentions = count_mentioning_articles(graph, entity.entity_id);
                context.related_threat_actors.push_back(entity.label);
                context.threat_actor_history.push_back({
                    entity.label,
                    mentions,
                    mentions > thresholds_.active_campaign_min_exclusive
                });
            }
        }

        for (const auto& conn : connections.connections) {
            context.related_articles.push_back({conn.article_id, conn.label, conn.relationship});
        }

        context.connection_count = connections.entities.size() + connections.connections.size();
        context.connection_density = std::min(
            1.0,
            static_cast<double>(context.connection_count) / thresholds_.density_normalizer
        );

        return context;
    });
}

ArticleConnections GraphContextExtractor::collect_connections(
    const GraphIndex& graph,
    const std::string& article_id
) {
    ArticleConnections result;
    if (!graph.has_node(article_id)) {
        return result;
    }

    for (const auto& successor_id : graph.successors(article_id)) {
        const GraphNode* node = graph.get_node(successor_id);
        if (!node) continue;

        if (node->type == NodeType::Article) {
            // Several relationship types may join the pair; report the latest one
            auto edges = graph.edges_between(article_id, successor_id);
            auto latest = std::max_element(edges.begin(), edges.end(),
                [](const GraphEdge* a, const GraphEdge* b) { return a->timestamp < b->timestamp; });

            ArticleConnection conn;
            conn.article_id = successor_id;
            conn.label = node->label;
            if (latest != edges.end()) {
                conn.relationship = (*latest)->relationship;
            }
            result.connections.push_back(conn);
        } else {
            result.entities.push_back({successor_id, node->type, node->label});
        }
    }

    return result;
}

size_t GraphContextExtractor::count_mentioning_articles(
    const GraphIndex& graph,
    const std::string& entity_id
) {
    size_t count = 0;
    for (const auto& predecessor_id : graph.predecessors(entity_id)) {
        const GraphNode* node = graph.get_node(predecessor_id);
        if (node && node->type == NodeType::Article) {
            count++;
        }
    }
    return count;
}

} // namespace tg
