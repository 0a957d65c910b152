#include "query/subgraph_extractor.hpp"
#include <set>
#include <stdexcept>

namespace tg {

// ==========================================
// Visualization Records
// ==========================================

nlohmann::json VisNode::to_json() const {
    return {
        {"id", id},
        {"label", label},
        {"node_type", to_string(type)},
        {"size", size},
        {"properties", properties}
    };
}

nlohmann::json VisEdge::to_json() const {
    return {
        {"source", source},
        {"target", target},
        {"relationship", to_string(relationship)},
        {"weight", weight}
    };
}

nlohmann::json GraphVisualization::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    j["focus_node"] = focus_id;
    j["depth"] = depth;
    j["total_nodes"] = total_nodes;
    j["total_edges"] = total_edges;
    return j;
}

nlohmann::json GraphVisualization::to_vis_js_json() const {
    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back({
            {"id", node.id},
            {"label", node.label},
            {"group", to_string(node.type)},
            {"value", node.size},
            {"title", node.label}
        });
    }

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges) {
        edges_json.push_back({
            {"from", edge.source},
            {"to", edge.target},
            {"label", to_string(edge.relationship)},
            {"value", edge.weight}
        });
    }

    return {{"nodes", nodes_json}, {"edges", edges_json}};
}

// ==========================================
// SubgraphExtractor
// ==========================================

GraphVisualization SubgraphExtractor::extract(const std::string& focus_id, int depth) const {
    if (depth < kMinDepth || depth > kMaxDepth) {
        throw std::invalid_argument("Subgraph depth must be between 1 and 5, got " +
                                    std::to_string(depth));
    }

    GraphVisualization result;
    result.focus_id = focus_id;
    result.depth = depth;

    store_.read([&](const GraphIndex& graph) {
        if (!graph.has_node(focus_id)) {
            return;
        }

        std::set<std::string> closure = {focus_id};
        std::set<std::string> frontier = {focus_id};

        for (int round = 0; round < depth && !frontier.empty(); ++round) {
            std::set<std::string> next_frontier;

            for (const auto& node_id : frontier) {
                for (const auto& neighbor : graph.neighbors(node_id)) {
                    if (closure.insert(neighbor).second) {
                        next_frontier.insert(neighbor);
                    }
                }
            }

            // Only newly reached nodes can contribute new neighbors next round
            frontier = std::move(next_frontier);
        }

        for (const auto& node_id : closure) {
            const GraphNode* node = graph.get_node(node_id);
            if (!node) continue;

            VisNode vis;
            vis.id = node->id;
            vis.label = node->label;
            vis.type = node->type;
            vis.size = node_id == focus_id ? node->size * 2.0 : node->size;
            vis.properties = node->properties;
            result.nodes.push_back(std::move(vis));
        }

        for (const auto& edge : graph.get_edges_within(closure)) {
            VisEdge vis;
            vis.source = edge.source_id;
            vis.target = edge.target_id;
            vis.relationship = edge.relationship;
            vis.weight = edge.weight;
            result.edges.push_back(std::move(vis));
        }
    });

    result.total_nodes = result.nodes.size();
    result.total_edges = result.edges.size();
    return result;
}

} // namespace tg
