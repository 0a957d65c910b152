#pragma once

#include "graph/graph_store.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief Node as rendered for visualization
 */
struct VisNode {
    std::string id;
    std::string label;
    NodeType type = NodeType::Entity;
    double size = 1.0;                                 // Doubled for the focus node
    nlohmann::json properties = nlohmann::json::object();

    nlohmann::json to_json() const;
};

/**
 * @brief Edge as rendered for visualization
 */
struct VisEdge {
    std::string source;
    std::string target;
    RelationshipType relationship = RelationshipType::Mentions;
    double weight = 1.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Neighborhood of a focus node, ready for a graph widget
 *
 * An unknown focus node yields an empty visualization that still carries
 * the requested focus id.
 */
struct GraphVisualization {
    std::vector<VisNode> nodes;
    std::vector<VisEdge> edges;
    std::string focus_id;
    int depth = 2;
    size_t total_nodes = 0;
    size_t total_edges = 0;

    bool empty() const { return nodes.empty(); }

    nlohmann::json to_json() const;

    /**
     * @brief vis.js network format: nodes {id,label,group,value,title}, edges {from,to,label,value}
     */
    nlohmann::json to_vis_js_json() const;
};

/**
 * @brief Bounded-depth neighborhood extraction around a focus node
 *
 * Each round adds every predecessor and successor of the nodes collected
 * so far, so reachability ignores edge direction.
 */
class SubgraphExtractor {
public:
    static constexpr int kMinDepth = 1;
    static constexpr int kMaxDepth = 5;

    explicit SubgraphExtractor(const GraphStore& store) : store_(store) {}

    /**
     * @brief Collect the closure of depth expansion rounds around focus_id
     * @throws std::invalid_argument if depth is outside [1, 5]
     */
    GraphVisualization extract(const std::string& focus_id, int depth = 2) const;

private:
    const GraphStore& store_;
};

} // namespace tg
