#include "graph/graph_index.hpp"
#include <algorithm>

namespace tg {

// ==========================================
// Node and Edge Management
// ==========================================

bool GraphIndex::upsert_node(const GraphNode& node) {
    auto it = nodes_.find(node.id);
    if (it == nodes_.end()) {
        nodes_[node.id] = node;
        type_counts_[node.type]++;
        return true;
    }

    if (it->second.type != node.type) {
        throw NodeTypeConflict(node.id, it->second.type, node.type);
    }

    it->second.label = node.label;
    it->second.properties = node.properties;
    it->second.size = node.size;
    it->second.color = node.color;
    return false;
}

bool GraphIndex::insert_node_if_absent(const GraphNode& node) {
    if (nodes_.find(node.id) != nodes_.end()) {
        return false;
    }
    nodes_[node.id] = node;
    type_counts_[node.type]++;
    return true;
}

bool GraphIndex::upsert_edge(const GraphEdge& edge) {
    if (!has_node(edge.source_id) || !has_node(edge.target_id)) {
        return false;
    }

    EdgeKey key = edge.key();
    auto it = edges_.find(key);
    if (it != edges_.end()) {
        it->second.weight = edge.weight;
        it->second.timestamp = edge.timestamp;
        it->second.properties = edge.properties;
        return true;
    }

    edges_[key] = edge;
    update_indices(key);
    return true;
}

bool GraphIndex::remove_edge(const EdgeKey& key) {
    auto it = edges_.find(key);
    if (it == edges_.end()) {
        return false;
    }

    remove_from_indices(key);
    edges_.erase(it);
    return true;
}

bool GraphIndex::remove_node(const std::string& node_id) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }

    // Collect first: removal mutates the adjacency sets being walked
    std::vector<EdgeKey> touching;
    auto out_it = outgoing_.find(node_id);
    if (out_it != outgoing_.end()) {
        touching.insert(touching.end(), out_it->second.begin(), out_it->second.end());
    }
    auto in_it = incoming_.find(node_id);
    if (in_it != incoming_.end()) {
        touching.insert(touching.end(), in_it->second.begin(), in_it->second.end());
    }

    for (const auto& key : touching) {
        remove_edge(key);
    }

    auto count_it = type_counts_.find(it->second.type);
    if (count_it != type_counts_.end() && count_it->second > 0) {
        count_it->second--;
    }

    nodes_.erase(it);
    outgoing_.erase(node_id);
    incoming_.erase(node_id);
    return true;
}

void GraphIndex::clear() {
    nodes_.clear();
    edges_.clear();
    outgoing_.clear();
    incoming_.clear();
    type_counts_.clear();
}

// ==========================================
// Lookups
// ==========================================

const GraphNode* GraphIndex::get_node(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const GraphEdge* GraphIndex::get_edge(const EdgeKey& key) const {
    auto it = edges_.find(key);
    return it != edges_.end() ? &it->second : nullptr;
}

bool GraphIndex::has_node(const std::string& node_id) const {
    return nodes_.find(node_id) != nodes_.end();
}

bool GraphIndex::has_edge(const EdgeKey& key) const {
    return edges_.find(key) != edges_.end();
}

std::set<std::string> GraphIndex::successors(const std::string& node_id) const {
    std::set<std::string> result;
    auto it = outgoing_.find(node_id);
    if (it != outgoing_.end()) {
        for (const auto& key : it->second) {
            result.insert(key.target_id);
        }
    }
    return result;
}

std::set<std::string> GraphIndex::predecessors(const std::string& node_id) const {
    std::set<std::string> result;
    auto it = incoming_.find(node_id);
    if (it != incoming_.end()) {
        for (const auto& key : it->second) {
            result.insert(key.source_id);
        }
    }
    return result;
}

std::set<std::string> GraphIndex::neighbors(const std::string& node_id) const {
    std::set<std::string> result = successors(node_id);
    auto preds = predecessors(node_id);
    result.insert(preds.begin(), preds.end());
    return result;
}

std::vector<const GraphEdge*> GraphIndex::edges_between(
    const std::string& source_id,
    const std::string& target_id
) const {
    std::vector<const GraphEdge*> result;

    auto it = outgoing_.find(source_id);
    if (it == outgoing_.end()) {
        return result;
    }

    for (const auto& key : it->second) {
        if (key.target_id == target_id) {
            result.push_back(&edges_.at(key));
        }
    }
    return result;
}

std::vector<GraphNode> GraphIndex::get_all_nodes() const {
    std::vector<GraphNode> result;
    result.reserve(nodes_.size());

    for (const auto& [id, node] : nodes_) {
        result.push_back(node);
    }

    return result;
}

std::vector<GraphEdge> GraphIndex::get_all_edges() const {
    std::vector<GraphEdge> result;
    result.reserve(edges_.size());

    for (const auto& [key, edge] : edges_) {
        result.push_back(edge);
    }

    return result;
}

std::vector<GraphNode> GraphIndex::get_nodes_by_type(NodeType type) const {
    std::vector<GraphNode> result;
    for (const auto& [id, node] : nodes_) {
        if (node.type == type) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<GraphEdge> GraphIndex::get_edges_within(const std::set<std::string>& node_ids) const {
    std::vector<GraphEdge> result;

    // Walk only the outgoing sets of member nodes instead of every edge
    for (const auto& node_id : node_ids) {
        auto it = outgoing_.find(node_id);
        if (it == outgoing_.end()) continue;

        for (const auto& key : it->second) {
            if (node_ids.find(key.target_id) != node_ids.end()) {
                result.push_back(edges_.at(key));
            }
        }
    }

    std::sort(result.begin(), result.end(),
              [](const GraphEdge& a, const GraphEdge& b) { return a.key() < b.key(); });
    return result;
}

// ==========================================
// Statistics and Export
// ==========================================

size_t GraphIndex::count_nodes_of_type(NodeType type) const {
    auto it = type_counts_.find(type);
    return it != type_counts_.end() ? it->second : 0;
}

GraphStatistics GraphIndex::compute_statistics() const {
    GraphStatistics stats;

    stats.total_nodes = nodes_.size();
    stats.total_edges = edges_.size();
    stats.article_nodes = count_nodes_of_type(NodeType::Article);
    stats.entity_nodes = stats.total_nodes - stats.article_nodes;

    for (const auto& [type, count] : type_counts_) {
        if (count > 0) {
            stats.nodes_by_type[type] = count;
        }
    }

    return stats;
}

nlohmann::json GraphIndex::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& [id, node] : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& [key, edge] : edges_) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    j["metadata"] = {
        {"num_nodes", nodes_.size()},
        {"num_edges", edges_.size()}
    };

    return j;
}

// ==========================================
// Helper Methods
// ==========================================

void GraphIndex::update_indices(const EdgeKey& key) {
    outgoing_[key.source_id].insert(key);
    incoming_[key.target_id].insert(key);
}

void GraphIndex::remove_from_indices(const EdgeKey& key) {
    auto out_it = outgoing_.find(key.source_id);
    if (out_it != outgoing_.end()) {
        out_it->second.erase(key);
    }

    auto in_it = incoming_.find(key.target_id);
    if (in_it != incoming_.end()) {
        in_it->second.erase(key);
    }
}

} // namespace tg
