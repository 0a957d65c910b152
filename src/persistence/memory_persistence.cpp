#include "persistence/memory_persistence.hpp"

namespace tg {

void MemoryPersistence::upsert_node(const GraphNode& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_[node.id] = node;
}

void MemoryPersistence::upsert_edge(const GraphEdge& edge) {
    std::lock_guard<std::mutex> lock(mutex_);
    edges_[edge.key()] = edge;
}

std::vector<GraphNode> MemoryPersistence::list_nodes_by_type(NodeType type, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<GraphNode> result;
    for (const auto& [id, node] : nodes_) {
        if (limit > 0 && result.size() >= limit) break;
        if (node.type == type) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<GraphNode> MemoryPersistence::list_all_nodes(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<GraphNode> result;
    for (const auto& [id, node] : nodes_) {
        if (limit > 0 && result.size() >= limit) break;
        result.push_back(node);
    }
    return result;
}

std::vector<GraphEdge> MemoryPersistence::list_all_edges(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<GraphEdge> result;
    for (const auto& [key, edge] : edges_) {
        if (limit > 0 && result.size() >= limit) break;
        result.push_back(edge);
    }
    return result;
}

void MemoryPersistence::delete_node(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = edges_.begin(); it != edges_.end();) {
        if (it->first.source_id == node_id || it->first.target_id == node_id) {
            it = edges_.erase(it);
        } else {
            ++it;
        }
    }
    nodes_.erase(node_id);
}

void MemoryPersistence::delete_edge(
    const std::string& source_id,
    const std::string& target_id,
    RelationshipType relationship
) {
    std::lock_guard<std::mutex> lock(mutex_);
    edges_.erase(EdgeKey{source_id, target_id, relationship});
}

size_t MemoryPersistence::count_nodes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

size_t MemoryPersistence::count_edges() {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_.size();
}

void MemoryPersistence::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.clear();
    edges_.clear();
}

} // namespace tg
