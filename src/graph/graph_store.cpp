#include "graph/graph_store.hpp"
#include <fstream>
#include <iostream>

namespace tg {

GraphStore::GraphStore(std::shared_ptr<PersistenceMirror> mirror)
    : mirror_(std::move(mirror)) {}

// ==========================================
// Mutations
// ==========================================

bool GraphStore::upsert_node(const GraphNode& node) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    bool created = index_.upsert_node(node);

    // Submitted under the lock so the mirror sees mutations in graph order
    if (mirror_) {
        mirror_->mirror_node(node);
    }
    return created;
}

bool GraphStore::insert_node_if_absent(const GraphNode& node) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!index_.insert_node_if_absent(node)) {
        return false;
    }
    if (mirror_) {
        mirror_->mirror_node(node);
    }
    return true;
}

bool GraphStore::upsert_edge(
    const std::string& source_id,
    const std::string& target_id,
    RelationshipType relationship,
    double weight
) {
    GraphEdge edge;
    edge.source_id = source_id;
    edge.target_id = target_id;
    edge.relationship = relationship;
    edge.weight = weight;
    edge.timestamp = std::chrono::system_clock::now();
    return upsert_edge(edge);
}

bool GraphStore::upsert_edge(const GraphEdge& edge) {
    validate_weight(edge.weight);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!index_.upsert_edge(edge)) {
        std::cerr << "Warning: rejected edge " << edge.source_id << " -> " << edge.target_id
                  << " (" << to_string(edge.relationship) << "): unknown endpoint\n";
        return false;
    }

    if (mirror_) {
        mirror_->mirror_edge(edge);
    }
    return true;
}

bool GraphStore::delete_node(const std::string& node_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!index_.remove_node(node_id)) {
        return false;
    }
    if (mirror_) {
        mirror_->mirror_node_deletion(node_id);
    }
    return true;
}

bool GraphStore::delete_edge(
    const std::string& source_id,
    const std::string& target_id,
    RelationshipType relationship
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    EdgeKey key{source_id, target_id, relationship};
    if (!index_.remove_edge(key)) {
        return false;
    }
    if (mirror_) {
        mirror_->mirror_edge_deletion(key);
    }
    return true;
}

void GraphStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    index_.clear();
}

// ==========================================
// Persistence Lifecycle
// ==========================================

size_t GraphStore::load_from_persistence(const LoadOptions& options) {
    if (!mirror_) {
        return 0;
    }

    // Writes still queued must land before the snapshot is read back
    mirror_->flush();

    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    try {
        nodes = mirror_->adapter().list_all_nodes(options.node_limit);
        edges = mirror_->adapter().list_all_edges(options.edge_limit);
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to load graph from "
                  << mirror_->adapter().get_backend_name() << ": " << e.what() << "\n";
        clear();
        return 0;
    }

    GraphIndex loaded;
    size_t nodes_loaded = 0;
    for (const auto& node : nodes) {
        try {
            if (loaded.upsert_node(node)) {
                nodes_loaded++;
            }
        } catch (const NodeTypeConflict& e) {
            std::cerr << "Warning: skipping stored node: " << e.what() << "\n";
        }
    }

    size_t edges_skipped = 0;
    for (const auto& edge : edges) {
        if (!loaded.upsert_edge(edge)) {
            edges_skipped++;
        }
    }

    if (edges_skipped > 0) {
        std::cerr << "Warning: skipped " << edges_skipped
                  << " stored edges with missing endpoints\n";
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        index_ = std::move(loaded);
    }

    if (options.verbose) {
        std::cerr << "Loaded graph from " << mirror_->adapter().get_backend_name() << ": "
                  << nodes_loaded << " nodes, " << (edges.size() - edges_skipped)
                  << " edges\n";
    }

    return nodes_loaded;
}

size_t GraphStore::clear_and_rebuild(const LoadOptions& options) {
    clear();
    return load_from_persistence(options);
}

void GraphStore::flush_persistence() {
    if (mirror_) {
        mirror_->flush();
    }
}

// ==========================================
// Queries
// ==========================================

std::optional<GraphNode> GraphStore::get_node(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const GraphNode* node = index_.get_node(node_id);
    if (!node) {
        return std::nullopt;
    }
    return *node;
}

bool GraphStore::has_node(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.has_node(node_id);
}

std::vector<std::string> GraphStore::successors(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto result = index_.successors(node_id);
    return {result.begin(), result.end()};
}

std::vector<std::string> GraphStore::predecessors(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto result = index_.predecessors(node_id);
    return {result.begin(), result.end()};
}

std::vector<GraphNode> GraphStore::all_nodes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.get_all_nodes();
}

std::vector<GraphEdge> GraphStore::all_edges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.get_all_edges();
}

std::vector<GraphNode> GraphStore::nodes_by_type(NodeType type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.get_nodes_by_type(type);
}

size_t GraphStore::num_nodes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.num_nodes();
}

size_t GraphStore::num_edges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.num_edges();
}

GraphStatistics GraphStore::statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.compute_statistics();
}

nlohmann::json GraphStore::to_json() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.to_json();
}

void GraphStore::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    auto j = to_json();
    file << j.dump(2);
    file.close();
}

} // namespace tg
