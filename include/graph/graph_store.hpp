#ifndef GRAPH_STORE_HPP
#define GRAPH_STORE_HPP

#include "graph/graph_index.hpp"
#include "persistence/persistence_mirror.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace tg {

/**
 * @brief Limits applied when reading the persisted graph back
 */
struct LoadOptions {
    size_t node_limit = 0;                             // 0 = unlimited
    size_t edge_limit = 0;                             // 0 = unlimited
    bool verbose = false;                              // Print a summary line
};

/**
 * @brief Authoritative in-memory knowledge graph, mirrored to persistence
 *
 * One writer at a time, any number of concurrent readers. Mutations update
 * the in-memory graph first and then hand a copy to the mirror, so storage
 * latency or failure never affects the in-memory result.
 *
 * Traversals that need several lookups run inside read() so that they see
 * one consistent graph.
 */
class GraphStore {
public:
    /**
     * @brief Store without persistence (tests, scratch graphs)
     */
    GraphStore() = default;

    /**
     * @param mirror Receives every mutation; may be null
     */
    explicit GraphStore(std::shared_ptr<PersistenceMirror> mirror);

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    // ==========================================
    // Mutations
    // ==========================================

    /**
     * @brief Insert or replace a node's label/properties/size by id
     * @return true if the node was newly created
     * @throws NodeTypeConflict if the id already exists with another type
     */
    bool upsert_node(const GraphNode& node);

    /**
     * @brief Insert the node unless its id already exists (existing node is untouched)
     * @return true if inserted
     */
    bool insert_node_if_absent(const GraphNode& node);

    /**
     * @brief Insert or replace the edge keyed by (source, target, relationship)
     * @return false if either endpoint is unknown; the graph is unchanged
     * @throws std::invalid_argument if weight is outside [0, 1]
     */
    bool upsert_edge(
        const std::string& source_id,
        const std::string& target_id,
        RelationshipType relationship,
        double weight = 1.0
    );

    /**
     * @brief Edge upsert carrying an explicit timestamp and properties
     */
    bool upsert_edge(const GraphEdge& edge);

    /**
     * @brief Remove a node and every edge touching it
     */
    bool delete_node(const std::string& node_id);

    bool delete_edge(
        const std::string& source_id,
        const std::string& target_id,
        RelationshipType relationship
    );

    /**
     * @brief Drop the in-memory graph (persistence is untouched)
     */
    void clear();

    // ==========================================
    // Persistence Lifecycle
    // ==========================================

    /**
     * @brief Replace the in-memory graph with the persisted one
     * @return Number of nodes loaded (0 when no mirror or the read fails)
     *
     * Edges whose endpoints were not loaded are skipped.
     */
    size_t load_from_persistence(const LoadOptions& options = {});

    /**
     * @brief Clear the in-memory graph and reload it from persistence
     */
    size_t clear_and_rebuild(const LoadOptions& options = {});

    /**
     * @brief Wait for mirrored writes to reach the adapter
     */
    void flush_persistence();

    std::shared_ptr<PersistenceMirror> mirror() const { return mirror_; }

    // ==========================================
    // Queries
    // ==========================================

    /**
     * @brief Run fn against the graph under a shared lock
     */
    template<typename Func>
    auto read(Func&& fn) const -> decltype(fn(std::declval<const GraphIndex&>())) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(index_);
    }

    std::optional<GraphNode> get_node(const std::string& node_id) const;
    bool has_node(const std::string& node_id) const;

    std::vector<std::string> successors(const std::string& node_id) const;
    std::vector<std::string> predecessors(const std::string& node_id) const;

    std::vector<GraphNode> all_nodes() const;
    std::vector<GraphEdge> all_edges() const;
    std::vector<GraphNode> nodes_by_type(NodeType type) const;

    size_t num_nodes() const;
    size_t num_edges() const;

    GraphStatistics statistics() const;

    nlohmann::json to_json() const;

    /**
     * @brief Write the in-memory graph to a JSON file
     * @throws std::runtime_error if the file cannot be written
     */
    void export_to_json(const std::string& filename) const;

private:
    GraphIndex index_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<PersistenceMirror> mirror_;
};

} // namespace tg

#endif // GRAPH_STORE_HPP
