#pragma once

#include "graph/graph_types.hpp"
#include <string>
#include <vector>
#include <stdexcept>

namespace tg {

/**
 * @brief Failure reported by a persistence backend
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

// ============================================================================
// Persistence Adapter Interface
// ============================================================================

/**
 * @brief Durable storage for graph nodes and edges
 *
 * The in-memory graph is authoritative while the process runs; an adapter
 * only has to keep an eventually consistent copy for restart recovery.
 * Implementations throw PersistenceError on failure.
 */
class PersistenceAdapter {
public:
    virtual ~PersistenceAdapter() = default;

    /**
     * @brief Insert or replace a node by id
     */
    virtual void upsert_node(const GraphNode& node) = 0;

    /**
     * @brief Insert or replace an edge by (source, target, relationship)
     */
    virtual void upsert_edge(const GraphEdge& edge) = 0;

    /**
     * @brief List nodes of one type
     * @param limit Maximum rows, 0 for no limit
     */
    virtual std::vector<GraphNode> list_nodes_by_type(NodeType type, size_t limit = 100) = 0;

    /**
     * @param limit Maximum rows, 0 for no limit
     */
    virtual std::vector<GraphNode> list_all_nodes(size_t limit = 0) = 0;

    /**
     * @param limit Maximum rows, 0 for no limit
     */
    virtual std::vector<GraphEdge> list_all_edges(size_t limit = 0) = 0;

    /**
     * @brief Delete a node together with every edge touching it
     */
    virtual void delete_node(const std::string& node_id) = 0;

    virtual void delete_edge(
        const std::string& source_id,
        const std::string& target_id,
        RelationshipType relationship
    ) = 0;

    virtual size_t count_nodes() = 0;
    virtual size_t count_edges() = 0;

    /**
     * @brief Remove all nodes and edges
     */
    virtual void clear_all() = 0;

    /**
     * @brief Backend name for diagnostics
     */
    virtual std::string get_backend_name() const = 0;
};

} // namespace tg
