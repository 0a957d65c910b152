#ifndef GRAPH_INDEX_HPP
#define GRAPH_INDEX_HPP

#include "graph/graph_types.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief In-memory directed multigraph with node and adjacency indexes
 *
 * Edges are unique per (source, target, relationship), so two nodes may be
 * joined by several edges of different relationship types. Every edge's
 * endpoints exist as nodes at all times.
 *
 * This class does no locking; GraphStore serializes access to it.
 */
class GraphIndex {
public:
    GraphIndex() = default;

    // ==========================================
    // Node and Edge Management
    // ==========================================

    /**
     * @brief Insert a node or replace label/properties/size/color of an existing one
     * @return true if the node was newly created
     * @throws NodeTypeConflict if the id exists with another type
     */
    bool upsert_node(const GraphNode& node);

    /**
     * @brief Insert the node only if no node with its id exists
     * @return true if inserted
     */
    bool insert_node_if_absent(const GraphNode& node);

    /**
     * @brief Insert an edge or replace weight/timestamp/properties of the same key
     * @return false if either endpoint is unknown (nothing is changed)
     */
    bool upsert_edge(const GraphEdge& edge);

    /**
     * @brief Remove one edge by key
     */
    bool remove_edge(const EdgeKey& key);

    /**
     * @brief Remove a node and every edge where it is source or target
     */
    bool remove_node(const std::string& node_id);

    void clear();

    // ==========================================
    // Lookups
    // ==========================================

    const GraphNode* get_node(const std::string& node_id) const;
    const GraphEdge* get_edge(const EdgeKey& key) const;

    bool has_node(const std::string& node_id) const;
    bool has_edge(const EdgeKey& key) const;

    /**
     * @brief Distinct targets of outgoing edges
     */
    std::set<std::string> successors(const std::string& node_id) const;

    /**
     * @brief Distinct sources of incoming edges
     */
    std::set<std::string> predecessors(const std::string& node_id) const;

    /**
     * @brief Predecessors and successors together (the undirected view)
     */
    std::set<std::string> neighbors(const std::string& node_id) const;

    /**
     * @brief All edges from source to target, any relationship
     */
    std::vector<const GraphEdge*> edges_between(
        const std::string& source_id,
        const std::string& target_id
    ) const;

    std::vector<GraphNode> get_all_nodes() const;
    std::vector<GraphEdge> get_all_edges() const;
    std::vector<GraphNode> get_nodes_by_type(NodeType type) const;

    /**
     * @brief Edges whose endpoints are both in the given set, ordered by key
     */
    std::vector<GraphEdge> get_edges_within(const std::set<std::string>& node_ids) const;

    // ==========================================
    // Statistics and Export
    // ==========================================

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }
    bool empty() const { return nodes_.empty() && edges_.empty(); }

    size_t count_nodes_of_type(NodeType type) const;

    GraphStatistics compute_statistics() const;

    /**
     * @brief Export nodes, edges and counts as JSON
     */
    nlohmann::json to_json() const;

private:
    std::map<std::string, GraphNode> nodes_;                    // node_id -> node
    std::map<EdgeKey, GraphEdge> edges_;                        // key -> edge
    std::map<std::string, std::set<EdgeKey>> outgoing_;         // node_id -> keys where node is source
    std::map<std::string, std::set<EdgeKey>> incoming_;         // node_id -> keys where node is target
    std::map<NodeType, size_t> type_counts_;

    void update_indices(const EdgeKey& key);
    void remove_from_indices(const EdgeKey& key);
};

} // namespace tg

#endif // GRAPH_INDEX_HPP
