#pragma once

#include "persistence/persistence_adapter.hpp"
#include <map>
#include <mutex>

namespace tg {

/**
 * @brief Process-local adapter keeping rows in maps
 *
 * Used when no database is configured and as the reference backend in tests.
 */
class MemoryPersistence : public PersistenceAdapter {
public:
    MemoryPersistence() = default;

    void upsert_node(const GraphNode& node) override;
    void upsert_edge(const GraphEdge& edge) override;

    std::vector<GraphNode> list_nodes_by_type(NodeType type, size_t limit = 100) override;
    std::vector<GraphNode> list_all_nodes(size_t limit = 0) override;
    std::vector<GraphEdge> list_all_edges(size_t limit = 0) override;

    void delete_node(const std::string& node_id) override;
    void delete_edge(
        const std::string& source_id,
        const std::string& target_id,
        RelationshipType relationship
    ) override;

    size_t count_nodes() override;
    size_t count_edges() override;

    void clear_all() override;

    std::string get_backend_name() const override { return "memory"; }

private:
    std::mutex mutex_;
    std::map<std::string, GraphNode> nodes_;
    std::map<EdgeKey, GraphEdge> edges_;
};

} // namespace tg
