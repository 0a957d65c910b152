#pragma once

#include "persistence/persistence_adapter.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace tg {

/**
 * @brief Durable adapter backed by a SQLite database file
 *
 * Tables:
 *   graph_nodes(id PK, node_type, label, properties JSON, size, color, created_at, updated_at)
 *   graph_edges(id PK, source_id, target_id, relationship, weight, properties JSON, created_at,
 *               UNIQUE(source_id, target_id, relationship))
 *
 * Edges reference graph_nodes with ON DELETE CASCADE. One connection is shared
 * by all calls and guarded by a mutex.
 */
class SqlitePersistence : public PersistenceAdapter {
public:
    /**
     * @brief Open (or create) the database and its schema
     * @param db_path File path, or ":memory:" for a private in-memory database
     * @throws PersistenceError if the database cannot be opened or migrated
     */
    explicit SqlitePersistence(const std::string& db_path);
    ~SqlitePersistence() override;

    SqlitePersistence(const SqlitePersistence&) = delete;
    SqlitePersistence& operator=(const SqlitePersistence&) = delete;

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

    std::string get_backend_name() const override { return "sqlite"; }

    const std::string& db_path() const { return db_path_; }

private:
    std::string db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void exec(const std::string& sql);
    void create_tables();
    size_t count_rows(const std::string& table);
};

} // namespace tg
