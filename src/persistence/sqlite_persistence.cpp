#include "persistence/sqlite_persistence.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace {

using tg::PersistenceError;

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : stmt_(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw PersistenceError("Failed to prepare statement: " +
                                   std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind_double(int index, double value) {
        sqlite3_bind_double(stmt_, index, value);
    }

    void bind_int64(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
    }

    bool step() {
        int result = sqlite3_step(stmt_);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw PersistenceError("Step failed: " +
                               std::string(sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }

    std::string get_text(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return text ? text : "";
    }

    double get_double(int col) {
        return sqlite3_column_double(stmt_, col);
    }

    int64_t get_int64(int col) {
        return sqlite3_column_int64(stmt_, col);
    }

    bool is_null(int col) {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* stmt_;
};

// SQLite treats a negative LIMIT as "no limit"
int64_t sql_limit(size_t limit) {
    return limit == 0 ? -1 : static_cast<int64_t>(limit);
}

nlohmann::json parse_properties(const std::string& text) {
    if (text.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

const char* kNodeColumns = "id, node_type, label, properties, size, color";

// Rows written by other tools may carry types this build does not know
bool read_node_row(Statement& stmt, tg::GraphNode& node) {
    try {
        node.id = stmt.get_text(0);
        node.type = tg::parse_node_type(stmt.get_text(1));
        node.label = stmt.get_text(2);
        node.properties = parse_properties(stmt.get_text(3));
        node.size = stmt.is_null(4) ? 1.0 : stmt.get_double(4);
        if (!stmt.is_null(5)) {
            node.color = stmt.get_text(5);
        }
        return true;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Skipping stored node " << node.id << ": " << e.what() << "\n";
        return false;
    }
}

} // anonymous namespace

namespace tg {

// ============================================================================
// Lifecycle
// ============================================================================

SqlitePersistence::SqlitePersistence(const std::string& db_path) : db_path_(db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw PersistenceError("Failed to open database " + db_path + ": " + error);
    }

    try {
        exec("PRAGMA foreign_keys = ON");
        create_tables();
    } catch (const PersistenceError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqlitePersistence::~SqlitePersistence() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqlitePersistence::exec(const std::string& sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        throw PersistenceError("SQL error: " + error);
    }
}

void SqlitePersistence::create_tables() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS graph_nodes (
            id TEXT PRIMARY KEY,
            node_type TEXT NOT NULL,
            label TEXT NOT NULL,
            properties TEXT NOT NULL DEFAULT '{}',
            size REAL NOT NULL DEFAULT 1.0,
            color TEXT,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        )
    )");

    exec(R"(
        CREATE TABLE IF NOT EXISTS graph_edges (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source_id TEXT NOT NULL,
            target_id TEXT NOT NULL,
            relationship TEXT NOT NULL,
            weight REAL NOT NULL DEFAULT 1.0,
            properties TEXT NOT NULL DEFAULT '{}',
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL,
            UNIQUE(source_id, target_id, relationship),
            FOREIGN KEY (source_id) REFERENCES graph_nodes(id) ON DELETE CASCADE,
            FOREIGN KEY (target_id) REFERENCES graph_nodes(id) ON DELETE CASCADE
        )
    )");

    exec("CREATE INDEX IF NOT EXISTS idx_nodes_type ON graph_nodes(node_type)");
    exec("CREATE INDEX IF NOT EXISTS idx_edges_source ON graph_edges(source_id)");
    exec("CREATE INDEX IF NOT EXISTS idx_edges_target ON graph_edges(target_id)");
}

// ============================================================================
// Writes
// ============================================================================

void SqlitePersistence::upsert_node(const GraphNode& node) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO graph_nodes (id, node_type, label, properties, size, color, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            node_type = excluded.node_type,
            label = excluded.label,
            properties = excluded.properties,
            size = excluded.size,
            color = excluded.color,
            updated_at = excluded.updated_at
    )");

    std::string now = format_timestamp(std::chrono::system_clock::now());
    stmt.bind_text(1, node.id);
    stmt.bind_text(2, to_string(node.type));
    stmt.bind_text(3, node.label);
    stmt.bind_text(4, node.properties.dump());
    stmt.bind_double(5, node.size);
    if (node.color.has_value()) {
        stmt.bind_text(6, node.color.value());
    } else {
        stmt.bind_null(6);
    }
    stmt.bind_text(7, now);
    stmt.bind_text(8, now);
    stmt.step();
}

void SqlitePersistence::upsert_edge(const GraphEdge& edge) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO graph_edges (source_id, target_id, relationship, weight, properties, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(source_id, target_id, relationship) DO UPDATE SET
            weight = excluded.weight,
            properties = excluded.properties,
            updated_at = excluded.updated_at
    )");

    // created_at records the first assertion, updated_at carries the edge timestamp
    std::string timestamp = format_timestamp(edge.timestamp);

    stmt.bind_text(1, edge.source_id);
    stmt.bind_text(2, edge.target_id);
    stmt.bind_text(3, to_string(edge.relationship));
    stmt.bind_double(4, edge.weight);
    stmt.bind_text(5, edge.properties.dump());
    stmt.bind_text(6, timestamp);
    stmt.bind_text(7, timestamp);
    stmt.step();
}

void SqlitePersistence::delete_node(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    exec("BEGIN");
    try {
        Statement edges(db_, "DELETE FROM graph_edges WHERE source_id = ? OR target_id = ?");
        edges.bind_text(1, node_id);
        edges.bind_text(2, node_id);
        edges.step();

        Statement nodes(db_, "DELETE FROM graph_nodes WHERE id = ?");
        nodes.bind_text(1, node_id);
        nodes.step();

        exec("COMMIT");
    } catch (const PersistenceError&) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

void SqlitePersistence::delete_edge(
    const std::string& source_id,
    const std::string& target_id,
    RelationshipType relationship
) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "DELETE FROM graph_edges WHERE source_id = ? AND target_id = ? AND relationship = ?");
    stmt.bind_text(1, source_id);
    stmt.bind_text(2, target_id);
    stmt.bind_text(3, to_string(relationship));
    stmt.step();
}

void SqlitePersistence::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("DELETE FROM graph_edges");
    exec("DELETE FROM graph_nodes");
}

// ============================================================================
// Reads
// ============================================================================

std::vector<GraphNode> SqlitePersistence::list_nodes_by_type(NodeType type, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kNodeColumns +
                        " FROM graph_nodes WHERE node_type = ? ORDER BY id LIMIT ?");
    stmt.bind_text(1, to_string(type));
    stmt.bind_int64(2, sql_limit(limit));

    std::vector<GraphNode> result;
    while (stmt.step()) {
        GraphNode node;
        if (read_node_row(stmt, node)) {
            result.push_back(std::move(node));
        }
    }
    return result;
}

std::vector<GraphNode> SqlitePersistence::list_all_nodes(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kNodeColumns +
                        " FROM graph_nodes ORDER BY id LIMIT ?");
    stmt.bind_int64(1, sql_limit(limit));

    std::vector<GraphNode> result;
    while (stmt.step()) {
        GraphNode node;
        if (read_node_row(stmt, node)) {
            result.push_back(std::move(node));
        }
    }
    return result;
}

std::vector<GraphEdge> SqlitePersistence::list_all_edges(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        SELECT source_id, target_id, relationship, weight, properties, updated_at
        FROM graph_edges ORDER BY id LIMIT ?
    )");
    stmt.bind_int64(1, sql_limit(limit));

    std::vector<GraphEdge> result;
    while (stmt.step()) {
        GraphEdge edge;
        edge.source_id = stmt.get_text(0);
        edge.target_id = stmt.get_text(1);
        try {
            edge.relationship = parse_relationship(stmt.get_text(2));
            edge.timestamp = parse_timestamp(stmt.get_text(5));
            edge.weight = stmt.get_double(3);
            validate_weight(edge.weight);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Skipping stored edge " << edge.source_id << " -> "
                      << edge.target_id << ": " << e.what() << "\n";
            continue;
        }
        edge.properties = parse_properties(stmt.get_text(4));
        result.push_back(std::move(edge));
    }
    return result;
}

size_t SqlitePersistence::count_nodes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_rows("graph_nodes");
}

size_t SqlitePersistence::count_edges() {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_rows("graph_edges");
}

size_t SqlitePersistence::count_rows(const std::string& table) {
    Statement stmt(db_, "SELECT COUNT(*) FROM " + table);
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.get_int64(0));
}

} // namespace tg
