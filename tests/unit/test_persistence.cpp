#include <gtest/gtest.h>
#include "graph/graph_store.hpp"
#include "persistence/memory_persistence.hpp"
#include "persistence/persistence_mirror.hpp"
#include "persistence/sqlite_persistence.hpp"
#include <sqlite3.h>
#include <cstdio>

using namespace tg;

namespace {

GraphNode make_node(const std::string& id, NodeType type, const std::string& label = "") {
    GraphNode node;
    node.id = id;
    node.type = type;
    node.label = label.empty() ? id : label;
    return node;
}

GraphEdge make_edge(const std::string& source, const std::string& target,
                    RelationshipType relationship, double weight = 1.0) {
    GraphEdge edge;
    edge.source_id = source;
    edge.target_id = target;
    edge.relationship = relationship;
    edge.weight = weight;
    edge.timestamp = parse_timestamp("2025-01-15T08:00:00Z");
    return edge;
}

// Adapter whose node writes always fail
class FailingPersistence : public MemoryPersistence {
public:
    void upsert_node(const GraphNode& node) override {
        throw PersistenceError("disk full while writing " + node.id);
    }
};

// Adapter whose reads always fail
class UnreadablePersistence : public MemoryPersistence {
public:
    std::vector<GraphNode> list_all_nodes(size_t) override {
        throw PersistenceError("connection lost");
    }
};

} // namespace

// ==========================================
// MemoryPersistence Tests
// ==========================================

TEST(MemoryPersistenceTest, UpsertAndCount) {
    MemoryPersistence adapter;
    adapter.upsert_node(make_node("A1", NodeType::Article));
    adapter.upsert_node(make_node("A1", NodeType::Article, "renamed"));
    adapter.upsert_node(make_node("vulnerability-cve-2024-3400", NodeType::Vulnerability));
    adapter.upsert_edge(make_edge("A1", "vulnerability-cve-2024-3400", RelationshipType::Mentions));

    EXPECT_EQ(adapter.count_nodes(), 2);
    EXPECT_EQ(adapter.count_edges(), 1);
    EXPECT_EQ(adapter.list_nodes_by_type(NodeType::Article).size(), 1);
    EXPECT_EQ(adapter.list_all_nodes(1).size(), 1);
    EXPECT_EQ(adapter.get_backend_name(), "memory");
}

TEST(MemoryPersistenceTest, DeleteNodeCascadesEdges) {
    MemoryPersistence adapter;
    adapter.upsert_node(make_node("A1", NodeType::Article));
    adapter.upsert_node(make_node("A2", NodeType::Article));
    adapter.upsert_edge(make_edge("A1", "A2", RelationshipType::RelatedTo, 0.8));

    adapter.delete_node("A2");
    EXPECT_EQ(adapter.count_nodes(), 1);
    EXPECT_EQ(adapter.count_edges(), 0);
}

// ==========================================
// SqlitePersistence Tests
// ==========================================

class SqlitePersistenceTest : public ::testing::Test {
protected:
    std::unique_ptr<SqlitePersistence> adapter;

    void SetUp() override {
        adapter = std::make_unique<SqlitePersistence>(":memory:");

        auto article = make_node("A1", NodeType::Article, "Exchange zero-day exploited");
        article.properties = {{"url", "https://example.com/a1"}, {"categories", {"ransomware"}}};
        article.size = 1.5;
        adapter->upsert_node(article);

        auto cve = make_node("vulnerability-cve-2024-3400", NodeType::Vulnerability, "CVE-2024-3400");
        cve.color = "#ff0000";
        adapter->upsert_node(cve);

        adapter->upsert_edge(make_edge("A1", "vulnerability-cve-2024-3400", RelationshipType::Mentions));
    }
};

TEST_F(SqlitePersistenceTest, NodesRoundTrip) {
    auto nodes = adapter->list_all_nodes();
    ASSERT_EQ(nodes.size(), 2);

    // Rows come back ordered by id
    EXPECT_EQ(nodes[0].id, "A1");
    EXPECT_EQ(nodes[0].type, NodeType::Article);
    EXPECT_EQ(nodes[0].properties["url"], "https://example.com/a1");
    EXPECT_DOUBLE_EQ(nodes[0].size, 1.5);

    EXPECT_EQ(nodes[1].type, NodeType::Vulnerability);
    ASSERT_TRUE(nodes[1].color.has_value());
    EXPECT_EQ(*nodes[1].color, "#ff0000");
}

TEST_F(SqlitePersistenceTest, EdgesRoundTrip) {
    auto edges = adapter->list_all_edges();
    ASSERT_EQ(edges.size(), 1);
    EXPECT_EQ(edges[0].source_id, "A1");
    EXPECT_EQ(edges[0].relationship, RelationshipType::Mentions);
    EXPECT_EQ(format_timestamp(edges[0].timestamp), "2025-01-15T08:00:00Z");
}

TEST_F(SqlitePersistenceTest, UpsertsReplaceInPlace) {
    adapter->upsert_node(make_node("A1", NodeType::Article, "Updated"));
    auto edge = make_edge("A1", "vulnerability-cve-2024-3400", RelationshipType::Mentions, 0.3);
    adapter->upsert_edge(edge);

    EXPECT_EQ(adapter->count_nodes(), 2);
    EXPECT_EQ(adapter->count_edges(), 1);
    EXPECT_EQ(adapter->list_nodes_by_type(NodeType::Article)[0].label, "Updated");
    EXPECT_DOUBLE_EQ(adapter->list_all_edges()[0].weight, 0.3);
}

TEST_F(SqlitePersistenceTest, DeleteNodeCascadesEdges) {
    adapter->delete_node("vulnerability-cve-2024-3400");
    EXPECT_EQ(adapter->count_nodes(), 1);
    EXPECT_EQ(adapter->count_edges(), 0);
}

TEST_F(SqlitePersistenceTest, DeleteEdge) {
    adapter->delete_edge("A1", "vulnerability-cve-2024-3400", RelationshipType::Mentions);
    EXPECT_EQ(adapter->count_edges(), 0);
    EXPECT_EQ(adapter->count_nodes(), 2);
}

TEST_F(SqlitePersistenceTest, EdgeToUnknownNodeFails) {
    EXPECT_THROW(
        adapter->upsert_edge(make_edge("A1", "missing", RelationshipType::Mentions)),
        PersistenceError
    );
}

TEST_F(SqlitePersistenceTest, ListLimits) {
    EXPECT_EQ(adapter->list_all_nodes(1).size(), 1);
    EXPECT_EQ(adapter->list_all_nodes(0).size(), 2);
    EXPECT_TRUE(adapter->list_nodes_by_type(NodeType::ThreatActor).empty());
}

TEST_F(SqlitePersistenceTest, ClearAll) {
    adapter->clear_all();
    EXPECT_EQ(adapter->count_nodes(), 0);
    EXPECT_EQ(adapter->count_edges(), 0);
}

TEST(SqlitePersistenceFileTest, EdgeKeepsCreatedAtAndLoadsLatestTimestamp) {
    std::string path = ::testing::TempDir() + "threatgraph_edge_timestamps.db";
    std::remove(path.c_str());

    {
        SqlitePersistence adapter(path);
        adapter.upsert_node(make_node("A1", NodeType::Article));
        adapter.upsert_node(make_node("A2", NodeType::Article));

        auto edge = make_edge("A1", "A2", RelationshipType::RelatedTo, 0.4);
        adapter.upsert_edge(edge);
        edge.timestamp = parse_timestamp("2025-03-01T00:00:00Z");
        adapter.upsert_edge(edge);

        auto edges = adapter.list_all_edges();
        ASSERT_EQ(edges.size(), 1);
        EXPECT_EQ(format_timestamp(edges[0].timestamp), "2025-03-01T00:00:00Z");
    }

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(db, "SELECT created_at, updated_at FROM graph_edges", -1, &stmt, nullptr),
              SQLITE_OK);
    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)), "2025-01-15T08:00:00Z");
    EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)), "2025-03-01T00:00:00Z");
    sqlite3_finalize(stmt);
    sqlite3_close(db);

    std::remove(path.c_str());
}

TEST(SqlitePersistenceFileTest, OutOfRangeStoredWeightIsSkipped) {
    std::string path = ::testing::TempDir() + "threatgraph_bad_weight.db";
    std::remove(path.c_str());

    {
        SqlitePersistence adapter(path);
        adapter.upsert_node(make_node("A1", NodeType::Article));
        adapter.upsert_node(make_node("A2", NodeType::Article));
        adapter.upsert_node(make_node("A3", NodeType::Article));
        adapter.upsert_edge(make_edge("A1", "A2", RelationshipType::RelatedTo, 0.5));
        adapter.upsert_edge(make_edge("A1", "A3", RelationshipType::RelatedTo, 0.5));
    }

    // Corrupt one row behind the adapter's back
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db, "UPDATE graph_edges SET weight = 7.5 WHERE target_id = 'A3'",
                           nullptr, nullptr, nullptr),
              SQLITE_OK);
    sqlite3_close(db);

    {
        SqlitePersistence adapter(path);
        auto edges = adapter.list_all_edges();
        ASSERT_EQ(edges.size(), 1);
        EXPECT_EQ(edges[0].target_id, "A2");
        EXPECT_DOUBLE_EQ(edges[0].weight, 0.5);
    }

    std::remove(path.c_str());
}

TEST(SqlitePersistenceOpenTest, UnopenablePathThrows) {
    EXPECT_THROW(SqlitePersistence("/nonexistent-directory/graph.db"), PersistenceError);
}

// ==========================================
// PersistenceMirror Tests
// ==========================================

TEST(PersistenceMirrorTest, RequiresAdapter) {
    EXPECT_THROW(PersistenceMirror(nullptr), std::invalid_argument);
}

TEST(PersistenceMirrorTest, AsyncWritesLandAfterFlush) {
    auto adapter = std::make_shared<MemoryPersistence>();
    auto mirror = std::make_shared<PersistenceMirror>(adapter, true);
    GraphStore store(mirror);

    for (int i = 0; i < 50; ++i) {
        store.upsert_node(make_node("A" + std::to_string(i), NodeType::Article));
    }
    store.upsert_edge("A0", "A1", RelationshipType::RelatedTo, 0.5);
    store.flush_persistence();

    EXPECT_EQ(adapter->count_nodes(), 50);
    EXPECT_EQ(adapter->count_edges(), 1);
    EXPECT_EQ(mirror->stats().enqueued, 51);
    EXPECT_EQ(mirror->stats().completed, 51);
    EXPECT_EQ(mirror->stats().failed, 0);
}

TEST(PersistenceMirrorTest, DeletionsAreMirroredInOrder) {
    auto adapter = std::make_shared<MemoryPersistence>();
    GraphStore store(std::make_shared<PersistenceMirror>(adapter, true));

    store.upsert_node(make_node("A1", NodeType::Article));
    store.upsert_node(make_node("A2", NodeType::Article));
    store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, 0.5);
    store.delete_edge("A1", "A2", RelationshipType::RelatedTo);
    store.delete_node("A2");
    store.flush_persistence();

    EXPECT_EQ(adapter->count_nodes(), 1);
    EXPECT_EQ(adapter->count_edges(), 0);
}

TEST(PersistenceMirrorTest, FailuresAreSwallowedAndCounted) {
    auto adapter = std::make_shared<FailingPersistence>();
    auto mirror = std::make_shared<PersistenceMirror>(adapter, true);
    GraphStore store(mirror);

    EXPECT_NO_THROW(store.upsert_node(make_node("A1", NodeType::Article)));
    EXPECT_NO_THROW(store.upsert_node(make_node("A2", NodeType::Article)));
    store.flush_persistence();

    // The in-memory graph stays authoritative
    EXPECT_EQ(store.num_nodes(), 2);
    EXPECT_EQ(mirror->stats().failed, 2);
    EXPECT_EQ(adapter->count_nodes(), 0);
}

TEST(PersistenceMirrorTest, SynchronousModeRunsInline) {
    auto adapter = std::make_shared<FailingPersistence>();
    auto mirror = std::make_shared<PersistenceMirror>(adapter, false);
    GraphStore store(mirror);

    EXPECT_NO_THROW(store.upsert_node(make_node("A1", NodeType::Article)));
    EXPECT_FALSE(mirror->is_asynchronous());
    EXPECT_EQ(mirror->stats().failed, 1);
}

TEST(PersistenceMirrorTest, DestructorDrainsQueue) {
    auto adapter = std::make_shared<MemoryPersistence>();
    {
        GraphStore store(std::make_shared<PersistenceMirror>(adapter, true));
        for (int i = 0; i < 20; ++i) {
            store.upsert_node(make_node("A" + std::to_string(i), NodeType::Article));
        }
    }
    EXPECT_EQ(adapter->count_nodes(), 20);
}

// ==========================================
// Load From Persistence Tests
// ==========================================

TEST(LoadFromPersistenceTest, SqliteRoundTripThroughStore) {
    std::string path = ::testing::TempDir() + "threatgraph_load_test.db";
    std::remove(path.c_str());

    {
        auto adapter = std::make_shared<SqlitePersistence>(path);
        GraphStore writer(std::make_shared<PersistenceMirror>(adapter, true));
        writer.upsert_node(make_node("A1", NodeType::Article));
        writer.upsert_node(make_node("threat_actor-lazarus", NodeType::ThreatActor, "Lazarus"));
        writer.upsert_edge("A1", "threat_actor-lazarus", RelationshipType::Mentions);
        writer.flush_persistence();
    }

    auto adapter = std::make_shared<SqlitePersistence>(path);
    GraphStore reader(std::make_shared<PersistenceMirror>(adapter, true));
    EXPECT_EQ(reader.load_from_persistence(), 2);
    EXPECT_EQ(reader.num_edges(), 1);
    EXPECT_EQ(reader.get_node("threat_actor-lazarus")->label, "Lazarus");

    std::remove(path.c_str());
}

TEST(LoadFromPersistenceTest, SkipsEdgesWithMissingEndpoints) {
    auto adapter = std::make_shared<MemoryPersistence>();
    adapter->upsert_node(make_node("A1", NodeType::Article));
    adapter->upsert_edge(make_edge("A1", "ghost", RelationshipType::RelatedTo, 0.5));

    GraphStore store(std::make_shared<PersistenceMirror>(adapter, false));
    EXPECT_EQ(store.load_from_persistence(), 1);
    EXPECT_EQ(store.num_edges(), 0);
}

TEST(LoadFromPersistenceTest, HonorsLimits) {
    auto adapter = std::make_shared<MemoryPersistence>();
    for (int i = 0; i < 5; ++i) {
        adapter->upsert_node(make_node("A" + std::to_string(i), NodeType::Article));
    }

    GraphStore store(std::make_shared<PersistenceMirror>(adapter, false));
    LoadOptions options;
    options.node_limit = 3;
    EXPECT_EQ(store.load_from_persistence(options), 3);
}

TEST(LoadFromPersistenceTest, ReadFailureLeavesGraphEmpty) {
    auto adapter = std::make_shared<UnreadablePersistence>();
    GraphStore store(std::make_shared<PersistenceMirror>(adapter, false));
    store.upsert_node(make_node("A1", NodeType::Article));

    EXPECT_EQ(store.load_from_persistence(), 0);
    EXPECT_EQ(store.num_nodes(), 0);
}

TEST(LoadFromPersistenceTest, ClearAndRebuildDropsUnpersistedState) {
    auto adapter = std::make_shared<MemoryPersistence>();
    adapter->upsert_node(make_node("A1", NodeType::Article));

    GraphStore store(std::make_shared<PersistenceMirror>(adapter, false));
    store.load_from_persistence();
    ASSERT_EQ(store.num_nodes(), 1);

    // Written straight to the adapter behind the store's back
    adapter->upsert_node(make_node("A2", NodeType::Article));
    EXPECT_EQ(store.clear_and_rebuild(), 2);
    EXPECT_TRUE(store.has_node("A2"));
}
