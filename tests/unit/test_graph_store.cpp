#include <gtest/gtest.h>
#include "graph/graph_store.hpp"
#include "query/graph_context.hpp"
#include "query/subgraph_extractor.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <set>
#include <thread>
#include <vector>

using namespace tg;

namespace {

GraphNode make_node(const std::string& id, NodeType type, const std::string& label = "") {
    GraphNode node;
    node.id = id;
    node.type = type;
    node.label = label.empty() ? id : label;
    return node;
}

} // namespace

class GraphStoreTest : public ::testing::Test {
protected:
    GraphStore store;

    void SetUp() override {
        // A1 mentions a CVE and an actor; A2 mentions the same CVE
        store.upsert_node(make_node("A1", NodeType::Article));
        store.upsert_node(make_node("A2", NodeType::Article));
        store.upsert_node(make_node("vulnerability-cve-2025-1111", NodeType::Vulnerability, "CVE-2025-1111"));
        store.upsert_node(make_node("threat_actor-apt29", NodeType::ThreatActor, "APT29"));

        store.upsert_edge("A1", "vulnerability-cve-2025-1111", RelationshipType::Mentions);
        store.upsert_edge("A1", "threat_actor-apt29", RelationshipType::Mentions);
        store.upsert_edge("A2", "vulnerability-cve-2025-1111", RelationshipType::Mentions);
    }

    // Every edge must reference live nodes on both ends
    void expect_no_dangling_edges() {
        store.read([](const GraphIndex& graph) {
            for (const auto& edge : graph.get_all_edges()) {
                EXPECT_TRUE(graph.has_node(edge.source_id)) << edge.source_id;
                EXPECT_TRUE(graph.has_node(edge.target_id)) << edge.target_id;
            }
        });
    }
};

// ==========================================
// Upsert Tests
// ==========================================

TEST_F(GraphStoreTest, BasicCounts) {
    EXPECT_EQ(store.num_nodes(), 4);
    EXPECT_EQ(store.num_edges(), 3);
}

TEST_F(GraphStoreTest, UpsertNodeIsIdempotent) {
    EXPECT_FALSE(store.upsert_node(make_node("A1", NodeType::Article, "Updated title")));

    EXPECT_EQ(store.num_nodes(), 4);
    auto node = store.get_node("A1");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->label, "Updated title");
}

TEST_F(GraphStoreTest, UpsertEdgeUpdatesWeightWithoutDuplicating) {
    EXPECT_TRUE(store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, 0.4));
    EXPECT_TRUE(store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, 0.9));

    EXPECT_EQ(store.num_edges(), 4);
    store.read([](const GraphIndex& graph) {
        const GraphEdge* edge = graph.get_edge({"A1", "A2", RelationshipType::RelatedTo});
        ASSERT_NE(edge, nullptr);
        EXPECT_DOUBLE_EQ(edge->weight, 0.9);
    });
}

TEST_F(GraphStoreTest, DistinctRelationshipsAreDistinctEdges) {
    store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, 0.5);
    store.upsert_edge("A1", "A2", RelationshipType::EvolvesFrom, 0.5);

    EXPECT_EQ(store.num_edges(), 5);
    store.read([](const GraphIndex& graph) {
        EXPECT_EQ(graph.edges_between("A1", "A2").size(), 2);
    });
    // Parallel edges still count as one successor
    auto successors = store.successors("A1");
    EXPECT_EQ(std::count(successors.begin(), successors.end(), "A2"), 1);
}

TEST_F(GraphStoreTest, TypeChangeIsRejected) {
    EXPECT_THROW(
        store.upsert_node(make_node("A1", NodeType::Vulnerability)),
        NodeTypeConflict
    );

    auto node = store.get_node("A1");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->type, NodeType::Article);
    EXPECT_EQ(store.num_nodes(), 4);
}

TEST_F(GraphStoreTest, InsertIfAbsentKeepsExistingNode) {
    EXPECT_FALSE(store.insert_node_if_absent(
        make_node("threat_actor-apt29", NodeType::ThreatActor, "apt29")));
    EXPECT_EQ(store.get_node("threat_actor-apt29")->label, "APT29");

    EXPECT_TRUE(store.insert_node_if_absent(make_node("product-exchange", NodeType::Product)));
    EXPECT_EQ(store.num_nodes(), 5);
}

// ==========================================
// Referential Integrity Tests
// ==========================================

TEST_F(GraphStoreTest, EdgeWithUnknownEndpointIsRejected) {
    EXPECT_FALSE(store.upsert_edge("A1", "missing", RelationshipType::RelatedTo, 0.5));
    EXPECT_FALSE(store.upsert_edge("missing", "A1", RelationshipType::RelatedTo, 0.5));

    EXPECT_EQ(store.num_edges(), 3);
    EXPECT_FALSE(store.has_node("missing"));
}

TEST_F(GraphStoreTest, MalformedWeightIsRejected) {
    EXPECT_THROW(store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, 1.5), std::invalid_argument);
    EXPECT_THROW(store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, -0.1), std::invalid_argument);
    EXPECT_THROW(
        store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, std::numeric_limits<double>::quiet_NaN()),
        std::invalid_argument
    );
    EXPECT_EQ(store.num_edges(), 3);
}

TEST_F(GraphStoreTest, DeleteNodeRemovesTouchingEdges) {
    EXPECT_TRUE(store.delete_node("vulnerability-cve-2025-1111"));

    EXPECT_FALSE(store.has_node("vulnerability-cve-2025-1111"));
    EXPECT_EQ(store.num_edges(), 1);
    EXPECT_TRUE(store.predecessors("vulnerability-cve-2025-1111").empty());
    expect_no_dangling_edges();
}

TEST_F(GraphStoreTest, DeleteMissingNodeReportsFalse) {
    EXPECT_FALSE(store.delete_node("nonexistent"));
    EXPECT_EQ(store.num_nodes(), 4);
}

TEST_F(GraphStoreTest, DeleteEdge) {
    EXPECT_TRUE(store.delete_edge("A1", "threat_actor-apt29", RelationshipType::Mentions));
    EXPECT_FALSE(store.delete_edge("A1", "threat_actor-apt29", RelationshipType::Mentions));

    EXPECT_EQ(store.num_edges(), 2);
    EXPECT_TRUE(store.has_node("threat_actor-apt29"));
    EXPECT_TRUE(store.predecessors("threat_actor-apt29").empty());
}

TEST_F(GraphStoreTest, NoDanglingEdgesAfterMixedMutations) {
    store.upsert_edge("A1", "A2", RelationshipType::RelatedTo, 0.7);
    store.delete_node("A2");
    store.upsert_node(make_node("A3", NodeType::Article));
    store.upsert_edge("A3", "threat_actor-apt29", RelationshipType::Mentions);
    store.delete_node("threat_actor-apt29");
    store.upsert_edge("A3", "A2", RelationshipType::RelatedTo, 0.2);

    expect_no_dangling_edges();
    EXPECT_EQ(store.num_edges(), 1);
}

// ==========================================
// Query Tests
// ==========================================

TEST_F(GraphStoreTest, SuccessorsAndPredecessors) {
    auto successors = store.successors("A1");
    EXPECT_EQ(successors.size(), 2);

    auto predecessors = store.predecessors("vulnerability-cve-2025-1111");
    EXPECT_EQ(predecessors.size(), 2);

    EXPECT_TRUE(store.successors("nonexistent").empty());
}

TEST_F(GraphStoreTest, NeighborsIgnoreDirection) {
    store.read([](const GraphIndex& graph) {
        auto neighbors = graph.neighbors("vulnerability-cve-2025-1111");
        EXPECT_EQ(neighbors.size(), 2);
        EXPECT_TRUE(neighbors.count("A1"));
        EXPECT_TRUE(neighbors.count("A2"));
    });
}

TEST_F(GraphStoreTest, NodesByType) {
    EXPECT_EQ(store.nodes_by_type(NodeType::Article).size(), 2);
    EXPECT_EQ(store.nodes_by_type(NodeType::Vulnerability).size(), 1);
    EXPECT_TRUE(store.nodes_by_type(NodeType::Technique).empty());
}

TEST_F(GraphStoreTest, Statistics) {
    auto stats = store.statistics();
    EXPECT_EQ(stats.total_nodes, 4);
    EXPECT_EQ(stats.total_edges, 3);
    EXPECT_EQ(stats.article_nodes, 2);
    EXPECT_EQ(stats.entity_nodes, 2);
    EXPECT_EQ(stats.nodes_by_type[NodeType::ThreatActor], 1);

    store.delete_node("A2");
    stats = store.statistics();
    EXPECT_EQ(stats.article_nodes, 1);
    EXPECT_EQ(stats.total_edges, 2);
}

TEST_F(GraphStoreTest, ClearEmptiesGraph) {
    store.clear();
    EXPECT_EQ(store.num_nodes(), 0);
    EXPECT_EQ(store.num_edges(), 0);
    EXPECT_EQ(store.statistics().article_nodes, 0);
}

TEST_F(GraphStoreTest, LoadWithoutPersistenceIsNoop) {
    EXPECT_EQ(store.load_from_persistence(), 0);
    EXPECT_EQ(store.num_nodes(), 4);
}

// ==========================================
// Concurrency Tests
// ==========================================

TEST_F(GraphStoreTest, ReadersSeeConsistentSnapshotsDuringWrites) {
    SubgraphExtractor subgraphs(store);
    GraphContextExtractor contexts(store);

    std::atomic<bool> writing{true};
    std::atomic<int> inconsistent{0};
    std::atomic<int> reads{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            do {
                bool consistent = store.read([](const GraphIndex& graph) {
                    if (graph.get_all_nodes().size() != graph.num_nodes()) return false;
                    auto stats = graph.compute_statistics();
                    if (stats.article_nodes + stats.entity_nodes != stats.total_nodes) return false;
                    for (const auto& edge : graph.get_all_edges()) {
                        if (!graph.has_node(edge.source_id) || !graph.has_node(edge.target_id)) {
                            return false;
                        }
                    }
                    return true;
                });

                auto view = subgraphs.extract("A1", 3);
                std::set<std::string> ids;
                for (const auto& node : view.nodes) ids.insert(node.id);
                for (const auto& edge : view.edges) {
                    if (!ids.count(edge.source) || !ids.count(edge.target)) consistent = false;
                }
                if (view.total_nodes != view.nodes.size()) consistent = false;

                auto context = contexts.extract("A1");
                if (context.has_graph_data &&
                    context.related_cves.size() != context.cve_severity_context.size()) {
                    consistent = false;
                }

                if (!consistent) inconsistent++;
                reads++;
            } while (writing.load());
        });
    }

    // Single writer churns articles and a shared CVE in and out of the graph
    for (int i = 0; i < 300; ++i) {
        std::string article = "W" + std::to_string(i % 20);
        std::string cve = "vulnerability-cve-2025-" + std::to_string(i % 5);
        store.upsert_node(make_node(article, NodeType::Article));
        store.upsert_node(make_node(cve, NodeType::Vulnerability));
        store.upsert_edge(article, cve, RelationshipType::Mentions);
        store.upsert_edge("A1", cve, RelationshipType::Mentions);
        if (i % 3 == 0) {
            store.delete_node(cve);
        }
        if (i % 7 == 0) {
            store.delete_node(article);
        }
    }
    writing = false;

    for (auto& reader : readers) reader.join();

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_GT(reads.load(), 0);
    expect_no_dangling_edges();

    auto stats = store.statistics();
    EXPECT_EQ(stats.total_nodes, store.all_nodes().size());
    EXPECT_EQ(stats.total_edges, store.all_edges().size());
    EXPECT_EQ(stats.article_nodes + stats.entity_nodes, stats.total_nodes);
}

// ==========================================
// JSON Export Tests
// ==========================================

TEST_F(GraphStoreTest, ToJson) {
    auto j = store.to_json();
    EXPECT_EQ(j["nodes"].size(), 4);
    EXPECT_EQ(j["edges"].size(), 3);
    EXPECT_EQ(j["metadata"]["num_nodes"], 4);
}

TEST_F(GraphStoreTest, ExportToJson) {
    std::string path = ::testing::TempDir() + "threatgraph_export_test.json";
    store.export_to_json(path);

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    nlohmann::json j;
    file >> j;
    EXPECT_EQ(j["nodes"].size(), 4);
    std::remove(path.c_str());
}

TEST(GraphTypesTest, WireNames) {
    EXPECT_EQ(to_string(NodeType::ThreatActor), "threat_actor");
    EXPECT_EQ(parse_node_type("vulnerability"), NodeType::Vulnerability);
    EXPECT_EQ(to_string(RelationshipType::AttributedTo), "attributed_to");
    EXPECT_EQ(parse_relationship("related_to"), RelationshipType::RelatedTo);

    EXPECT_THROW(parse_node_type("malware"), std::invalid_argument);
    EXPECT_THROW(parse_relationship("likes"), std::invalid_argument);
}

TEST(GraphTypesTest, EdgeJsonKeepsTimestamp) {
    GraphEdge edge;
    edge.source_id = "A1";
    edge.target_id = "A2";
    edge.relationship = RelationshipType::RelatedTo;
    edge.weight = 0.25;
    edge.timestamp = parse_timestamp("2025-03-01T12:30:00Z");

    auto restored = GraphEdge::from_json(edge.to_json());
    EXPECT_EQ(restored.key(), edge.key());
    EXPECT_DOUBLE_EQ(restored.weight, 0.25);
    EXPECT_EQ(format_timestamp(restored.timestamp), "2025-03-01T12:30:00Z");
}
