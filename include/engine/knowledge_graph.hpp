#pragma once

#include "config/engine_config.hpp"
#include "graph/graph_store.hpp"
#include "linker/article.hpp"
#include "linker/entity_linker.hpp"
#include "persistence/persistence_adapter.hpp"
#include "query/graph_context.hpp"
#include "query/path_finder.hpp"
#include "query/subgraph_extractor.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tg {

/**
 * @brief Security-news knowledge graph: ingestion, traversal and context signals
 *
 * Owns the in-memory GraphStore and wires it to an optional persistence
 * adapter through a PersistenceMirror. Every collaborator (prediction,
 * chat, visualization) talks to the graph through this class.
 *
 * Usage:
 * @code
 *   EngineConfig config;
 *   config.database_path = "news.db";
 *   KnowledgeGraph graph(config);
 *   graph.load_from_persistence();
 *   graph.add_article_node(article);
 *   auto context = graph.get_prediction_context(article.id);
 * @endcode
 */
class KnowledgeGraph {
public:
    /**
     * @brief Open the SQLite database named by config.database_path
     * @throws PersistenceError if the database cannot be opened
     */
    explicit KnowledgeGraph(const EngineConfig& config);

    /**
     * @brief Use a caller-supplied adapter; nullptr runs purely in memory
     */
    explicit KnowledgeGraph(std::shared_ptr<PersistenceAdapter> adapter,
                            const EngineConfig& config = EngineConfig());

    KnowledgeGraph(const KnowledgeGraph&) = delete;
    KnowledgeGraph& operator=(const KnowledgeGraph&) = delete;

    // ==========================================
    // Ingestion
    // ==========================================

    /**
     * @brief Link an article and all of its entities; returns the article node
     */
    GraphNode add_article_node(const Article& article);

    /**
     * @brief Add RELATED_TO edges weighted by similarity score
     * @return Number of edges written
     */
    size_t connect_similar_articles(
        Article& article,
        const std::vector<std::pair<Article, double>>& similar
    );

    // ==========================================
    // Queries
    // ==========================================

    GraphVisualization get_subgraph(const std::string& focus_id, int depth) const;
    GraphVisualization get_subgraph(const std::string& focus_id) const;

    std::vector<NodePath> find_paths(const std::string& from_id, const std::string& to_id) const;

    GraphStatistics get_statistics() const;

    GraphContext get_prediction_context(const std::string& article_id) const;

    ArticleConnections get_article_connections(const std::string& article_id) const;

    // ==========================================
    // Administration
    // ==========================================

    size_t load_from_persistence();
    size_t clear_and_rebuild();

    bool delete_node(const std::string& node_id);
    bool delete_edge(const std::string& source_id,
                     const std::string& target_id,
                     RelationshipType relationship);

    /**
     * @brief Block until every mirrored write has reached the adapter
     */
    void flush_persistence();

    void export_to_json(const std::string& filename) const;

    GraphStore& store() { return store_; }
    const GraphStore& store() const { return store_; }
    const EngineConfig& config() const { return config_; }
    bool has_persistence() const { return adapter_ != nullptr; }

private:
    EngineConfig config_;
    std::shared_ptr<PersistenceAdapter> adapter_;
    GraphStore store_;
    EntityLinker linker_;
    SubgraphExtractor subgraphs_;
    PathFinder paths_;
    GraphContextExtractor contexts_;

    LoadOptions load_options() const;
};

} // namespace tg
