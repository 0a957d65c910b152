#include "engine/knowledge_graph.hpp"
#include "persistence/sqlite_persistence.hpp"
#include <iostream>
#include <stdexcept>

namespace tg {

namespace {

std::shared_ptr<PersistenceMirror> make_mirror(
    const std::shared_ptr<PersistenceAdapter>& adapter,
    bool asynchronous
) {
    if (!adapter) {
        return nullptr;
    }
    return std::make_shared<PersistenceMirror>(adapter, asynchronous);
}

EngineConfig checked(const EngineConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid engine configuration: " + error);
    }
    return config;
}

} // namespace

KnowledgeGraph::KnowledgeGraph(const EngineConfig& config)
    : KnowledgeGraph(std::make_shared<SqlitePersistence>(checked(config).database_path), config) {}

KnowledgeGraph::KnowledgeGraph(std::shared_ptr<PersistenceAdapter> adapter, const EngineConfig& config)
    : config_(checked(config)),
      adapter_(std::move(adapter)),
      store_(make_mirror(adapter_, config_.async_persistence)),
      linker_(store_),
      subgraphs_(store_),
      paths_(store_, static_cast<size_t>(config_.max_paths)),
      contexts_(store_, config_.context_thresholds()) {
    if (config_.verbose) {
        std::cerr << "threatgraph: using "
                  << (adapter_ ? adapter_->get_backend_name() : std::string("no"))
                  << " persistence"
                  << (adapter_ && config_.async_persistence ? " (async)" : "")
                  << std::endl;
    }
}

// ==========================================
// Ingestion
// ==========================================

GraphNode KnowledgeGraph::add_article_node(const Article& article) {
    return linker_.link_article(article);
}

size_t KnowledgeGraph::connect_similar_articles(
    Article& article,
    const std::vector<std::pair<Article, double>>& similar
) {
    return linker_.connect_similar_articles(article, similar);
}

// ==========================================
// Queries
// ==========================================

GraphVisualization KnowledgeGraph::get_subgraph(const std::string& focus_id, int depth) const {
    return subgraphs_.extract(focus_id, depth);
}

GraphVisualization KnowledgeGraph::get_subgraph(const std::string& focus_id) const {
    return subgraphs_.extract(focus_id, config_.default_depth);
}

std::vector<NodePath> KnowledgeGraph::find_paths(const std::string& from_id, const std::string& to_id) const {
    return paths_.find_paths(from_id, to_id);
}

GraphStatistics KnowledgeGraph::get_statistics() const {
    return store_.statistics();
}

GraphContext KnowledgeGraph::get_prediction_context(const std::string& article_id) const {
    return contexts_.extract(article_id);
}

ArticleConnections KnowledgeGraph::get_article_connections(const std::string& article_id) const {
    return contexts_.get_article_connections(article_id);
}

// ==========================================
// Administration
// ==========================================

LoadOptions KnowledgeGraph::load_options() const {
    LoadOptions options;
    options.node_limit = static_cast<size_t>(config_.load_node_limit);
    options.edge_limit = static_cast<size_t>(config_.load_edge_limit);
    options.verbose = config_.verbose;
    return options;
}

size_t KnowledgeGraph::load_from_persistence() {
    return store_.load_from_persistence(load_options());
}

size_t KnowledgeGraph::clear_and_rebuild() {
    return store_.clear_and_rebuild(load_options());
}

bool KnowledgeGraph::delete_node(const std::string& node_id) {
    return store_.delete_node(node_id);
}

bool KnowledgeGraph::delete_edge(
    const std::string& source_id,
    const std::string& target_id,
    RelationshipType relationship
) {
    return store_.delete_edge(source_id, target_id, relationship);
}

void KnowledgeGraph::flush_persistence() {
    store_.flush_persistence();
}

void KnowledgeGraph::export_to_json(const std::string& filename) const {
    store_.export_to_json(filename);
}

} // namespace tg
