#pragma once

#include "graph/graph_store.hpp"
#include "linker/article.hpp"
#include <string>
#include <utility>
#include <vector>

namespace tg {

/**
 * @brief Connects articles to the entities extracted from them
 *
 * Entity ids are derived from the entity's type and name only, so every
 * article naming "CVE-2025-1111" links to the same vulnerability node.
 * Distinct names that slug identically (e.g. "Lazarus Group" and
 * "lazarus-group") share one node.
 */
class EntityLinker {
public:
    explicit EntityLinker(GraphStore& store) : store_(store) {}

    /**
     * @brief Upsert the article node, its entity nodes and MENTIONS edges
     * @return The article node
     *
     * Re-linking the same article adds no nodes or edges.
     */
    GraphNode link_article(const Article& article);

    /**
     * @brief Add RELATED_TO edges from article to each similar article
     * @param similar (other article, similarity score in [0, 1]) pairs
     * @return Number of edges written
     *
     * Ids of connected articles are appended to article.related_article_ids.
     */
    size_t connect_similar_articles(
        Article& article,
        const std::vector<std::pair<Article, double>>& similar
    );

    /**
     * @brief Lowercase and replace spaces with hyphens
     */
    static std::string slugify(const std::string& name);

    /**
     * @brief "<type>-<slug(name)>", e.g. "vulnerability-cve-2025-1111"
     */
    static std::string entity_node_id(NodeType type, const std::string& name);

    /**
     * @brief Title shortened to 50 characters plus "..." when longer
     */
    static std::string article_label(const std::string& title);

    static constexpr size_t kMaxLabelLength = 50;
    static constexpr double kArticleNodeSize = 1.5;
    static constexpr double kEntityNodeSize = 1.0;

private:
    GraphStore& store_;

    void link_entities(
        const std::string& article_id,
        const std::vector<std::string>& names,
        NodeType type
    );
};

} // namespace tg
