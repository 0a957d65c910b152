#include "linker/entity_linker.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace tg {

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

GraphNode EntityLinker::link_article(const Article& article) {
    GraphNode node;
    node.id = article.id;
    node.type = NodeType::Article;
    node.label = article_label(article.title);
    node.properties = {
        {"url", article.url},
        {"published_at", article.published_at},
        {"categories", article.categories}
    };
    node.size = kArticleNodeSize;

    store_.upsert_node(node);

    link_entities(article.id, article.vulnerabilities, NodeType::Vulnerability);
    link_entities(article.id, article.threat_actors, NodeType::ThreatActor);
    link_entities(article.id, article.categories, NodeType::Entity);

    return node;
}

size_t EntityLinker::connect_similar_articles(
    Article& article,
    const std::vector<std::pair<Article, double>>& similar
) {
    // Reject the whole batch before any edge is written
    for (const auto& entry : similar) {
        validate_weight(entry.second);
    }

    size_t connected = 0;

    for (const auto& [other, similarity] : similar) {
        if (!store_.upsert_edge(article.id, other.id, RelationshipType::RelatedTo, similarity)) {
            continue;
        }
        connected++;

        auto& related = article.related_article_ids;
        if (std::find(related.begin(), related.end(), other.id) == related.end()) {
            related.push_back(other.id);
        }
    }

    return connected;
}

void EntityLinker::link_entities(
    const std::string& article_id,
    const std::vector<std::string>& names,
    NodeType type
) {
    std::set<std::string> seen;

    for (const auto& name : names) {
        if (is_blank(name)) continue;

        std::string entity_id = entity_node_id(type, name);
        if (!seen.insert(entity_id).second) continue;

        GraphNode entity;
        entity.id = entity_id;
        entity.type = type;
        entity.label = name;
        entity.size = kEntityNodeSize;

        // Existing entity nodes keep the label of the article that introduced them
        store_.insert_node_if_absent(entity);
        store_.upsert_edge(article_id, entity_id, RelationshipType::Mentions, 1.0);
    }
}

std::string EntityLinker::slugify(const std::string& name) {
    std::string result;
    result.reserve(name.size());

    for (unsigned char c : name) {
        if (c == ' ') {
            result += '-';
        } else {
            result += static_cast<char>(std::tolower(c));
        }
    }

    return result;
}

std::string EntityLinker::entity_node_id(NodeType type, const std::string& name) {
    return to_string(type) + "-" + slugify(name);
}

std::string EntityLinker::article_label(const std::string& title) {
    // Count code points, not bytes, so a UTF-8 sequence is never split
    size_t code_points = 0;
    for (size_t i = 0; i < title.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(title[i]);
        if ((c & 0xC0) == 0x80) continue;
        if (code_points == kMaxLabelLength) {
            return title.substr(0, i) + "...";
        }
        code_points++;
    }
    return title;
}

} // namespace tg
