#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief An ingested security-news article and the entities extracted from it
 */
struct Article {
    std::string id;                                    ///< Stable article identifier
    std::string title;
    std::string url;
    std::string published_at;                          ///< ISO-8601 timestamp
    std::vector<std::string> categories;
    std::vector<std::string> threat_actors;
    std::vector<std::string> vulnerabilities;
    std::vector<std::string> related_article_ids;      ///< Filled by similarity linking

    nlohmann::json to_json() const;

    /**
     * @brief Create article from JSON; "id" is required, everything else optional
     */
    static Article from_json(const nlohmann::json& j);

    /**
     * @brief Load articles from a file holding one object or an array of them
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static std::vector<Article> load_from_json(const std::string& filename);
};

} // namespace tg
