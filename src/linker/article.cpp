#include "linker/article.hpp"
#include <fstream>
#include <stdexcept>

namespace tg {

namespace {

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array()) {
        return {};
    }
    std::vector<std::string> result;
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

} // namespace

nlohmann::json Article::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["title"] = title;
    j["url"] = url;
    j["published_at"] = published_at;
    j["categories"] = categories;
    j["threat_actors"] = threat_actors;
    j["vulnerabilities"] = vulnerabilities;
    j["related_article_ids"] = related_article_ids;
    return j;
}

Article Article::from_json(const nlohmann::json& j) {
    Article article;
    article.id = j.at("id").get<std::string>();
    article.title = j.value("title", article.id);
    article.url = j.value("url", "");
    article.published_at = j.value("published_at", "");
    article.categories = string_list(j, "categories");
    article.threat_actors = string_list(j, "threat_actors");
    article.vulnerabilities = string_list(j, "vulnerabilities");
    article.related_article_ids = string_list(j, "related_article_ids");
    return article;
}

std::vector<Article> Article::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open articles file: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in " + filename + ": " + e.what());
    }

    std::vector<Article> articles;
    if (j.is_array()) {
        for (const auto& item : j) {
            articles.push_back(from_json(item));
        }
    } else {
        articles.push_back(from_json(j));
    }
    return articles;
}

} // namespace tg
