#ifndef GRAPH_TYPES_HPP
#define GRAPH_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <tuple>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief Kinds of vertices in the threat knowledge graph
 */
enum class NodeType {
    Article,
    Entity,
    Vulnerability,
    ThreatActor,
    Product,
    Technique
};

/**
 * @brief Kinds of directed relationships between nodes
 */
enum class RelationshipType {
    Mentions,
    Exploits,
    RelatedTo,
    EvolvesFrom,
    Targets,
    Uses,
    AttributedTo
};

std::string to_string(NodeType type);
std::string to_string(RelationshipType relationship);

/**
 * @brief Parse a lowercase wire name ("threat_actor", ...)
 * @throws std::invalid_argument for unknown names
 */
NodeType parse_node_type(const std::string& name);

/**
 * @brief Parse a lowercase wire name ("related_to", ...)
 * @throws std::invalid_argument for unknown names
 */
RelationshipType parse_relationship(const std::string& name);

const std::vector<NodeType>& all_node_types();

using Timestamp = std::chrono::system_clock::time_point;

std::string format_timestamp(Timestamp ts);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS" with optional fraction and "Z"/"+00:00" suffix
 * @throws std::invalid_argument when the text is not a timestamp
 */
Timestamp parse_timestamp(const std::string& text);

/**
 * @brief A typed vertex: an article or an entity extracted from one
 *
 * Node ids are stable across restarts. Article nodes reuse the article id,
 * entity nodes use "<type>-<slug(label)>".
 */
struct GraphNode {
    std::string id;                                    // Unique identifier
    NodeType type = NodeType::Entity;                  // Never changes after creation
    std::string label;                                 // Display label
    nlohmann::json properties = nlohmann::json::object();
    double size = 1.0;                                 // Relative size for visualization
    std::optional<std::string> color;                  // Display color override

    nlohmann::json to_json() const;

    /**
     * @brief Create node from JSON ("node_type" or "type" key accepted)
     * @throws std::invalid_argument on unknown node type
     */
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief Uniqueness key of an edge: (source_id, target_id, relationship)
 */
struct EdgeKey {
    std::string source_id;
    std::string target_id;
    RelationshipType relationship = RelationshipType::Mentions;

    bool operator<(const EdgeKey& other) const {
        return std::tie(source_id, target_id, relationship) <
               std::tie(other.source_id, other.target_id, other.relationship);
    }

    bool operator==(const EdgeKey& other) const {
        return source_id == other.source_id &&
               target_id == other.target_id &&
               relationship == other.relationship;
    }
};

/**
 * @brief A directed, weighted, typed relationship between two nodes
 */
struct GraphEdge {
    std::string source_id;
    std::string target_id;
    RelationshipType relationship = RelationshipType::Mentions;
    double weight = 1.0;                               // In [0, 1]
    Timestamp timestamp = std::chrono::system_clock::now();
    nlohmann::json properties = nlohmann::json::object();

    EdgeKey key() const { return {source_id, target_id, relationship}; }

    nlohmann::json to_json() const;

    /**
     * @throws std::invalid_argument on unknown relationship or bad weight
     */
    static GraphEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Reject weights outside [0, 1] and NaN
 * @throws std::invalid_argument
 */
void validate_weight(double weight);

/**
 * @brief Raised when an upsert would change the type of an existing node
 */
class NodeTypeConflict : public std::logic_error {
public:
    NodeTypeConflict(const std::string& node_id, NodeType existing, NodeType requested)
        : std::logic_error("Node " + node_id + " is of type " + to_string(existing) +
                           ", refusing to change it to " + to_string(requested)),
          node_id_(node_id) {}

    const std::string& node_id() const { return node_id_; }

private:
    std::string node_id_;
};

/**
 * @brief Node and edge counts of the in-memory graph
 */
struct GraphStatistics {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    size_t article_nodes = 0;
    size_t entity_nodes = 0;                           // Every non-article node
    std::map<NodeType, size_t> nodes_by_type;

    nlohmann::json to_json() const;
};

} // namespace tg

#endif // GRAPH_TYPES_HPP
