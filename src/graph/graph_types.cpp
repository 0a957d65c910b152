#include "graph/graph_types.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tg {

// ==========================================
// Enum Conversions
// ==========================================

std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::Article: return "article";
        case NodeType::Entity: return "entity";
        case NodeType::Vulnerability: return "vulnerability";
        case NodeType::ThreatActor: return "threat_actor";
        case NodeType::Product: return "product";
        case NodeType::Technique: return "technique";
    }
    return "entity";
}

std::string to_string(RelationshipType relationship) {
    switch (relationship) {
        case RelationshipType::Mentions: return "mentions";
        case RelationshipType::Exploits: return "exploits";
        case RelationshipType::RelatedTo: return "related_to";
        case RelationshipType::EvolvesFrom: return "evolves_from";
        case RelationshipType::Targets: return "targets";
        case RelationshipType::Uses: return "uses";
        case RelationshipType::AttributedTo: return "attributed_to";
    }
    return "related_to";
}

NodeType parse_node_type(const std::string& name) {
    static const std::map<std::string, NodeType> lookup = {
        {"article", NodeType::Article},
        {"entity", NodeType::Entity},
        {"vulnerability", NodeType::Vulnerability},
        {"threat_actor", NodeType::ThreatActor},
        {"product", NodeType::Product},
        {"technique", NodeType::Technique}
    };

    auto it = lookup.find(name);
    if (it == lookup.end()) {
        throw std::invalid_argument("Unknown node type: " + name);
    }
    return it->second;
}

RelationshipType parse_relationship(const std::string& name) {
    static const std::map<std::string, RelationshipType> lookup = {
        {"mentions", RelationshipType::Mentions},
        {"exploits", RelationshipType::Exploits},
        {"related_to", RelationshipType::RelatedTo},
        {"evolves_from", RelationshipType::EvolvesFrom},
        {"targets", RelationshipType::Targets},
        {"uses", RelationshipType::Uses},
        {"attributed_to", RelationshipType::AttributedTo}
    };

    auto it = lookup.find(name);
    if (it == lookup.end()) {
        throw std::invalid_argument("Unknown relationship type: " + name);
    }
    return it->second;
}

const std::vector<NodeType>& all_node_types() {
    static const std::vector<NodeType> types = {
        NodeType::Article,
        NodeType::Entity,
        NodeType::Vulnerability,
        NodeType::ThreatActor,
        NodeType::Product,
        NodeType::Technique
    };
    return types;
}

// ==========================================
// Timestamps
// ==========================================

std::string format_timestamp(Timestamp ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_utc{};
    gmtime_r(&time, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

Timestamp parse_timestamp(const std::string& text) {
    std::tm tm_utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }

    // Fractional seconds and the UTC suffix carry no extra information here
    return std::chrono::system_clock::from_time_t(timegm(&tm_utc));
}

void validate_weight(double weight) {
    if (std::isnan(weight) || weight < 0.0 || weight > 1.0) {
        throw std::invalid_argument("Edge weight must be in [0, 1], got " +
                                    std::to_string(weight));
    }
}

// ==========================================
// GraphNode
// ==========================================

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["node_type"] = to_string(type);
    j["label"] = label;
    j["properties"] = properties;
    j["size"] = size;
    if (color.has_value()) {
        j["color"] = color.value();
    }
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.at("id").get<std::string>();

    if (j.contains("node_type")) {
        node.type = parse_node_type(j["node_type"].get<std::string>());
    } else {
        node.type = parse_node_type(j.at("type").get<std::string>());
    }

    node.label = j.value("label", node.id);
    node.size = j.value("size", 1.0);

    if (j.contains("properties") && j["properties"].is_object()) {
        node.properties = j["properties"];
    }
    if (j.contains("color") && j["color"].is_string()) {
        node.color = j["color"].get<std::string>();
    }

    return node;
}

// ==========================================
// GraphEdge
// ==========================================

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    j["source_id"] = source_id;
    j["target_id"] = target_id;
    j["relationship"] = to_string(relationship);
    j["weight"] = weight;
    j["timestamp"] = format_timestamp(timestamp);
    if (!properties.empty()) {
        j["properties"] = properties;
    }
    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.source_id = j.at("source_id").get<std::string>();
    edge.target_id = j.at("target_id").get<std::string>();
    edge.relationship = parse_relationship(j.at("relationship").get<std::string>());
    edge.weight = j.value("weight", 1.0);
    validate_weight(edge.weight);

    if (j.contains("timestamp")) {
        edge.timestamp = parse_timestamp(j["timestamp"].get<std::string>());
    }
    if (j.contains("properties") && j["properties"].is_object()) {
        edge.properties = j["properties"];
    }

    return edge;
}

// ==========================================
// GraphStatistics
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["total_nodes"] = total_nodes;
    j["total_edges"] = total_edges;
    j["article_nodes"] = article_nodes;
    j["entity_nodes"] = entity_nodes;

    nlohmann::json by_type = nlohmann::json::object();
    for (const auto& [type, count] : nodes_by_type) {
        by_type[to_string(type)] = count;
    }
    j["nodes_by_type"] = by_type;

    return j;
}

} // namespace tg
