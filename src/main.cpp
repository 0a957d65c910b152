#include "cli/cli.hpp"
#include "config/engine_config.hpp"
#include "engine/knowledge_graph.hpp"
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

using namespace tg;
using json = nlohmann::json;

// ============== Helper Functions ==============

// Resolve config from --config, then apply per-invocation overrides
EngineConfig resolve_config(const Args& args) {
    EngineConfig config = load_config(args.get("config"));

    if (args.has("db")) {
        config.database_path = args.require("db");
    }
    if (args.has("verbose")) {
        config.verbose = true;
    }

    // A short-lived process must not exit with writes still queued
    config.async_persistence = false;

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    return config;
}

std::vector<std::pair<std::string, std::pair<std::string, double>>> load_similarities(
    const std::string& path
) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open similarity file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw std::runtime_error("Similarity file must contain a JSON array: " + path);
    }

    std::vector<std::pair<std::string, std::pair<std::string, double>>> result;
    for (const auto& item : j) {
        result.push_back({
            item.at("source").get<std::string>(),
            {item.at("target").get<std::string>(), item.at("score").get<double>()}
        });
    }
    return result;
}

void print_json(const json& j) {
    std::cout << j.dump(2) << "\n";
}

// Report mirror failures so a partially persisted ingest is visible
int finish(KnowledgeGraph& graph) {
    graph.flush_persistence();
    auto mirror = graph.store().mirror();
    if (mirror && mirror->stats().failed > 0) {
        std::cerr << "Warning: " << mirror->stats().failed
                  << " write(s) failed to reach the database\n";
        return 1;
    }
    return 0;
}

// ============== threatgraph ingest ==============
int cmd_ingest(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    std::string articles_path = args.require("articles");
    auto articles = Article::load_from_json(articles_path);
    if (config.verbose) {
        std::cerr << "Ingesting " << articles.size() << " article(s) from " << articles_path << "\n";
    }

    std::map<std::string, Article> by_id;
    for (const auto& article : articles) {
        graph.add_article_node(article);
        by_id[article.id] = article;
    }

    size_t related_edges = 0;
    if (args.has("similar")) {
        for (const auto& [source_id, target] : load_similarities(args.require("similar"))) {
            auto it = by_id.find(source_id);
            Article source = it != by_id.end() ? it->second : Article{};
            source.id = source_id;

            auto other_it = by_id.find(target.first);
            Article other = other_it != by_id.end() ? other_it->second : Article{};
            other.id = target.first;

            std::vector<std::pair<Article, double>> similar = {{other, target.second}};
            related_edges += graph.connect_similar_articles(source, similar);
        }
    }

    int status = finish(graph);

    json out;
    out["articles"] = articles.size();
    out["related_edges"] = related_edges;
    out["statistics"] = graph.get_statistics().to_json();
    print_json(out);
    return status;
}

// ============== threatgraph subgraph ==============
int cmd_subgraph(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    std::string focus = args.require("focus");
    int depth = args.get_int("depth", config.default_depth);
    std::string format = args.get("format");

    auto view = graph.get_subgraph(focus, depth);
    if (format == "visjs") {
        print_json(view.to_vis_js_json());
    } else if (format == "json") {
        print_json(view.to_json());
    } else {
        throw std::runtime_error("Unknown format: " + format + " (expected json or visjs)");
    }
    return 0;
}

// ============== threatgraph paths ==============
int cmd_paths(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    auto paths = graph.find_paths(args.require("from"), args.require("to"));
    print_json({{"paths", paths}});
    return 0;
}

// ============== threatgraph context ==============
int cmd_context(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    print_json(graph.get_prediction_context(args.require("article")).to_json());
    return 0;
}

// ============== threatgraph connections ==============
int cmd_connections(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    print_json(graph.get_article_connections(args.require("article")).to_json());
    return 0;
}

// ============== threatgraph stats ==============
int cmd_stats(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    print_json(graph.get_statistics().to_json());
    return 0;
}

// ============== threatgraph export ==============
int cmd_export(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    std::string output = args.require("output");
    graph.export_to_json(output);

    auto stats = graph.get_statistics();
    print_json({
        {"output", output},
        {"total_nodes", stats.total_nodes},
        {"total_edges", stats.total_edges}
    });
    return 0;
}

// ============== threatgraph delete-node ==============
int cmd_delete_node(const Args& args) {
    EngineConfig config = resolve_config(args);
    KnowledgeGraph graph(config);
    graph.load_from_persistence();

    std::string node_id = args.require("id");
    bool deleted = graph.delete_node(node_id);
    int status = finish(graph);

    print_json({{"id", node_id}, {"deleted", deleted}});
    return status;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("threatgraph", "1.0.0");

    cli.add_shared_option({"db", "SQLite database path (overrides config)", "", false, false});
    cli.add_shared_option({"config", "Engine config JSON file", "", false, false});
    cli.add_shared_option({"verbose", "Log progress to stderr", "", false, true});

    // threatgraph ingest
    cli.register_command({
        "ingest",
        "Link articles and their entities into the graph",
        {
            {"articles", "Articles JSON file (object or array)", "", true, false},
            {"similar", "Similarity JSON array of {source, target, score}", "", false, false}
        },
        cmd_ingest
    });

    // threatgraph subgraph
    cli.register_command({
        "subgraph",
        "Extract the neighborhood around a node",
        {
            {"focus", "Focus node id", "", true, false},
            {"depth", "Traversal depth 1-5 (default from config)", "", false, false},
            {"format", "Output format: json or visjs", "json", false, false}
        },
        cmd_subgraph
    });

    // threatgraph paths
    cli.register_command({
        "paths",
        "List shortest paths between two nodes",
        {
            {"from", "Start node id", "", true, false},
            {"to", "End node id", "", true, false}
        },
        cmd_paths
    });

    // threatgraph context
    cli.register_command({
        "context",
        "Print the prediction context of an article",
        {
            {"article", "Article id", "", true, false}
        },
        cmd_context
    });

    // threatgraph connections
    cli.register_command({
        "connections",
        "List articles and entities an article points at",
        {
            {"article", "Article id", "", true, false}
        },
        cmd_connections
    });

    // threatgraph stats
    cli.register_command({
        "stats",
        "Print node and edge counts",
        {},
        cmd_stats
    });

    // threatgraph export
    cli.register_command({
        "export",
        "Write the whole graph to a JSON file",
        {
            {"output", "Output JSON path", "", true, false}
        },
        cmd_export
    });

    // threatgraph delete-node
    cli.register_command({
        "delete-node",
        "Delete a node and every edge touching it",
        {
            {"id", "Node id", "", true, false}
        },
        cmd_delete_node
    });

    return cli.run(argc, argv);
}
