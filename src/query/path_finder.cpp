#include "query/path_finder.hpp"
#include <map>
#include <queue>

namespace tg {

namespace {

/**
 * Walk the shortest-path parent DAG from end back to start, emitting at most
 * limit complete paths.
 */
void collect_paths(
    const std::string& current,
    const std::string& start,
    const std::map<std::string, std::vector<std::string>>& parents,
    NodePath& reversed,
    std::vector<NodePath>& out,
    size_t limit
) {
    if (out.size() >= limit) return;

    reversed.push_back(current);

    if (current == start) {
        out.emplace_back(reversed.rbegin(), reversed.rend());
    } else {
        auto it = parents.find(current);
        if (it != parents.end()) {
            for (const auto& parent : it->second) {
                collect_paths(parent, start, parents, reversed, out, limit);
                if (out.size() >= limit) break;
            }
        }
    }

    reversed.pop_back();
}

} // namespace

std::vector<NodePath> PathFinder::find_paths(const std::string& start, const std::string& end) const {
    std::vector<NodePath> paths;
    if (max_paths_ == 0) {
        return paths;
    }

    store_.read([&](const GraphIndex& graph) {
        if (!graph.has_node(start) || !graph.has_node(end)) {
            return;
        }

        // BFS layering over the undirected view; every node keeps all parents
        // one layer closer to start so all shortest paths can be enumerated
        std::map<std::string, size_t> distance = {{start, 0}};
        std::map<std::string, std::vector<std::string>> parents;
        std::queue<std::string> queue;
        queue.push(start);

        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop();

            size_t current_distance = distance[current];

            // Nodes beyond the target's layer cannot be on a shortest path
            auto end_it = distance.find(end);
            if (end_it != distance.end() && current_distance >= end_it->second) {
                continue;
            }

            for (const auto& neighbor : graph.neighbors(current)) {
                auto it = distance.find(neighbor);
                if (it == distance.end()) {
                    distance[neighbor] = current_distance + 1;
                    parents[neighbor].push_back(current);
                    queue.push(neighbor);
                } else if (it->second == current_distance + 1) {
                    parents[neighbor].push_back(current);
                }
            }
        }

        if (distance.find(end) == distance.end()) {
            return;
        }

        NodePath reversed;
        collect_paths(end, start, parents, reversed, paths, max_paths_);
    });

    return paths;
}

} // namespace tg
