#pragma once

#include "graph/graph_store.hpp"
#include <string>
#include <vector>

namespace tg {

using NodePath = std::vector<std::string>;

/**
 * @brief Shortest-path discovery between two nodes, ignoring edge direction
 */
class PathFinder {
public:
    static constexpr size_t kDefaultMaxPaths = 3;

    explicit PathFinder(const GraphStore& store, size_t max_paths = kDefaultMaxPaths)
        : store_(store), max_paths_(max_paths) {}

    /**
     * @brief Up to max_paths shortest paths from start to end
     * @return Paths as node id sequences, all of minimum length; empty when
     *         either node is unknown or they are disconnected
     *
     * Which paths are returned among equally short ones is unspecified.
     */
    std::vector<NodePath> find_paths(const std::string& start, const std::string& end) const;

    size_t max_paths() const { return max_paths_; }

private:
    const GraphStore& store_;
    size_t max_paths_;
};

} // namespace tg
