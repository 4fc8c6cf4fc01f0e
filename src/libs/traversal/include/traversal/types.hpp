#pragma once

#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace traversal {

enum class Strategy { Dijkstra, AStar, Bfs, Dfs };

// Every graph node has an entry; an empty optional means "no parent yet".
using ParentMap = std::map<std::string, std::optional<std::string>>;
using VisitedSet = std::set<std::string>;
using NodePath = std::vector<std::string>;

// One finalized node. Holds copies of the traversal state at emission time,
// never references into the live engine.
struct PathStep {
    std::string current_node;
    VisitedSet visited_nodes;
    ParentMap previous_nodes;
    NodePath path;
    bool is_complete = false;

    bool operator==(const PathStep&) const = default;
};

struct AlgorithmResult {
    NodePath path;                  // empty when the target was not reached
    std::vector<PathStep> steps;
    VisitedSet visited_nodes;
    double distance = std::numeric_limits<double>::infinity();

    bool operator==(const AlgorithmResult&) const = default;
};

const char* to_string(Strategy strategy);
const char* display_name(Strategy strategy);
std::optional<Strategy> parse_strategy(std::string_view name);

// Dijkstra and A* guarantee a minimum-weight path; BFS and DFS ignore weights.
bool is_optimal(Strategy strategy);

} // namespace traversal
