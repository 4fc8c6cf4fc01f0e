#include <traversal/types.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace traversal {

const char* to_string(Strategy strategy) {
    switch (strategy) {
    case Strategy::Dijkstra: return "dijkstra";
    case Strategy::AStar: return "astar";
    case Strategy::Bfs: return "bfs";
    case Strategy::Dfs: return "dfs";
    }
    return "unknown";
}

const char* display_name(Strategy strategy) {
    switch (strategy) {
    case Strategy::Dijkstra: return "Dijkstra's Algorithm";
    case Strategy::AStar: return "A* Algorithm";
    case Strategy::Bfs: return "Breadth-First Search";
    case Strategy::Dfs: return "Depth-First Search";
    }
    return "Unknown";
}

std::optional<Strategy> parse_strategy(std::string_view name) {
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "dijkstra") return Strategy::Dijkstra;
    if (s == "astar" || s == "a*" || s == "a-star") return Strategy::AStar;
    if (s == "bfs") return Strategy::Bfs;
    if (s == "dfs") return Strategy::Dfs;
    return std::nullopt;
}

bool is_optimal(Strategy strategy) {
    return strategy == Strategy::Dijkstra || strategy == Strategy::AStar;
}

} // namespace traversal
