#include <traversal/strategies.hpp>
#include <cmath>
#include <limits>

namespace traversal {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

} // namespace

double DijkstraEngine::distance_to(const std::string& node) const {
    return score_of(g_score_, node);
}

double DijkstraEngine::score_of(const std::unordered_map<std::string, double>& scores, const std::string& node) const {
    auto it = scores.find(node);
    return it == scores.end() ? kInfinity : it->second;
}

void DijkstraEngine::seed(const graph_model::Graph& graph) {
    prepare_heuristic(graph);
    for (const auto& n : graph.nodes) {
        g_score_[n.id] = kInfinity;
        f_score_[n.id] = kInfinity;
    }
    if (!state_.adjacency.contains(state_.start)) return;

    g_score_[state_.start] = 0;
    f_score_[state_.start] = heuristic(state_.start);
    frontier_.push(f_score_[state_.start], state_.start);
}

std::optional<std::string> DijkstraEngine::take_next() {
    while (auto entry = frontier_.pop()) {
        if (state_.visited.count(entry->item)) continue;
        if (entry->score > score_of(f_score_, entry->item)) continue; // stale
        state_.visited.insert(entry->item);
        return std::move(entry->item);
    }
    return std::nullopt;
}

void DijkstraEngine::expand(const std::string& node) {
    const double base = score_of(g_score_, node);
    for (const auto& nb : state_.adjacency.neighbors(node)) {
        if (state_.visited.count(nb.node_id)) continue;
        const double candidate = base + nb.weight;
        if (candidate < score_of(g_score_, nb.node_id)) {
            g_score_[nb.node_id] = candidate;
            state_.parents[nb.node_id] = node;
            const double f = candidate + heuristic(nb.node_id);
            f_score_[nb.node_id] = f;
            frontier_.push(f, nb.node_id);
        }
    }
}

void DijkstraEngine::clear_frontier() {
    g_score_.clear();
    f_score_.clear();
    frontier_.clear();
}

double DijkstraEngine::heuristic(const std::string& node) const {
    (void)node;
    return 0;
}

void DijkstraEngine::prepare_heuristic(const graph_model::Graph& graph) {
    (void)graph;
}

double AStarEngine::heuristic(const std::string& node) const {
    auto it_node = positions_.find(node);
    auto it_target = positions_.find(state_.end);
    if (it_node == positions_.end() || it_target == positions_.end()) return 0;
    const double dx = it_node->second.first - it_target->second.first;
    const double dy = it_node->second.second - it_target->second.second;
    return std::sqrt(dx * dx + dy * dy) / kHeuristicScale;
}

void AStarEngine::prepare_heuristic(const graph_model::Graph& graph) {
    positions_.clear();
    for (const auto& n : graph.nodes)
        positions_.emplace(n.id, std::make_pair(n.x, n.y));
}

void AStarEngine::clear_frontier() {
    DijkstraEngine::clear_frontier();
    positions_.clear();
}

} // namespace traversal
