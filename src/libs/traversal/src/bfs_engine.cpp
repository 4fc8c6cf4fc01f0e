#include <traversal/strategies.hpp>

namespace traversal {

void BfsEngine::seed(const graph_model::Graph& graph) {
    (void)graph;
    if (!state_.adjacency.contains(state_.start)) return;
    state_.visited.insert(state_.start);
    queue_.push_back(state_.start);
}

std::optional<std::string> BfsEngine::take_next() {
    if (queue_.empty()) return std::nullopt;
    std::string node = std::move(queue_.front());
    queue_.pop_front();
    return node;
}

void BfsEngine::expand(const std::string& node) {
    for (const auto& nb : state_.adjacency.neighbors(node)) {
        if (!state_.visited.insert(nb.node_id).second) continue;
        state_.parents[nb.node_id] = node;
        queue_.push_back(nb.node_id);
    }
}

void BfsEngine::clear_frontier() {
    queue_.clear();
}

} // namespace traversal
