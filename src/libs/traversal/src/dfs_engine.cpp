#include <traversal/strategies.hpp>

namespace traversal {

void DfsEngine::seed(const graph_model::Graph& graph) {
    (void)graph;
    if (!state_.adjacency.contains(state_.start)) return;
    stack_.push_back(state_.start);
}

std::optional<std::string> DfsEngine::take_next() {
    while (!stack_.empty()) {
        std::string node = std::move(stack_.back());
        stack_.pop_back();
        if (!state_.visited.insert(node).second) continue;
        return node;
    }
    return std::nullopt;
}

void DfsEngine::expand(const std::string& node) {
    // Pushed in reverse so the first listed neighbor is explored first.
    const auto& neighbors = state_.adjacency.neighbors(node);
    for (auto it = neighbors.rbegin(); it != neighbors.rend(); ++it) {
        if (state_.visited.count(it->node_id)) continue;
        auto parent = state_.parents.find(it->node_id);
        if (parent == state_.parents.end() || parent->second) continue;
        parent->second = node;
        stack_.push_back(it->node_id);
    }
}

void DfsEngine::clear_frontier() {
    stack_.clear();
}

} // namespace traversal
