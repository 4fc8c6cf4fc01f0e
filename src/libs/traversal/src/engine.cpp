#include <traversal/engine.hpp>
#include <traversal/path_reconstructor.hpp>
#include <traversal/strategies.hpp>
#include <spdlog/spdlog.h>
#include <limits>

namespace traversal {

void TraversalEngine::init(const graph_model::Graph& graph, const std::string& start, const std::string& end) {
    reset();

    state_.start = start;
    state_.end = end;
    state_.adjacency = graph_model::AdjacencyIndex::build(graph);
    for (const auto& n : graph.nodes)
        state_.parents.emplace(n.id, std::nullopt);

    if (!state_.adjacency.contains(start))
        spdlog::debug("traversal_init strategy={} start={} missing; nothing will be finalized", to_string(strategy()), start);
    if (!state_.adjacency.contains(end))
        spdlog::debug("traversal_init strategy={} end={} missing; target is unreachable", to_string(strategy()), end);

    seed(graph);
    state_.initialized = true;
}

std::optional<PathStep> TraversalEngine::step() {
    if (!state_.initialized || state_.complete) return std::nullopt;

    const std::optional<std::string> node = take_next();
    if (!node) {
        state_.complete = true;
        spdlog::debug("traversal_exhausted strategy={} visited={}", to_string(strategy()), state_.visited.size());
        return std::nullopt;
    }

    PathStep out = snapshot(*node);
    if (out.is_complete) {
        state_.complete = true;
        return out;
    }
    expand(*node);
    return out;
}

AlgorithmResult TraversalEngine::run_to_completion() {
    AlgorithmResult out;
    while (auto s = step())
        out.steps.push_back(std::move(*s));

    out.path = final_path();
    out.visited_nodes = state_.visited;
    out.distance = out.path.empty()
        ? std::numeric_limits<double>::infinity()
        : graph_model::path_weight(state_.adjacency, out.path);

    spdlog::debug("traversal_done strategy={} steps={} visited={} path_len={} distance={}",
        to_string(strategy()), out.steps.size(), out.visited_nodes.size(), out.path.size(), out.distance);
    return out;
}

void TraversalEngine::reset() {
    clear_frontier();
    state_ = TraversalState{};
}

NodePath TraversalEngine::final_path() const {
    if (!state_.initialized) return {};
    return reconstruct_path(state_.parents, state_.start, state_.end);
}

PathStep TraversalEngine::snapshot(const std::string& node) const {
    PathStep s;
    s.current_node = node;
    s.visited_nodes = state_.visited;
    s.previous_nodes = state_.parents;
    s.path = reconstruct_path(state_.parents, state_.start, node);
    s.is_complete = node == state_.end;
    return s;
}

std::unique_ptr<TraversalEngine> make_engine(Strategy strategy) {
    switch (strategy) {
    case Strategy::Dijkstra: return std::make_unique<DijkstraEngine>();
    case Strategy::AStar: return std::make_unique<AStarEngine>();
    case Strategy::Bfs: return std::make_unique<BfsEngine>();
    case Strategy::Dfs: return std::make_unique<DfsEngine>();
    }
    return nullptr;
}

AlgorithmResult run(Strategy strategy, const graph_model::Graph& graph,
    const std::string& start, const std::string& end)
{
    auto engine = make_engine(strategy);
    engine->init(graph, start, end);
    return engine->run_to_completion();
}

} // namespace traversal
