#include <graph_model/adjacency.hpp>
#include <optional>
#include <spdlog/spdlog.h>

namespace graph_model {

namespace {

const std::vector<Neighbor> empty_neighbors;

} // namespace

AdjacencyIndex AdjacencyIndex::build(const Graph& graph) {
    AdjacencyIndex out;
    out.lists_.reserve(graph.nodes.size());
    for (const auto& n : graph.nodes)
        out.lists_.try_emplace(n.id);

    for (const auto& e : graph.edges) {
        auto it_from = out.lists_.find(e.from);
        auto it_to = out.lists_.find(e.to);
        if (it_from == out.lists_.end() || it_to == out.lists_.end()) {
            ++out.dropped_edges_;
            spdlog::warn("adjacency_dropped_edge from={} to={} weight={}", e.from, e.to, e.weight);
            continue;
        }
        it_from->second.push_back(Neighbor{ e.to, e.weight });
        it_to->second.push_back(Neighbor{ e.from, e.weight });
    }

    spdlog::debug("adjacency_built nodes={} edges={} dropped={}",
        graph.nodes.size(), graph.edges.size(), out.dropped_edges_);
    return out;
}

const std::vector<Neighbor>& AdjacencyIndex::neighbors(const std::string& node_id) const {
    auto it = lists_.find(node_id);
    if (it == lists_.end()) return empty_neighbors;
    return it->second;
}

bool AdjacencyIndex::contains(const std::string& node_id) const {
    return lists_.find(node_id) != lists_.end();
}

void AdjacencyIndex::clear() {
    lists_.clear();
    dropped_edges_ = 0;
}

double path_weight(const AdjacencyIndex& index, const std::vector<std::string>& path) {
    double total = 0;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        // Parallel edges: the cheapest one is the hop's weight.
        std::optional<int> hop;
        for (const auto& nb : index.neighbors(path[i])) {
            if (nb.node_id == path[i + 1] && (!hop || nb.weight < *hop))
                hop = nb.weight;
        }
        if (hop) total += *hop;
    }
    return total;
}

} // namespace graph_model
