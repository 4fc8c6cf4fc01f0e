#pragma once

#include <graph_model/types.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace graph_model {

struct Neighbor {
    std::string node_id;
    int weight = 1;
};

// Per-run neighbor lists. Built symmetric from the edge list; edges naming an
// unknown node are dropped instead of failing.
class AdjacencyIndex {
public:
    AdjacencyIndex() = default;

    static AdjacencyIndex build(const Graph& graph);

    const std::vector<Neighbor>& neighbors(const std::string& node_id) const;
    bool contains(const std::string& node_id) const;
    std::size_t node_count() const { return lists_.size(); }
    std::size_t dropped_edges() const { return dropped_edges_; }

    void clear();

private:
    std::unordered_map<std::string, std::vector<Neighbor>> lists_;
    std::size_t dropped_edges_ = 0;
};

// Sum of hop weights along path. Hops without an edge add nothing.
double path_weight(const AdjacencyIndex& index, const std::vector<std::string>& path);

} // namespace graph_model
