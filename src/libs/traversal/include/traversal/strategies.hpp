#pragma once

#include <traversal/engine.hpp>
#include <traversal/priority_frontier.hpp>
#include <deque>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace traversal {

// Euclidean distance is divided by this before being used as the A* estimate.
constexpr double kHeuristicScale = 20.0;

// Dijkstra: frontier keyed by cumulative distance, lazy invalidation of stale
// entries, node marked visited when popped.
class DijkstraEngine : public TraversalEngine {
public:
    Strategy strategy() const override { return Strategy::Dijkstra; }

    double distance_to(const std::string& node) const;

protected:
    void seed(const graph_model::Graph& graph) override;
    std::optional<std::string> take_next() override;
    void expand(const std::string& node) override;
    void clear_frontier() override;

    // Estimated remaining cost from node to the target. Zero for Dijkstra.
    virtual double heuristic(const std::string& node) const;
    virtual void prepare_heuristic(const graph_model::Graph& graph);

private:
    double score_of(const std::unordered_map<std::string, double>& scores, const std::string& node) const;

    std::unordered_map<std::string, double> g_score_;
    std::unordered_map<std::string, double> f_score_;
    PriorityFrontier<std::string> frontier_;
};

// A*: Dijkstra ordered by distance + straight-line estimate to the target.
class AStarEngine : public DijkstraEngine {
public:
    Strategy strategy() const override { return Strategy::AStar; }

protected:
    double heuristic(const std::string& node) const override;
    void prepare_heuristic(const graph_model::Graph& graph) override;
    void clear_frontier() override;

private:
    std::unordered_map<std::string, std::pair<double, double>> positions_;
};

// BFS: start pre-marked visited; neighbors marked visited and parented when
// enqueued, so nothing is queued twice. Weights are ignored.
class BfsEngine : public TraversalEngine {
public:
    Strategy strategy() const override { return Strategy::Bfs; }

protected:
    void seed(const graph_model::Graph& graph) override;
    std::optional<std::string> take_next() override;
    void expand(const std::string& node) override;
    void clear_frontier() override;

private:
    std::deque<std::string> queue_;
};

// DFS: LIFO frontier, visited on pop. A neighbor's parent is assigned the
// first time any node discovers it and is never reassigned, even if the
// neighbor is later reached through another node.
class DfsEngine : public TraversalEngine {
public:
    Strategy strategy() const override { return Strategy::Dfs; }

protected:
    void seed(const graph_model::Graph& graph) override;
    std::optional<std::string> take_next() override;
    void expand(const std::string& node) override;
    void clear_frontier() override;

private:
    std::vector<std::string> stack_;
};

} // namespace traversal
