#pragma once

#include <graph_model/adjacency.hpp>
#include <graph_model/types.hpp>
#include <traversal/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace traversal {

// Mutable state of one traversal run. Owned by exactly one engine.
struct TraversalState {
    std::string start;
    std::string end;
    graph_model::AdjacencyIndex adjacency;
    ParentMap parents;
    VisitedSet visited;
    bool initialized = false;
    bool complete = false;
};

// Shared contract of the four strategies. step() finalizes exactly one node
// and returns its snapshot, or an empty optional once the target has been
// finalized or the frontier is exhausted. Further calls keep returning empty.
// run_to_completion() is step() in a loop and yields the same snapshots.
//
// A start id that is not in the graph leaves the frontier empty: the run ends
// on the first step with no snapshots and an empty path.
class TraversalEngine {
public:
    virtual ~TraversalEngine() = default;

    void init(const graph_model::Graph& graph, const std::string& start, const std::string& end);
    std::optional<PathStep> step();
    AlgorithmResult run_to_completion();
    void reset();

    bool is_initialized() const { return state_.initialized; }
    bool is_complete() const { return state_.complete; }
    const TraversalState& state() const { return state_; }
    const VisitedSet& visited_nodes() const { return state_.visited; }
    NodePath final_path() const;

    virtual Strategy strategy() const = 0;

protected:
    TraversalEngine() = default;

    // Seeds the frontier. Called after the adjacency index and parent map exist.
    virtual void seed(const graph_model::Graph& graph) = 0;
    // Pops until a node is ready to be finalized; marks it visited where the
    // strategy does so on pop. Empty when the frontier is exhausted.
    virtual std::optional<std::string> take_next() = 0;
    // Pushes the neighbors of a freshly finalized node.
    virtual void expand(const std::string& node) = 0;
    virtual void clear_frontier() = 0;

    TraversalState state_;

private:
    PathStep snapshot(const std::string& node) const;
};

std::unique_ptr<TraversalEngine> make_engine(Strategy strategy);

// One-shot batch run.
AlgorithmResult run(Strategy strategy, const graph_model::Graph& graph,
    const std::string& start, const std::string& end);

} // namespace traversal
