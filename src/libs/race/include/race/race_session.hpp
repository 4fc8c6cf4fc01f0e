#pragma once

#include <graph_model/types.hpp>
#include <race/race_judge.hpp>
#include <traversal/engine.hpp>
#include <memory>
#include <string>

namespace race {

// Two independent engines advanced in lockstep, one step per side per
// advance(). Each side keeps its own state; nothing is shared between them.
class RaceSession {
public:
    RaceSession() = default;

    void start(const graph_model::Graph& graph, const std::string& start_id, const std::string& end_id,
        traversal::Strategy left, traversal::Strategy right);

    // Returns false once both sides are terminal.
    bool advance();
    void run_to_completion();
    void reset();

    bool is_started() const { return left_engine_ != nullptr; }
    bool is_finished() const { return left_done_ && right_done_; }
    std::size_t rounds() const { return rounds_; }

    // Undecided until both sides are terminal.
    Verdict verdict() const;
    RaceRules rules() const;

    const traversal::AlgorithmResult& left_result() const { return left_result_; }
    const traversal::AlgorithmResult& right_result() const { return right_result_; }
    traversal::Strategy left_strategy() const { return left_strategy_; }
    traversal::Strategy right_strategy() const { return right_strategy_; }

private:
    static bool advance_side(traversal::TraversalEngine& engine, traversal::AlgorithmResult& result);

    std::unique_ptr<traversal::TraversalEngine> left_engine_;
    std::unique_ptr<traversal::TraversalEngine> right_engine_;
    traversal::AlgorithmResult left_result_;
    traversal::AlgorithmResult right_result_;
    traversal::Strategy left_strategy_ = traversal::Strategy::Dijkstra;
    traversal::Strategy right_strategy_ = traversal::Strategy::Bfs;
    std::string start_id_;
    std::string end_id_;
    bool left_done_ = false;
    bool right_done_ = false;
    std::size_t rounds_ = 0;
};

} // namespace race
