#include <race/race_session.hpp>
#include <spdlog/spdlog.h>
#include <limits>

namespace race {

void RaceSession::start(const graph_model::Graph& graph, const std::string& start_id, const std::string& end_id,
    traversal::Strategy left, traversal::Strategy right)
{
    reset();
    start_id_ = start_id;
    end_id_ = end_id;
    left_strategy_ = left;
    right_strategy_ = right;

    left_engine_ = traversal::make_engine(left);
    right_engine_ = traversal::make_engine(right);
    left_engine_->init(graph, start_id, end_id);
    right_engine_->init(graph, start_id, end_id);

    spdlog::info("race_started left={} right={} start={} end={} fairness={}",
        traversal::to_string(left), traversal::to_string(right), start_id, end_id,
        to_string(rules().fairness));
}

bool RaceSession::advance_side(traversal::TraversalEngine& engine, traversal::AlgorithmResult& result) {
    if (auto s = engine.step()) {
        result.steps.push_back(std::move(*s));
        if (!engine.is_complete()) return false;
    }

    // Terminal: fold the final state into the result once.
    result.path = engine.final_path();
    result.visited_nodes = engine.visited_nodes();
    result.distance = result.path.empty()
        ? std::numeric_limits<double>::infinity()
        : graph_model::path_weight(engine.state().adjacency, result.path);
    return true;
}

bool RaceSession::advance() {
    if (!is_started() || is_finished()) return false;

    if (!left_done_) left_done_ = advance_side(*left_engine_, left_result_);
    if (!right_done_) right_done_ = advance_side(*right_engine_, right_result_);
    ++rounds_;

    if (is_finished()) {
        spdlog::info("race_finished rounds={} left_steps={} right_steps={} verdict={}",
            rounds_, left_result_.steps.size(), right_result_.steps.size(), to_string(verdict()));
    }
    return !is_finished();
}

void RaceSession::run_to_completion() {
    while (advance()) {
    }
}

void RaceSession::reset() {
    left_engine_.reset();
    right_engine_.reset();
    left_result_ = {};
    right_result_ = {};
    start_id_.clear();
    end_id_.clear();
    left_done_ = false;
    right_done_ = false;
    rounds_ = 0;
}

Verdict RaceSession::verdict() const {
    if (!is_finished()) return Verdict::Undecided;
    return judge(left_result_, right_result_, start_id_, end_id_);
}

RaceRules RaceSession::rules() const {
    return classify_race(left_strategy_, right_strategy_);
}

} // namespace race
