#include <race/race_judge.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace race {

const char* to_string(Verdict verdict) {
    switch (verdict) {
    case Verdict::Undecided: return "undecided";
    case Verdict::Left: return "left";
    case Verdict::Right: return "right";
    case Verdict::Tie: return "tie";
    }
    return "undecided";
}

const char* to_string(Fairness fairness) {
    switch (fairness) {
    case Fairness::Fair: return "fair";
    case Fairness::Educational: return "educational";
    case Fairness::Unweighted: return "unweighted";
    }
    return "fair";
}

bool found_path(const traversal::AlgorithmResult& result, const std::string& start, const std::string& end) {
    return !result.path.empty() && result.path.front() == start && result.path.back() == end;
}

std::optional<std::size_t> completion_step(const traversal::AlgorithmResult& result) {
    auto it = std::find_if(result.steps.begin(), result.steps.end(),
        [](const traversal::PathStep& s) { return s.is_complete; });
    if (it == result.steps.end()) return std::nullopt;
    return static_cast<std::size_t>(it - result.steps.begin());
}

Verdict judge(const traversal::AlgorithmResult& left, const traversal::AlgorithmResult& right,
    const std::string& start, const std::string& end)
{
    const bool left_found = found_path(left, start, end);
    const bool right_found = found_path(right, start, end);

    if (left_found != right_found) return left_found ? Verdict::Left : Verdict::Right;
    if (!left_found) return Verdict::Tie;

    const auto left_finish = completion_step(left);
    const auto right_finish = completion_step(right);
    if (left_finish && right_finish && *left_finish != *right_finish)
        return *left_finish < *right_finish ? Verdict::Left : Verdict::Right;

    const std::size_t left_visited = left.visited_nodes.size();
    const std::size_t right_visited = right.visited_nodes.size();
    if (left_visited != right_visited)
        return left_visited < right_visited ? Verdict::Left : Verdict::Right;

    return Verdict::Tie;
}

Verdict judge_at(const traversal::AlgorithmResult& left, const traversal::AlgorithmResult& right,
    const std::string& start, const std::string& end, std::size_t cursor)
{
    const std::size_t max_steps = std::max(left.steps.size(), right.steps.size());
    if (cursor + 1 < max_steps) return Verdict::Undecided;
    const Verdict v = judge(left, right, start, end);
    spdlog::debug("race_judged cursor={} max_steps={} verdict={}", cursor, max_steps, to_string(v));
    return v;
}

RaceRules classify_race(traversal::Strategy left, traversal::Strategy right) {
    const bool left_optimal = traversal::is_optimal(left);
    const bool right_optimal = traversal::is_optimal(right);

    if (left_optimal && right_optimal) {
        return { Fairness::Fair,
            "Both sides find a minimum-weight path; the winner is whoever finishes first." };
    }
    if (left_optimal || right_optimal) {
        const traversal::Strategy optimal = left_optimal ? left : right;
        const traversal::Strategy other = left_optimal ? right : left;
        return { Fairness::Educational,
            std::string(traversal::display_name(optimal)) + " guarantees the shortest weighted path; "
                + traversal::display_name(other) + " may finish first with a longer path." };
    }
    return { Fairness::Unweighted,
        "Neither side considers edge weights; the winner is whoever finishes first." };
}

} // namespace race
