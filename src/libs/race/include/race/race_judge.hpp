#pragma once

#include <traversal/types.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace race {

enum class Verdict { Undecided, Left, Right, Tie };

enum class Fairness {
    Fair,         // both sides guarantee a minimum-weight path
    Educational,  // exactly one side does
    Unweighted    // neither side looks at weights
};

struct RaceRules {
    Fairness fairness = Fairness::Fair;
    std::string summary;
};

const char* to_string(Verdict verdict);
const char* to_string(Fairness fairness);

// True when path runs from start to end.
bool found_path(const traversal::AlgorithmResult& result, const std::string& start, const std::string& end);

// Index of the first step flagged complete.
std::optional<std::size_t> completion_step(const traversal::AlgorithmResult& result);

// Compares two terminal results. First matching rule wins:
//   1. exactly one side found a start->end path: that side
//   2. neither found one: tie
//   3. earlier completion step wins
//   4. smaller visited set wins
//   5. tie
Verdict judge(const traversal::AlgorithmResult& left, const traversal::AlgorithmResult& right,
    const std::string& start, const std::string& end);

// Same as judge() but Undecided until the shared replay cursor has reached the
// last step of the longer sequence.
Verdict judge_at(const traversal::AlgorithmResult& left, const traversal::AlgorithmResult& right,
    const std::string& start, const std::string& end, std::size_t cursor);

RaceRules classify_race(traversal::Strategy left, traversal::Strategy right);

} // namespace race
