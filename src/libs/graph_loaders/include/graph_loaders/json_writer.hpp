#pragma once

#include <race/race_judge.hpp>
#include <traversal/types.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace graph_loaders {

// Trace export for renderers: final path, distance (null when unreachable),
// visited set and one entry per finalized node.
nlohmann::json result_to_json(traversal::Strategy strategy, const traversal::AlgorithmResult& result);

nlohmann::json race_to_json(traversal::Strategy left, const traversal::AlgorithmResult& left_result,
    traversal::Strategy right, const traversal::AlgorithmResult& right_result,
    race::Verdict verdict, const race::RaceRules& rules);

bool write_json_file(const nlohmann::json& j, const std::string& path);

} // namespace graph_loaders
