#include <graph_loaders/json_writer.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>

namespace graph_loaders {

nlohmann::json result_to_json(traversal::Strategy strategy, const traversal::AlgorithmResult& result) {
    nlohmann::json j;
    j["strategy"] = traversal::to_string(strategy);
    j["path"] = result.path;
    j["distance"] = std::isfinite(result.distance) ? nlohmann::json(result.distance) : nlohmann::json(nullptr);
    j["visited"] = result.visited_nodes;

    j["steps"] = nlohmann::json::array();
    for (const auto& s : result.steps) {
        j["steps"].push_back({
            { "current", s.current_node },
            { "visited_count", s.visited_nodes.size() },
            { "path", s.path },
            { "complete", s.is_complete },
        });
    }
    return j;
}

nlohmann::json race_to_json(traversal::Strategy left, const traversal::AlgorithmResult& left_result,
    traversal::Strategy right, const traversal::AlgorithmResult& right_result,
    race::Verdict verdict, const race::RaceRules& rules)
{
    nlohmann::json j;
    j["left"] = result_to_json(left, left_result);
    j["right"] = result_to_json(right, right_result);
    j["verdict"] = race::to_string(verdict);
    j["fairness"] = race::to_string(rules.fairness);
    j["rules"] = rules.summary;
    return j;
}

bool write_json_file(const nlohmann::json& j, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        spdlog::error("json_write_failed path={}", path);
        return false;
    }
    f << j.dump(2) << '\n';
    return static_cast<bool>(f);
}

} // namespace graph_loaders
