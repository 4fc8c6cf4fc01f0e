#include <graph_loaders/json_loader.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <unordered_set>

namespace graph_loaders {

namespace {

// Accepts "from"/"to" and the legacy "source"/"target" spelling.
std::optional<std::string> endpoint(const nlohmann::json& e, const char* key, const char* legacy_key) {
    if (e.contains(key) && e[key].is_string()) return e[key].get<std::string>();
    if (e.contains(legacy_key) && e[legacy_key].is_string()) return e[legacy_key].get<std::string>();
    return std::nullopt;
}

// Integer in [1, INT_MAX]; anything else is rejected rather than narrowed.
std::optional<int> edge_weight(const nlohmann::json& w) {
    constexpr auto kMaxWeight = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    if (w.is_number_unsigned()) {
        const auto value = w.get<std::uint64_t>();
        if (value < 1 || value > kMaxWeight) return std::nullopt;
        return static_cast<int>(value);
    }
    if (!w.is_number_integer()) return std::nullopt;
    const auto value = w.get<std::int64_t>();
    if (value < 1 || value > static_cast<std::int64_t>(kMaxWeight)) return std::nullopt;
    return static_cast<int>(value);
}

std::optional<graph_model::Graph> parse_json(const nlohmann::json& j) {
    graph_model::Graph g;
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        spdlog::warn("graph_json_invalid reason=missing nodes array");
        return std::nullopt;
    }
    if (!j.contains("edges") || !j["edges"].is_array()) {
        spdlog::warn("graph_json_invalid reason=missing edges array");
        return std::nullopt;
    }

    std::unordered_set<std::string> ids;
    for (const auto& n : j["nodes"]) {
        graph_model::Node node;
        if (!n.contains("id") || !n["id"].is_string()) {
            spdlog::warn("graph_json_invalid reason=node without string id");
            return std::nullopt;
        }
        node.id = n["id"].get<std::string>();
        if (!ids.insert(node.id).second) {
            spdlog::warn("graph_json_invalid reason=duplicate node id={}", node.id);
            return std::nullopt;
        }
        node.label = n.contains("label") && n["label"].is_string() ? n["label"].get<std::string>() : "";
        node.x = n.contains("x") && n["x"].is_number() ? n["x"].get<double>() : 0;
        node.y = n.contains("y") && n["y"].is_number() ? n["y"].get<double>() : 0;
        g.nodes.push_back(std::move(node));
    }

    for (const auto& e : j["edges"]) {
        graph_model::Edge edge;
        auto from = endpoint(e, "from", "source");
        auto to = endpoint(e, "to", "target");
        if (!from || !to) {
            spdlog::warn("graph_json_invalid reason=edge without endpoints");
            return std::nullopt;
        }
        edge.from = std::move(*from);
        edge.to = std::move(*to);
        if (e.contains("weight")) {
            const auto weight = edge_weight(e["weight"]);
            if (!weight) {
                spdlog::warn("graph_json_invalid reason=weight must be an integer in [1, {}] from={} to={}",
                    std::numeric_limits<int>::max(), edge.from, edge.to);
                return std::nullopt;
            }
            edge.weight = *weight;
        }
        g.edges.push_back(std::move(edge));
    }

    if (j.contains("name") && j["name"].is_string()) g.name = j["name"].get<std::string>();

    return g;
}

} // namespace

std::optional<graph_model::Graph> load_graph_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("graph_json_parse_failed error={}", ex.what());
        return std::nullopt;
    }
}

std::optional<graph_model::Graph> load_graph_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::warn("graph_json_open_failed path={}", path);
        return std::nullopt;
    }
    return load_graph_from_json(f);
}

nlohmann::json graph_to_json(const graph_model::Graph& graph) {
    nlohmann::json j;
    j["name"] = graph.name;
    j["nodes"] = nlohmann::json::array();
    for (const auto& n : graph.nodes)
        j["nodes"].push_back({ { "id", n.id }, { "label", n.label }, { "x", n.x }, { "y", n.y } });
    j["edges"] = nlohmann::json::array();
    for (const auto& e : graph.edges)
        j["edges"].push_back({ { "from", e.from }, { "to", e.to }, { "weight", e.weight } });
    return j;
}

} // namespace graph_loaders
