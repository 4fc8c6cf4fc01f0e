#pragma once

#include <graph_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <istream>
#include <string>

namespace graph_loaders {

std::optional<graph_model::Graph> load_graph_from_json(std::istream& in);
std::optional<graph_model::Graph> load_graph_from_json_file(const std::string& path);

nlohmann::json graph_to_json(const graph_model::Graph& graph);

} // namespace graph_loaders
