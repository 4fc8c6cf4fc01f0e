#pragma once

#include <spdlog/common.h>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace graph_loaders {

enum class GraphSource { Demo, File, Random, Grid };

struct RunConfig {
    GraphSource source = GraphSource::Demo;
    std::string graph_file;
    std::size_t node_count = 50;
    double edge_density = 0.02;
    std::size_t rows = 6;
    std::size_t cols = 8;
    std::uint32_t seed = 1337;

    std::string start;
    std::string end;
    std::string left = "dijkstra";
    std::string right;          // empty: single-strategy run

    float step_interval = 0.3f; // seconds per replayed step
    std::string log_level = "info";
    std::string log_file;       // empty: logs/path_race_latest.log
};

std::optional<RunConfig> load_run_config_from_json(std::istream& in);
std::optional<RunConfig> load_run_config_from_json_file(const std::string& path);

std::optional<GraphSource> parse_graph_source(const std::string& name);

// spdlog level names; empty for anything spdlog would silently map to "off".
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace graph_loaders
