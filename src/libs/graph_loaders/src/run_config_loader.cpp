#include <graph_loaders/run_config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace graph_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

std::optional<RunConfig> parse_run_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        spdlog::warn("run_config_invalid reason=top level is not an object");
        return std::nullopt;
    }

    RunConfig cfg;
    if (j.contains("graph_file") && j["graph_file"].is_string()) {
        cfg.graph_file = j["graph_file"].get<std::string>();
        cfg.source = GraphSource::File;
    }
    if (j.contains("generator")) {
        const auto source = j["generator"].is_string()
            ? parse_graph_source(j["generator"].get<std::string>()) : std::nullopt;
        if (!source) {
            spdlog::warn("run_config_invalid reason=unknown generator");
            return std::nullopt;
        }
        cfg.source = *source;
    }
    if (j.contains("node_count") && j["node_count"].is_number_unsigned()) cfg.node_count = j["node_count"].get<std::size_t>();
    if (j.contains("edge_density") && j["edge_density"].is_number()) cfg.edge_density = j["edge_density"].get<double>();
    if (j.contains("rows") && j["rows"].is_number_unsigned()) cfg.rows = j["rows"].get<std::size_t>();
    if (j.contains("cols") && j["cols"].is_number_unsigned()) cfg.cols = j["cols"].get<std::size_t>();
    if (j.contains("seed") && j["seed"].is_number_unsigned()) cfg.seed = j["seed"].get<std::uint32_t>();

    cfg.start = string_or(j, "start", cfg.start);
    cfg.end = string_or(j, "end", cfg.end);
    cfg.left = string_or(j, "left", cfg.left);
    cfg.right = string_or(j, "right", cfg.right);
    if (j.contains("step_interval") && j["step_interval"].is_number()) cfg.step_interval = j["step_interval"].get<float>();
    cfg.log_level = string_or(j, "log_level", cfg.log_level);
    cfg.log_file = string_or(j, "log_file", cfg.log_file);

    if (!parse_log_level(cfg.log_level)) {
        spdlog::warn("run_config_invalid reason=unknown log_level={}", cfg.log_level);
        return std::nullopt;
    }
    if (cfg.source == GraphSource::File && cfg.graph_file.empty()) {
        spdlog::warn("run_config_invalid reason=generator 'file' needs graph_file");
        return std::nullopt;
    }
    return cfg;
}

} // namespace

std::optional<GraphSource> parse_graph_source(const std::string& name) {
    if (name == "demo") return GraphSource::Demo;
    if (name == "file") return GraphSource::File;
    if (name == "random") return GraphSource::Random;
    if (name == "grid") return GraphSource::Grid;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return std::nullopt;
    return level;
}

std::optional<RunConfig> load_run_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_run_config(j);
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("run_config_parse_failed error={}", ex.what());
        return std::nullopt;
    }
}

std::optional<RunConfig> load_run_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::warn("run_config_open_failed path={}", path);
        return std::nullopt;
    }
    return load_run_config_from_json(f);
}

} // namespace graph_loaders
