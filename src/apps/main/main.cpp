// Path race CLI: runs one traversal strategy, or races two, over a loaded or
// generated graph and prints the trace and verdict.

#include <graph_loaders/graph_generator.hpp>
#include <graph_loaders/json_loader.hpp>
#include <graph_loaders/json_writer.hpp>
#include <graph_loaders/run_config.hpp>
#include <playback/step_player.hpp>
#include <race/race_judge.hpp>
#include <race/race_session.hpp>
#include <traversal/engine.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void print_usage() {
    (void)fprintf(stderr,
        "usage: path_race [options]\n"
        "  --config FILE        JSON run config (flags below override it)\n"
        "  --graph FILE         load graph JSON\n"
        "  --random N           random graph with N nodes\n"
        "  --density D          edge density for --random (default 0.02)\n"
        "  --grid R C           R x C grid graph\n"
        "  --seed S             generator seed\n"
        "  --start ID --end ID  endpoints (default: first and last node)\n"
        "  --left NAME          strategy: dijkstra | astar | bfs | dfs (alias --algorithm)\n"
        "  --right NAME         race a second strategy against --left\n"
        "  --trace              print every step\n"
        "  --replay             print steps paced by the step interval\n"
        "  --interval SECONDS   replay step interval (default 0.3)\n"
        "  --json FILE          export result / race as JSON\n"
        "  --log-level LEVEL    trace | debug | info | warn | error | off\n");
}

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

void install_logger(const graph_loaders::RunConfig& cfg, spdlog::level::level_enum level) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        std::filesystem::path log_file = cfg.log_file;
        if (log_file.empty()) {
            const std::filesystem::path logs_dir = find_project_root() / "logs";
            std::filesystem::create_directories(logs_dir);
            log_file = logs_dir / "path_race_latest.log";
        }
        logger = spdlog::basic_logger_mt("path_race", log_file.string(), true);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        (void)fprintf(stderr, "file logger unavailable (%s); logging to console\n", ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        (void)fprintf(stderr, "file logger unavailable (%s); logging to console\n", ex.what());
    }
    spdlog::set_level(level);
    spdlog::info("Logger initialized. level={}", cfg.log_level);
}

struct CliOptions {
    graph_loaders::RunConfig config;
    bool trace = false;
    bool replay = false;
    std::string json_out;
};

// Returns nullopt on a usage error.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> args(argv + 1, argv + argc);

    // --config is applied first so the other flags can override it.
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") {
            auto loaded = graph_loaders::load_run_config_from_json_file(args[i + 1]);
            if (!loaded) {
                (void)fprintf(stderr, "failed to load config: %s\n", args[i + 1].c_str());
                return std::nullopt;
            }
            opts.config = std::move(*loaded);
        }
    }

    auto& cfg = opts.config;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        const bool has_value = i + 1 < args.size();
        try {
            if (a == "--config" && has_value) {
                ++i;
            } else if (a == "--graph" && has_value) {
                cfg.source = graph_loaders::GraphSource::File;
                cfg.graph_file = args[++i];
            } else if (a == "--random" && has_value) {
                cfg.source = graph_loaders::GraphSource::Random;
                cfg.node_count = std::stoul(args[++i]);
            } else if (a == "--density" && has_value) {
                cfg.edge_density = std::stod(args[++i]);
            } else if (a == "--grid" && i + 2 < args.size()) {
                cfg.source = graph_loaders::GraphSource::Grid;
                cfg.rows = std::stoul(args[++i]);
                cfg.cols = std::stoul(args[++i]);
            } else if (a == "--seed" && has_value) {
                cfg.seed = static_cast<std::uint32_t>(std::stoul(args[++i]));
            } else if (a == "--start" && has_value) {
                cfg.start = args[++i];
            } else if (a == "--end" && has_value) {
                cfg.end = args[++i];
            } else if ((a == "--left" || a == "--algorithm") && has_value) {
                cfg.left = args[++i];
            } else if (a == "--right" && has_value) {
                cfg.right = args[++i];
            } else if (a == "--interval" && has_value) {
                cfg.step_interval = std::stof(args[++i]);
            } else if (a == "--log-level" && has_value) {
                cfg.log_level = args[++i];
            } else if (a == "--json" && has_value) {
                opts.json_out = args[++i];
            } else if (a == "--trace") {
                opts.trace = true;
            } else if (a == "--replay") {
                opts.replay = true;
            } else {
                (void)fprintf(stderr, "unknown or incomplete option: %s\n", a.c_str());
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            (void)fprintf(stderr, "bad numeric value for %s\n", a.c_str());
            return std::nullopt;
        }
    }
    return opts;
}

std::optional<graph_model::Graph> build_graph(const graph_loaders::RunConfig& cfg) {
    switch (cfg.source) {
    case graph_loaders::GraphSource::File:
        return graph_loaders::load_graph_from_json_file(cfg.graph_file);
    case graph_loaders::GraphSource::Random:
        return graph_loaders::generate_random_graph(cfg.node_count, cfg.edge_density, cfg.seed);
    case graph_loaders::GraphSource::Grid:
        return graph_loaders::generate_grid_graph(cfg.rows, cfg.cols, cfg.seed);
    case graph_loaders::GraphSource::Demo:
        break;
    }
    const char* demo_paths[] = { "data/example_graph.json", "example_graph.json" };
    for (const char* path : demo_paths) {
        if (!std::filesystem::exists(path)) continue;
        if (auto loaded = graph_loaders::load_graph_from_json_file(path))
            return loaded;
    }
    return graph_loaders::generate_demo_graph();
}

std::string join_path(const traversal::NodePath& path) {
    if (path.empty()) return "(none)";
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " -> ";
        out += path[i];
    }
    return out;
}

std::string format_distance(double distance) {
    if (!std::isfinite(distance)) return "unreachable";
    char buf[32];
    (void)snprintf(buf, sizeof(buf), "%g", distance);
    return buf;
}

void print_step(const char* side, std::size_t index, const traversal::PathStep& s) {
    std::printf("%s[%zu] finalize %-12s visited=%-4zu path=%s%s\n",
        side, index, s.current_node.c_str(), s.visited_nodes.size(), join_path(s.path).c_str(),
        s.is_complete ? "  (target)" : "");
}

void print_summary(const char* side, traversal::Strategy strategy, const traversal::AlgorithmResult& r) {
    std::printf("%s%s: path=%s distance=%s steps=%zu visited=%zu\n",
        side, traversal::display_name(strategy), join_path(r.path).c_str(),
        format_distance(r.distance).c_str(), r.steps.size(), r.visited_nodes.size());
}

// Walks the player cursor through the steps, sleeping one interval per tick.
template <typename PrintFn>
void replay(std::size_t step_count, float interval, PrintFn print) {
    playback::StepPlayer player(step_count);
    player.set_interval(interval);
    if (step_count == 0) return;
    print(player.cursor());
    player.play();
    const auto tick = std::chrono::duration<float>(interval);
    while (player.is_playing()) {
        std::this_thread::sleep_for(tick);
        if (player.tick(interval) > 0) print(player.cursor());
    }
}

int run_single(const CliOptions& opts, const graph_model::Graph& graph, traversal::Strategy strategy) {
    const auto& cfg = opts.config;
    auto engine = traversal::make_engine(strategy);
    engine->init(graph, cfg.start, cfg.end);

    traversal::AlgorithmResult result = engine->run_to_completion();
    if (opts.replay) {
        replay(result.steps.size(), cfg.step_interval,
            [&](std::size_t i) { print_step("", i, result.steps[i]); });
    } else if (opts.trace) {
        for (std::size_t i = 0; i < result.steps.size(); ++i)
            print_step("", i, result.steps[i]);
    }
    print_summary("", strategy, result);

    if (!opts.json_out.empty()
        && !graph_loaders::write_json_file(graph_loaders::result_to_json(strategy, result), opts.json_out))
        return 1;
    return 0;
}

int run_race(const CliOptions& opts, const graph_model::Graph& graph,
    traversal::Strategy left, traversal::Strategy right)
{
    const auto& cfg = opts.config;
    race::RaceSession session;
    session.start(graph, cfg.start, cfg.end, left, right);
    const race::RaceRules rules = session.rules();
    std::printf("race (%s): %s\n", race::to_string(rules.fairness), rules.summary.c_str());

    session.run_to_completion();
    const auto& lr = session.left_result();
    const auto& rr = session.right_result();

    auto print_round = [&](std::size_t i) {
        if (i < lr.steps.size()) print_step("L", i, lr.steps[i]);
        if (i < rr.steps.size()) print_step("R", i, rr.steps[i]);
        const race::Verdict v = race::judge_at(lr, rr, cfg.start, cfg.end, i);
        if (v != race::Verdict::Undecided) std::printf("verdict at cursor %zu: %s\n", i, race::to_string(v));
    };
    const std::size_t rounds = std::max(lr.steps.size(), rr.steps.size());
    if (opts.replay) {
        replay(rounds, cfg.step_interval, print_round);
    } else if (opts.trace) {
        for (std::size_t i = 0; i < rounds; ++i) print_round(i);
    }

    print_summary("L ", left, lr);
    print_summary("R ", right, rr);
    const race::Verdict verdict = session.verdict();
    std::printf("winner: %s\n", race::to_string(verdict));

    if (!opts.json_out.empty()
        && !graph_loaders::write_json_file(graph_loaders::race_to_json(left, lr, right, rr, verdict, rules), opts.json_out))
        return 1;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
            print_usage();
            return 0;
        }
    }

    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    auto& cfg = opts->config;
    const auto log_level = graph_loaders::parse_log_level(cfg.log_level);
    if (!log_level) {
        (void)fprintf(stderr, "unknown log level: %s\n", cfg.log_level.c_str());
        return 1;
    }
    install_logger(cfg, *log_level);

    auto graph = build_graph(cfg);
    if (!graph) {
        (void)fprintf(stderr, "failed to load graph: %s\n", cfg.graph_file.c_str());
        return 1;
    }
    if (graph->nodes.empty()) {
        (void)fprintf(stderr, "graph has no nodes\n");
        return 1;
    }
    if (cfg.start.empty()) cfg.start = graph->nodes.front().id;
    if (cfg.end.empty()) cfg.end = graph->nodes.back().id;
    spdlog::info("graph_ready name={} nodes={} edges={} start={} end={}",
        graph->name, graph->nodes.size(), graph->edges.size(), cfg.start, cfg.end);

    const auto left = traversal::parse_strategy(cfg.left);
    if (!left) {
        (void)fprintf(stderr, "unknown strategy: %s\n", cfg.left.c_str());
        return 1;
    }
    if (cfg.right.empty()) {
        return run_single(*opts, *graph, *left);
    }

    const auto right = traversal::parse_strategy(cfg.right);
    if (!right) {
        (void)fprintf(stderr, "unknown strategy: %s\n", cfg.right.c_str());
        return 1;
    }
    return run_race(*opts, *graph, *left, *right);
}
