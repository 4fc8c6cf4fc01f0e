#include <graph_loaders/graph_generator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace graph_loaders {

namespace {

constexpr double kMinNodeSpacing = 60;
constexpr int kMaxPlacementAttempts = 100;
constexpr double kWeightUnit = 20;
constexpr int kMaxRandomWeight = 20;

double node_distance(const graph_model::Node& a, const graph_model::Node& b) {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

int weight_for_distance(double distance) {
    const int w = static_cast<int>(std::floor(distance / kWeightUnit)) + 1;
    return std::min(w, kMaxRandomWeight);
}

// Joins every node not reachable from nodes[0] to its nearest reachable node.
void ensure_connected(const std::vector<graph_model::Node>& nodes, std::vector<graph_model::Edge>& edges) {
    if (nodes.empty()) return;

    std::unordered_map<std::string, std::vector<std::string>> adj;
    for (const auto& e : edges) {
        adj[e.from].push_back(e.to);
        adj[e.to].push_back(e.from);
    }

    std::unordered_map<std::string, bool> reached;
    std::deque<std::string> queue{ nodes[0].id };
    reached[nodes[0].id] = true;
    while (!queue.empty()) {
        const std::string cur = queue.front();
        queue.pop_front();
        for (const auto& nb : adj[cur]) {
            if (!reached[nb]) {
                reached[nb] = true;
                queue.push_back(nb);
            }
        }
    }

    std::size_t joined = 0;
    for (const auto& node : nodes) {
        if (reached[node.id]) continue;

        const graph_model::Node* nearest = nullptr;
        double best = std::numeric_limits<double>::infinity();
        for (const auto& other : nodes) {
            if (!reached[other.id]) continue;
            const double d = node_distance(node, other);
            if (d < best) {
                best = d;
                nearest = &other;
            }
        }
        if (nearest) {
            edges.push_back(graph_model::Edge{ node.id, nearest->id, weight_for_distance(best) });
            reached[node.id] = true;
            ++joined;
        }
    }
    if (joined > 0)
        spdlog::debug("generator_connected joined_nodes={}", joined);
}

} // namespace

graph_model::Graph generate_random_graph(std::size_t node_count, double edge_density, std::uint32_t seed) {
    graph_model::Graph out;
    out.name = "random-" + std::to_string(node_count);
    std::mt19937 rng{ seed };
    std::normal_distribution<double> gauss_x(kCanvasWidth / 2, kCanvasWidth / 4);
    std::normal_distribution<double> gauss_y(kCanvasHeight / 2, kCanvasHeight / 4);
    std::uniform_real_distribution<double> uniform01(0.0, 1.0);

    for (std::size_t i = 0; i < node_count; ++i) {
        graph_model::Node n;
        n.id = "node-" + std::to_string(i);
        n.label = std::to_string(i);

        bool placed = false;
        for (int attempt = 0; attempt < kMaxPlacementAttempts && !placed; ++attempt) {
            n.x = std::clamp(gauss_x(rng), kCanvasPadding, kCanvasWidth - kCanvasPadding);
            n.y = std::clamp(gauss_y(rng), kCanvasPadding, kCanvasHeight - kCanvasPadding);
            placed = std::all_of(out.nodes.begin(), out.nodes.end(),
                [&n](const graph_model::Node& other) { return node_distance(n, other) >= kMinNodeSpacing; });
        }
        if (!placed) {
            n.x = kCanvasPadding + uniform01(rng) * (kCanvasWidth - 2 * kCanvasPadding);
            n.y = kCanvasPadding + uniform01(rng) * (kCanvasHeight - 2 * kCanvasPadding);
        }
        out.nodes.push_back(std::move(n));
    }

    const double diagonal = std::sqrt(kCanvasWidth * kCanvasWidth + kCanvasHeight * kCanvasHeight);
    for (std::size_t i = 0; i < node_count; ++i) {
        for (std::size_t j = i + 1; j < node_count; ++j) {
            const double d = node_distance(out.nodes[i], out.nodes[j]);
            const double probability = edge_density * (1.0 - (d / diagonal) * 0.7);
            if (uniform01(rng) < probability)
                out.edges.push_back(graph_model::Edge{ out.nodes[i].id, out.nodes[j].id, weight_for_distance(d) });
        }
    }

    ensure_connected(out.nodes, out.edges);
    spdlog::debug("generator_random nodes={} edges={} density={} seed={}",
        out.nodes.size(), out.edges.size(), edge_density, seed);
    return out;
}

graph_model::Graph generate_grid_graph(std::size_t rows, std::size_t cols, std::uint32_t seed) {
    graph_model::Graph out;
    out.name = "grid-" + std::to_string(rows) + "x" + std::to_string(cols);
    if (rows == 0 || cols == 0) return out;

    std::mt19937 rng{ seed };
    std::uniform_int_distribution<int> weight(1, 10);
    const double cell_w = kCanvasWidth / static_cast<double>(cols);
    const double cell_h = kCanvasHeight / static_cast<double>(rows);

    auto id_of = [](std::size_t r, std::size_t c) {
        return "node-" + std::to_string(r) + "-" + std::to_string(c);
    };

    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            graph_model::Node n;
            n.id = id_of(r, c);
            n.label = std::to_string(r) + "," + std::to_string(c);
            n.x = static_cast<double>(c) * cell_w + cell_w / 2 + kCanvasPadding;
            n.y = static_cast<double>(r) * cell_h + cell_h / 2 + kCanvasPadding;
            out.nodes.push_back(std::move(n));
        }
    }

    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            if (c + 1 < cols)
                out.edges.push_back(graph_model::Edge{ id_of(r, c), id_of(r, c + 1), weight(rng) });
            if (r + 1 < rows)
                out.edges.push_back(graph_model::Edge{ id_of(r, c), id_of(r + 1, c), weight(rng) });
        }
    }

    spdlog::debug("generator_grid rows={} cols={} edges={} seed={}", rows, cols, out.edges.size(), seed);
    return out;
}

} // namespace graph_loaders
