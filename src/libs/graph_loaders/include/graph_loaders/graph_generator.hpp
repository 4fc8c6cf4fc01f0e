#pragma once

#include <graph_model/types.hpp>
#include <cstddef>
#include <cstdint>

namespace graph_loaders {

// Canvas the generators place nodes on (world units).
constexpr double kCanvasWidth = 750;
constexpr double kCanvasHeight = 550;
constexpr double kCanvasPadding = 50;

// Gaussian cloud of node_count nodes ("node-<i>"), edges more likely between
// close nodes, weight floor(dist / 20) + 1 capped at 20. Every node is
// connected to node-0's component afterwards. Same seed, same graph.
graph_model::Graph generate_random_graph(std::size_t node_count, double edge_density, std::uint32_t seed);

// rows x cols lattice ("node-<r>-<c>") with right/down edges of weight 1..10.
graph_model::Graph generate_grid_graph(std::size_t rows, std::size_t cols, std::uint32_t seed);

// Fixed eight-node graph used when nothing else is given.
graph_model::Graph generate_demo_graph();

} // namespace graph_loaders
