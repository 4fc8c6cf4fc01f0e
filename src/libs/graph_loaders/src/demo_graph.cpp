#include <graph_loaders/graph_generator.hpp>

namespace graph_loaders {

graph_model::Graph generate_demo_graph() {
    graph_model::Graph out;
    out.name = "demo";

    auto add_node = [&](const char* id, const char* label, double x, double y) {
        out.nodes.push_back(graph_model::Node{ id, label, x, y });
    };
    auto add_edge = [&](const char* from, const char* to, int weight) {
        out.edges.push_back(graph_model::Edge{ from, to, weight });
    };

    add_node("node-0", "0", 80, 280);
    add_node("node-1", "1", 220, 140);
    add_node("node-2", "2", 220, 420);
    add_node("node-3", "3", 380, 100);
    add_node("node-4", "4", 380, 280);
    add_node("node-5", "5", 380, 460);
    add_node("node-6", "6", 540, 200);
    add_node("node-7", "7", 680, 300);

    add_edge("node-0", "node-1", 10);
    add_edge("node-0", "node-2", 12);
    add_edge("node-0", "node-4", 18);
    add_edge("node-1", "node-3", 9);
    add_edge("node-1", "node-4", 11);
    add_edge("node-2", "node-4", 11);
    add_edge("node-2", "node-5", 9);
    add_edge("node-3", "node-6", 10);
    add_edge("node-4", "node-6", 9);
    add_edge("node-4", "node-7", 16);
    add_edge("node-5", "node-7", 19);
    add_edge("node-6", "node-7", 9);

    return out;
}

} // namespace graph_loaders
