#pragma once

#include <string>
#include <vector>

namespace graph_model {

struct Node {
    std::string id;
    std::string label;
    double x = 0;
    double y = 0;
};

// Undirected: traversable both ways with the same weight.
struct Edge {
    std::string from;
    std::string to;
    int weight = 1;
};

struct Graph {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::string name;
};

const Node* find_node(const Graph& graph, const std::string& id);
bool contains_node(const Graph& graph, const std::string& id);

} // namespace graph_model
