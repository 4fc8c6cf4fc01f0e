#include <graph_model/types.hpp>
#include <algorithm>

namespace graph_model {

const Node* find_node(const Graph& graph, const std::string& id) {
    auto it = std::find_if(graph.nodes.begin(), graph.nodes.end(),
        [&id](const Node& n) { return n.id == id; });
    return it == graph.nodes.end() ? nullptr : &*it;
}

bool contains_node(const Graph& graph, const std::string& id) {
    return find_node(graph, id) != nullptr;
}

} // namespace graph_model
