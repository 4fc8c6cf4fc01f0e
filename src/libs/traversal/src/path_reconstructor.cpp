#include <traversal/path_reconstructor.hpp>
#include <algorithm>
#include <unordered_set>

namespace traversal {

NodePath reconstruct_path(const ParentMap& parents, const std::string& start, const std::string& node) {
    NodePath path;
    std::unordered_set<std::string> seen;
    std::optional<std::string> current = node;

    while (current) {
        if (!seen.insert(*current).second) return {};
        path.push_back(*current);
        if (*current == start) break;
        auto it = parents.find(*current);
        current = it == parents.end() ? std::nullopt : it->second;
    }

    std::reverse(path.begin(), path.end());
    if (path.empty() || path.front() != start) return {};
    return path;
}

} // namespace traversal
