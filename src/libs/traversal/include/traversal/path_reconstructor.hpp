#pragma once

#include <traversal/types.hpp>
#include <string>

namespace traversal {

// Walks parent links back from node. Returns start..node, or an empty path
// when the chain does not lead to start (unreachable, missing, or cyclic).
NodePath reconstruct_path(const ParentMap& parents, const std::string& start, const std::string& node);

} // namespace traversal
