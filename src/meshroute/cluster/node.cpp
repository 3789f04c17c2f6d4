#include "meshroute/cluster/node.hpp"

#include <algorithm>

namespace meshroute::cluster {

const Node* find_node(const NodeSet& nodes, NodeId id) noexcept {
    for (const auto& n : nodes) if (n.id == id) return &n;
    return nullptr;
}

bool has_unique_ids(const NodeSet& nodes) {
    std::vector<NodeId> ids; ids.reserve(nodes.size());
    for (const auto& n : nodes) ids.push_back(n.id);
    std::sort(ids.begin(), ids.end());
    return std::adjacent_find(ids.begin(), ids.end()) == ids.end();
}

std::size_t count_available(const NodeSet& nodes) noexcept {
    return static_cast<std::size_t>(
        std::count_if(nodes.begin(), nodes.end(), [](const Node& n) { return n.available; }));
}

} // namespace meshroute::cluster
