/**
 * @file node.hpp
 * @brief Cluster member model shared by the cluster view, balancers and clients.
 *
 * A Node is an immutable value. Membership changes publish a whole new
 * NodeSet; nodes are never edited in place once observed.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace meshroute::cluster {

/// Integer identity of a node, unique within one cluster.
using NodeId = std::int32_t;

/**
 * @brief Cluster member descriptor.
 *
 * Equality is defaulted (all fields). Membership checks use the id only;
 * see find_node().
 */
struct Node final {
  /// Cluster-unique identifier.
  NodeId id{0};

  /// Connection endpoint, e.g. "10.0.0.7:31313".
  std::string url;

  /// Whether the node is eligible for balanced traffic.
  bool available{true};

  bool operator==(const Node&) const = default;
};

/**
 * @brief One membership snapshot. Unique by id; order carries no meaning.
 */
using NodeSet = std::vector<Node>;

/// Member with the given id, or nullptr. The pointer is valid while `nodes` lives.
[[nodiscard]] const Node* find_node(const NodeSet& nodes, NodeId id) noexcept;

/// True if a member with the given id is present.
[[nodiscard]] inline bool contains_node(const NodeSet& nodes, NodeId id) noexcept {
  return find_node(nodes, id) != nullptr;
}

/// True if no two members share an id.
[[nodiscard]] bool has_unique_ids(const NodeSet& nodes);

/// Number of members with available == true.
[[nodiscard]] std::size_t count_available(const NodeSet& nodes) noexcept;

} // namespace meshroute::cluster
