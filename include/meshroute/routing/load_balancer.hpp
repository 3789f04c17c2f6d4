#pragma once
/**
 * @file load_balancer.hpp
 * @brief Load balancer policy contract and the factory that builds it from a snapshot.
 */

#include <cstdint>
#include <memory>
#include <optional>

#include "meshroute/cluster/node.hpp"
#include "meshroute/errors.hpp"

namespace meshroute::routing {

/**
 * @enum BalancerStrategy
 * @brief Built-in node selection strategies.
 */
enum class BalancerStrategy : std::uint8_t {
    RoundRobin, ///< Monotonic RR over the available nodes of the snapshot
    Random      ///< Seeded pseudo-random pick over the available nodes
};

inline const char* to_string(BalancerStrategy s) noexcept {
    switch (s) {
        case BalancerStrategy::RoundRobin: return "round_robin";
        case BalancerStrategy::Random:     return "random";
    }
    return "unknown";
}

/**
 * @class LoadBalancer
 * @brief Picks one node from the node set it was built with.
 *
 * Instances are published as immutable snapshots and shared across threads,
 * so nextNode() is const and must be thread-safe. Selection never leaves the
 * construction snapshot, and repeated calls eventually return every eligible node.
 */
class LoadBalancer {
public:
    virtual ~LoadBalancer() = default;

    /// Next node, or std::nullopt when no node is eligible. "None" is not an error here.
    [[nodiscard]] virtual std::optional<cluster::Node> nextNode() const = 0;
};

/**
 * @class LoadBalancerFactory
 * @brief Builds a LoadBalancer for one node set; may reject the set.
 */
class LoadBalancerFactory {
public:
    virtual ~LoadBalancerFactory() = default;

    /// Build a balancer, or fail with ErrorKind::InvalidCluster and a reason.
    [[nodiscard]] virtual Result<std::shared_ptr<const LoadBalancer>>
    build(const cluster::NodeSet& nodes) const = 0;
};

} // namespace meshroute::routing
