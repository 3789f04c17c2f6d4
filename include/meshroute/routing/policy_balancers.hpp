#pragma once
/**
 * @file policy_balancers.hpp
 * @brief Built-in balancers (round-robin, seeded random) and their validating factory.
 * @details Default seed is named in constants; override via config.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include "meshroute/config/constants.hpp"
#include "meshroute/routing/load_balancer.hpp"

namespace meshroute::routing {

/**
 * @class RoundRobinLoadBalancer
 * @brief Cycles over the available nodes in snapshot order.
 */
class RoundRobinLoadBalancer final : public LoadBalancer {
public:
    explicit RoundRobinLoadBalancer(const cluster::NodeSet& nodes);

    std::optional<cluster::Node> nextNode() const override;

    /// Number of nodes this balancer selects from.
    [[nodiscard]] std::size_t eligibleCount() const noexcept { return eligible_.size(); }

private:
    cluster::NodeSet eligible_;                ///< Available nodes only
    mutable std::atomic<std::uint64_t> rr_{0}; ///< Lock-free RR counter
};

/**
 * @class RandomLoadBalancer
 * @brief Hashes a seeded call counter into the available nodes.
 *
 * Deterministic for a given seed and call sequence, which keeps tests stable.
 */
class RandomLoadBalancer final : public LoadBalancer {
public:
    RandomLoadBalancer(const cluster::NodeSet& nodes, std::uint64_t seed);

    std::optional<cluster::Node> nextNode() const override;

    [[nodiscard]] std::size_t eligibleCount() const noexcept { return eligible_.size(); }

    /// Pick value for call number `x` under `seed` (splitmix64 output).
    static std::uint64_t mix(std::uint64_t x, std::uint64_t seed) noexcept;

private:
    cluster::NodeSet eligible_;
    std::uint64_t seed_;
    mutable std::atomic<std::uint64_t> calls_{0};
};

/**
 * @class PolicyLoadBalancerFactory
 * @brief Validates a node set and builds the configured built-in balancer.
 *
 * Rejects sets with duplicate or negative ids. A set without available
 * nodes is accepted; its balancer simply reports none.
 */
class PolicyLoadBalancerFactory final : public LoadBalancerFactory {
public:
    explicit PolicyLoadBalancerFactory(
        BalancerStrategy strategy = BalancerStrategy::RoundRobin,
        std::uint64_t seed = meshroute::config::constants::BALANCER_SEED_DEFAULT) noexcept
        : strategy_(strategy), seed_(seed) {}

    Result<std::shared_ptr<const LoadBalancer>>
    build(const cluster::NodeSet& nodes) const override;

    [[nodiscard]] BalancerStrategy strategy() const noexcept { return strategy_; }
    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

private:
    BalancerStrategy strategy_;
    std::uint64_t seed_;
};

} // namespace meshroute::routing
