/**
 * @file policy_balancers.cpp
 * @brief Round-robin and seeded random balancers over available nodes.
 */
#include "meshroute/routing/policy_balancers.hpp"

#include <string>

namespace meshroute::routing {

namespace {

cluster::NodeSet available_only(const cluster::NodeSet& nodes) {
    cluster::NodeSet out; out.reserve(nodes.size());
    for (const auto& n : nodes) if (n.available) out.push_back(n);
    return out;
}

} // namespace

//------------------------------- Round robin ----------------------------------

RoundRobinLoadBalancer::RoundRobinLoadBalancer(const cluster::NodeSet& nodes)
    : eligible_(available_only(nodes)) {}

std::optional<cluster::Node> RoundRobinLoadBalancer::nextNode() const {
    if (eligible_.empty()) return std::nullopt;
    const auto idx = rr_.fetch_add(1, std::memory_order_relaxed) % eligible_.size();
    return eligible_[static_cast<std::size_t>(idx)];
}

//------------------------------- Random ---------------------------------------

RandomLoadBalancer::RandomLoadBalancer(const cluster::NodeSet& nodes, std::uint64_t seed)
    : eligible_(available_only(nodes)), seed_(seed) {}

std::uint64_t RandomLoadBalancer::mix(std::uint64_t x, std::uint64_t seed) noexcept {
    // splitmix64 step for call number x of the stream identified by seed.
    constexpr std::uint64_t GAMMA = 0x9e3779b97f4a7c15ULL;
    std::uint64_t z = seed + (x + 1) * GAMMA;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

std::optional<cluster::Node> RandomLoadBalancer::nextNode() const {
    if (eligible_.empty()) return std::nullopt;
    const auto n = calls_.fetch_add(1, std::memory_order_relaxed);
    return eligible_[static_cast<std::size_t>(mix(n, seed_) % eligible_.size())];
}

//------------------------------- Factory --------------------------------------

Result<std::shared_ptr<const LoadBalancer>>
PolicyLoadBalancerFactory::build(const cluster::NodeSet& nodes) const {
    for (const auto& n : nodes) {
        if (n.id < 0) {
            return make_error(ErrorKind::InvalidCluster,
                              "negative node id " + std::to_string(n.id));
        }
    }
    if (!cluster::has_unique_ids(nodes)) {
        return make_error(ErrorKind::InvalidCluster, "duplicate node id in node set");
    }

    switch (strategy_) {
        case BalancerStrategy::RoundRobin:
            return std::make_shared<RoundRobinLoadBalancer>(nodes);
        case BalancerStrategy::Random:
            return std::make_shared<RandomLoadBalancer>(nodes, seed_);
    }
    return make_error(ErrorKind::InvalidCluster, "unknown balancer strategy");
}

} // namespace meshroute::routing
