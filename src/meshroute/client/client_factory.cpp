// ClientFactory — Implementation Notes
// Snapshot publication follows the RCU pattern:
//   • Readers: atomic_load (ACQUIRE) → consistent balancer + failure + generation.
//   • Writers: build a new BalancerSnapshot, atomic_store (RELEASE), under rebuildMu_.
// start() reads the cluster's current nodes while holding rebuildMu_, so an event
// delivered during start() is published after it and is never overwritten by
// the older initial build.

#include "meshroute/client/client_factory.hpp"
#include "meshroute/config/constants.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <utility>

namespace meshroute::client {

const char* to_string(LifecycleState s) noexcept {
    switch (s) {
        case LifecycleState::NotStarted: return "not_started";
        case LifecycleState::Started:    return "started";
        case LifecycleState::ShutDown:   return "shut_down";
    }
    return "unknown";
}

ClientFactory::ClientFactory(cluster::ClusterView& cluster,
                             TransportClient& transport,
                             const routing::LoadBalancerFactory& balancers,
                             obs::Observer* observer)
    : cluster_(cluster),
      transport_(transport),
      balancers_(balancers),
      observer_(observer ? observer
                          : obs::make_simple_observer(config::constants::OBSERVER_ECHO_DEFAULT)) {}

ClientFactory::~ClientFactory() {
    std::lock_guard<std::mutex> lk(lifecycleMu_);
    if (listener_) {
        cluster_.removeListener(*listener_);
        listener_.reset();
    }
}

//------------------------------- Lifecycle ------------------------------------

Status ClientFactory::start() {
    std::lock_guard<std::mutex> lk(lifecycleMu_);
    switch (state_.load(std::memory_order_acquire)) {
        case LifecycleState::ShutDown:
            return make_error(ErrorKind::ClusterShutdown, "start() called after shutdown()");
        case LifecycleState::Started:
            return {};
        case LifecycleState::NotStarted:
            break;
    }

    if (auto st = cluster_.start(); !st) {
        note({.type = obs::EventType::BackendFailure, .error = st.error().kind,
              .detail = "cluster view start: " + st.error().reason});
        return st;
    }

    listener_ = cluster_.addListener(
        [this](const cluster::ClusterEvent& e) { handleClusterEvent(e); });

    {
        std::lock_guard<std::mutex> rl(rebuildMu_);
        rebuildLocked(cluster_.currentNodes());
    }

    state_.store(LifecycleState::Started, std::memory_order_release);
    note({.type = obs::EventType::FactoryStarted, .generation = rebuildCount()});
    return {};
}

Result<Client> ClientFactory::newClient() const {
    switch (state()) {
        case LifecycleState::NotStarted:
            return make_error(ErrorKind::NetworkNotStarted, "newClient() called before start()");
        case LifecycleState::ShutDown:
            return make_error(ErrorKind::ClusterShutdown, "newClient() called after shutdown()");
        case LifecycleState::Started:
            break;
    }
    return Client(*this);
}

Status ClientFactory::shutdown() {
    std::lock_guard<std::mutex> lk(lifecycleMu_);
    if (state_.load(std::memory_order_acquire) == LifecycleState::ShutDown) return {};

    if (listener_) {
        cluster_.removeListener(*listener_);
        listener_.reset();
    }
    // Block new Client calls before releasing the collaborators.
    state_.store(LifecycleState::ShutDown, std::memory_order_release);

    // Best effort: release both; the first failure is reported, later ones only logged.
    Status first{};
    if (auto st = cluster_.shutdown(); !st) {
        note({.type = obs::EventType::BackendFailure, .error = st.error().kind,
              .detail = "cluster view shutdown: " + st.error().reason});
        first = st;
    }
    if (auto st = transport_.shutdown(); !st) {
        note({.type = obs::EventType::BackendFailure, .error = st.error().kind,
              .detail = "transport shutdown: " + st.error().reason});
        if (first) first = st;
    }

    note({.type = obs::EventType::FactoryShutdown, .generation = rebuildCount()});
    return first;
}

//------------------------------- Balancer -------------------------------------

std::shared_ptr<const BalancerSnapshot> ClientFactory::balancer() const noexcept {
    // RCU read: acquire pairs with the RELEASE in rebuildLocked().
    return std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
}

void ClientFactory::handleClusterEvent(const cluster::ClusterEvent& event) {
    if (state() == LifecycleState::ShutDown) return;

    switch (event.kind) {
        case cluster::ClusterEventKind::Connected:
        case cluster::ClusterEventKind::NodesChanged: {
            std::lock_guard<std::mutex> rl(rebuildMu_);
            rebuildLocked(event.nodes);
            return;
        }
        case cluster::ClusterEventKind::Disconnected:
        case cluster::ClusterEventKind::Shutdown:
            note({.type = obs::EventType::EventIgnored, .generation = rebuildCount(),
                  .detail = cluster::to_string(event.kind)});
            return;
    }
}

void ClientFactory::rebuildLocked(const cluster::NodeSet& nodes) {
    auto next = std::make_shared<BalancerSnapshot>();
    next->generation = generation_.load(std::memory_order_relaxed) + 1;
    next->node_count = nodes.size();

    auto built = balancers_.build(nodes);
    if (built && *built) {
        next->balancer = std::move(*built);
    } else if (built) {
        next->failure = Error{ErrorKind::InvalidCluster, "load balancer factory returned no balancer"};
    } else {
        // A rejected set replaces the previous balancer.
        next->failure = Error{ErrorKind::InvalidCluster, built.error().reason};
    }

    const obs::RoutingEvent ev{
        .type = next->ok() ? obs::EventType::BalancerRebuilt : obs::EventType::BalancerRejected,
        .generation = next->generation,
        .node_count = next->node_count,
        .error = next->failure ? std::optional<ErrorKind>(next->failure->kind) : std::nullopt,
        .detail = next->failure ? next->failure->reason : std::string{}};

    // RCU update: RELEASE pairs with reader ACQUIRE so the fully built snapshot is visible.
    std::shared_ptr<const BalancerSnapshot> cnext = std::move(next);
    std::atomic_store_explicit(&snapshot_, std::move(cnext), std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_relaxed);
    note(ev);
}

void ClientFactory::note(obs::RoutingEvent e) const {
    if (observer_) observer_->record(e);
}

} // namespace meshroute::client
