#pragma once
// meshroute — ClientFactory
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • The balancer snapshot is the only shared mutable state with one writer role
//     (start() and the cluster listener) and many readers (Client calls).
//   • Writers are serialized by rebuildMu_, build a fresh snapshot and publish it with RELEASE.
//   • Readers take a shared_ptr copy with ACQUIRE; they never block writers.
//   • Old snapshots are reclaimed by shared_ptr refcounts once the last reader drops them.
// Lifecycle transitions are serialized by lifecycleMu_; the state itself is atomic
// so newClient() and Client preconditions read it without locking.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "meshroute/client/client.hpp"
#include "meshroute/client/transport.hpp"
#include "meshroute/cluster/cluster_view.hpp"
#include "meshroute/errors.hpp"
#include "meshroute/obs/observability.hpp"
#include "meshroute/routing/load_balancer.hpp"

namespace meshroute::client {

/// Lifecycle of a ClientFactory. Monotonic: NotStarted → Started → ShutDown.
enum class LifecycleState : std::uint8_t {
    NotStarted,
    Started,
    ShutDown
};

const char* to_string(LifecycleState s) noexcept;

/**
 * @struct BalancerSnapshot
 * @brief Immutable outcome of one balancer build.
 *
 * Exactly one of `balancer` / `failure` is set.
 */
struct BalancerSnapshot final {
    std::shared_ptr<const routing::LoadBalancer> balancer; ///< Built balancer, null on failure.
    std::optional<Error> failure;                          ///< Recorded InvalidCluster on failure.
    std::uint64_t generation{0};                           ///< 1 for the first build, +1 per rebuild.
    std::size_t node_count{0};                             ///< Size of the node set it was built from.

    [[nodiscard]] bool ok() const noexcept { return balancer != nullptr; }
};

/**
 * @class ClientFactory
 * @brief Lifecycle gate, reactive balancer maintenance and Client minting.
 *
 * The collaborators are borrowed and must outlive the factory. shutdown()
 * shuts both the cluster view and the transport down.
 *
 * Thread-safety:
 *   - start(), shutdown(), newClient() may race; start's registration and
 *     initial build run exactly once.
 *   - Cluster events may arrive on any thread, concurrently with Client calls.
 *   - A balanced send racing a rebuild sees either the old or the new
 *     snapshot, never a mix (eventually consistent, not linearizable).
 */
class ClientFactory final {
public:
    /**
     * @param cluster   Membership source; subscribed to on start().
     * @param transport Delivery backend used by Clients.
     * @param balancers Builds a balancer per membership snapshot.
     * @param observer  Event sink; nullptr selects the quiet obs::make_simple_observer().
     */
    ClientFactory(cluster::ClusterView& cluster,
                  TransportClient& transport,
                  const routing::LoadBalancerFactory& balancers,
                  obs::Observer* observer = nullptr);

    /// Removes the cluster listener if still registered. Does not shut collaborators down.
    ~ClientFactory();

    ClientFactory(const ClientFactory&) = delete;
    ClientFactory& operator=(const ClientFactory&) = delete;

    // --------------------------- Lifecycle -----------------------------------
    /// Start the cluster view, subscribe, build the first balancer. ClusterShutdown after shutdown().
    Status start();

    /// Mint a Client. NetworkNotStarted before start(), ClusterShutdown after shutdown().
    [[nodiscard]] Result<Client> newClient() const;

    /// Unsubscribe, shut down cluster view and transport. Idempotent; reports the first failure.
    Status shutdown();

    // --------------------------- Views used by Client ------------------------
    [[nodiscard]] LifecycleState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool isConnected() const noexcept { return cluster_.isConnected(); }
    [[nodiscard]] cluster::NodeSet currentNodes() const { return cluster_.currentNodes(); }

    /// Current balancer snapshot; null before the first build.
    [[nodiscard]] std::shared_ptr<const BalancerSnapshot> balancer() const noexcept;

    [[nodiscard]] TransportClient& transport() const noexcept { return transport_; }
    [[nodiscard]] obs::Observer* observer() const noexcept { return observer_; }

    /// Number of balancer builds (successful or rejected) so far.
    [[nodiscard]] std::uint64_t rebuildCount() const noexcept {
        return generation_.load(std::memory_order_relaxed);
    }

private:
    void handleClusterEvent(const cluster::ClusterEvent& event);

    /// Build from `nodes` and publish. Caller holds rebuildMu_.
    void rebuildLocked(const cluster::NodeSet& nodes);

    void note(obs::RoutingEvent e) const;

    cluster::ClusterView& cluster_;
    TransportClient& transport_;
    const routing::LoadBalancerFactory& balancers_;
    obs::Observer* observer_;

    std::mutex lifecycleMu_;
    std::atomic<LifecycleState> state_{LifecycleState::NotStarted};
    std::optional<cluster::ListenerKey> listener_; ///< Guarded by lifecycleMu_.

    std::mutex rebuildMu_;
    std::shared_ptr<const BalancerSnapshot> snapshot_; ///< Accessed only via atomic_load/atomic_store.
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace meshroute::client
