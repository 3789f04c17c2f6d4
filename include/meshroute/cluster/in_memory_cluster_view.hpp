#pragma once
/**
 * @file in_memory_cluster_view.hpp
 * @brief ClusterView driven by its owner instead of a coordination backend.
 * @details Used for embedding, demos and tests. Events are delivered
 *          synchronously on the publishing thread, in publication order.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "meshroute/cluster/cluster_view.hpp"

namespace meshroute::cluster {

/**
 * @class InMemoryClusterView
 * @brief Membership set by connect()/publishNodes()/disconnect().
 *
 * Thread-safety:
 *   - All methods may be called from any thread.
 *   - Publications are serialized; each one is fully delivered before the next starts.
 *   - Listeners may read the view and remove listeners, but must not publish.
 *   - removeListener() from another thread waits for an in-progress call of
 *     that listener to return; a removed listener is skipped by any delivery
 *     still underway.
 */
class InMemoryClusterView final : public ClusterView {
public:
    InMemoryClusterView() = default;

    InMemoryClusterView(const InMemoryClusterView&) = delete;
    InMemoryClusterView& operator=(const InMemoryClusterView&) = delete;

    // --------------------------- ClusterView ---------------------------------
    Status start() override;
    Status shutdown() override;
    [[nodiscard]] NodeSet currentNodes() const override;
    [[nodiscard]] bool isConnected() const noexcept override;
    [[nodiscard]] bool isShutDown() const noexcept override;
    ListenerKey addListener(ClusterListener listener) override;
    void removeListener(ListenerKey key) override;

    // --------------------------- Driving API ---------------------------------
    /// Mark connected with an initial membership and emit Connected.
    /// Fails with BackendFailure before start() or after shutdown(),
    /// and with InvalidCluster on duplicate ids.
    Status connect(NodeSet nodes);

    /// Replace membership and emit NodesChanged. Requires a connected view.
    Status publishNodes(NodeSet nodes);

    /// Mark disconnected and emit Disconnected. Membership is kept.
    Status disconnect();

    /// Number of registered listeners.
    [[nodiscard]] std::size_t listenerCount() const;

private:
    /// Registered callback plus its removal flag (guarded by mu_).
    struct Entry {
        explicit Entry(ClusterListener f) : fn(std::move(f)) {}
        ClusterListener fn;
        bool removed{false};
    };

    /// Apply `apply` under the state lock, then deliver `event` to every listener.
    template <class Apply>
    void publish(ClusterEvent event, Apply&& apply);

    mutable std::mutex publishMu_; ///< Serializes publications (held across delivery).
    mutable std::mutex mu_;        ///< Guards the fields below.

    NodeSet nodes_;
    bool started_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutDown_{false};
    std::uint64_t nextKey_{1};
    std::map<std::uint64_t, std::shared_ptr<Entry>> listeners_;

    const Entry* delivering_{nullptr}; ///< Listener currently being called, if any.
    std::thread::id deliverer_;        ///< Thread calling delivering_.
    std::condition_variable delivered_;
};

} // namespace meshroute::cluster
