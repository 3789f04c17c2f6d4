/**
 * @file in_memory_cluster_view.cpp
 * @brief Owner-driven cluster view with synchronous, ordered event delivery.
 */
#include "meshroute/cluster/in_memory_cluster_view.hpp"

#include <utility>
#include <vector>

namespace meshroute::cluster {

namespace {

/// Clears the in-progress marker and wakes removeListener() waiters, also on unwind.
template <class Done>
struct DeliveryScope {
    Done done;
    ~DeliveryScope() { done(); }
};

template <class Done>
DeliveryScope(Done) -> DeliveryScope<Done>;

} // namespace

template <class Apply>
void InMemoryClusterView::publish(ClusterEvent event, Apply&& apply) {
    std::vector<std::shared_ptr<Entry>> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        apply();
        targets.reserve(listeners_.size());
        for (const auto& kv : listeners_) targets.push_back(kv.second);
    }
    // Deliver outside the state lock so listeners can read the view.
    for (const auto& entry : targets) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (entry->removed) continue;
            delivering_ = entry.get();
            deliverer_ = std::this_thread::get_id();
        }
        const DeliveryScope finished{[this] {
            {
                std::lock_guard<std::mutex> lk(mu_);
                delivering_ = nullptr;
            }
            delivered_.notify_all();
        }};
        entry->fn(event);
    }
}

Status InMemoryClusterView::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (shutDown_.load(std::memory_order_acquire)) {
        return make_error(ErrorKind::BackendFailure, "cluster view already shut down");
    }
    started_ = true;
    return {};
}

Status InMemoryClusterView::shutdown() {
    std::lock_guard<std::mutex> pub(publishMu_);
    if (shutDown_.load(std::memory_order_acquire)) return {};
    publish(ClusterEvent{ClusterEventKind::Shutdown, {}}, [this] {
        connected_.store(false, std::memory_order_release);
        shutDown_.store(true, std::memory_order_release);
        nodes_.clear();
    });
    return {};
}

NodeSet InMemoryClusterView::currentNodes() const {
    std::lock_guard<std::mutex> lk(mu_);
    return nodes_; // copy
}

bool InMemoryClusterView::isConnected() const noexcept {
    return connected_.load(std::memory_order_acquire);
}

bool InMemoryClusterView::isShutDown() const noexcept {
    return shutDown_.load(std::memory_order_acquire);
}

ListenerKey InMemoryClusterView::addListener(ClusterListener listener) {
    std::lock_guard<std::mutex> lk(mu_);
    const ListenerKey key{nextKey_++};
    listeners_.emplace(key.value, std::make_shared<Entry>(std::move(listener)));
    return key;
}

void InMemoryClusterView::removeListener(ListenerKey key) {
    std::unique_lock<std::mutex> lk(mu_);
    const auto it = listeners_.find(key.value);
    if (it == listeners_.end()) return;
    const std::shared_ptr<Entry> entry = it->second;
    entry->removed = true;
    listeners_.erase(it);

    // A listener removing itself cannot wait for its own return.
    if (delivering_ == entry.get() && deliverer_ == std::this_thread::get_id()) return;
    delivered_.wait(lk, [&] { return delivering_ != entry.get(); });
}

std::size_t InMemoryClusterView::listenerCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return listeners_.size();
}

Status InMemoryClusterView::connect(NodeSet nodes) {
    if (!has_unique_ids(nodes)) {
        return make_error(ErrorKind::InvalidCluster, "duplicate node id in membership");
    }
    std::lock_guard<std::mutex> pub(publishMu_);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutDown_.load(std::memory_order_acquire)) {
            return make_error(ErrorKind::BackendFailure, "cluster view already shut down");
        }
        if (!started_) return make_error(ErrorKind::BackendFailure, "cluster view not started");
    }
    ClusterEvent ev{ClusterEventKind::Connected, nodes};
    publish(std::move(ev), [this, &nodes] {
        nodes_ = std::move(nodes);
        connected_.store(true, std::memory_order_release);
    });
    return {};
}

Status InMemoryClusterView::publishNodes(NodeSet nodes) {
    if (!has_unique_ids(nodes)) {
        return make_error(ErrorKind::InvalidCluster, "duplicate node id in membership");
    }
    std::lock_guard<std::mutex> pub(publishMu_);
    if (!connected_.load(std::memory_order_acquire)) {
        return make_error(ErrorKind::ClusterDisconnected, "cluster view not connected");
    }
    ClusterEvent ev{ClusterEventKind::NodesChanged, nodes};
    publish(std::move(ev), [this, &nodes] { nodes_ = std::move(nodes); });
    return {};
}

Status InMemoryClusterView::disconnect() {
    std::lock_guard<std::mutex> pub(publishMu_);
    if (!connected_.load(std::memory_order_acquire)) return {};
    publish(ClusterEvent{ClusterEventKind::Disconnected, {}}, [this] {
        connected_.store(false, std::memory_order_release);
    });
    return {};
}

} // namespace meshroute::cluster
