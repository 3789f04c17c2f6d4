#pragma once
/**
 * @file cluster_view.hpp
 * @brief Collaborator interface: live cluster membership and connectivity.
 * @details The membership service (coordination backend, registration, leader
 *          election) sits behind this interface. The routing core only consumes it.
 */

#include <cstdint>
#include <functional>

#include "meshroute/cluster/node.hpp"
#include "meshroute/errors.hpp"

namespace meshroute::cluster {

/** @enum ClusterEventKind
 *  @brief Kinds of notifications a cluster view delivers to listeners.
 */
enum class ClusterEventKind : std::uint8_t {
    Connected,    ///< Connection to the backend established; carries the node set
    NodesChanged, ///< Membership changed; carries the new node set
    Disconnected, ///< Connection to the backend lost
    Shutdown      ///< The cluster view has shut down
};

inline const char* to_string(ClusterEventKind k) noexcept {
    switch (k) {
        case ClusterEventKind::Connected:    return "connected";
        case ClusterEventKind::NodesChanged: return "nodes_changed";
        case ClusterEventKind::Disconnected: return "disconnected";
        case ClusterEventKind::Shutdown:     return "shutdown";
    }
    return "unknown";
}

/** @struct ClusterEvent
 *  @brief One notification. `nodes` is meaningful for Connected and NodesChanged only.
 */
struct ClusterEvent {
    ClusterEventKind kind{ClusterEventKind::NodesChanged};
    NodeSet          nodes;
};

/// Listener callback. Invoked on the cluster view's delivery context.
using ClusterListener = std::function<void(const ClusterEvent&)>;

/** @struct ListenerKey
 *  @brief Opaque registration handle returned by addListener().
 */
struct ListenerKey {
    std::uint64_t value{0};
    bool operator==(const ListenerKey&) const = default;
};

/** @class ClusterView
 *  @brief Source of membership snapshots, connectivity and change events.
 *
 * Implementations must be safe to call from any thread. Listener callbacks may
 * run concurrently with calls on other threads.
 */
class ClusterView {
public:
    virtual ~ClusterView() = default;

    /// Connect to the membership backend.
    virtual Status start() = 0;

    /// Disconnect and release backend resources.
    virtual Status shutdown() = 0;

    /// Current membership snapshot (a copy).
    [[nodiscard]] virtual NodeSet currentNodes() const = 0;

    [[nodiscard]] virtual bool isConnected() const noexcept = 0;
    [[nodiscard]] virtual bool isShutDown() const noexcept = 0;

    /// Register a listener; the returned key is needed to remove it.
    virtual ListenerKey addListener(ClusterListener listener) = 0;

    /**
     * @brief Remove a listener. Unknown keys are ignored.
     *
     * On return the listener is not running on any other thread and will not
     * be invoked again. May be called from inside a listener callback.
     */
    virtual void removeListener(ListenerKey key) = 0;
};

} // namespace meshroute::cluster
