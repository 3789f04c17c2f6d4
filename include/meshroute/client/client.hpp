#pragma once
/**
 * @file client.hpp
 * @brief Lightweight send handle minted by ClientFactory.
 */

#include "meshroute/client/message.hpp"
#include "meshroute/cluster/node.hpp"
#include "meshroute/errors.hpp"

namespace meshroute::client {

class ClientFactory;

/**
 * @class Client
 * @brief Broadcast, targeted and balanced sends through the owning factory.
 *
 * Holds nothing but a pointer to its factory. Every call re-reads lifecycle
 * state, connectivity, membership and the balancer snapshot, so a Client never
 * acts on a stale view. Copyable; must not outlive its factory.
 *
 * Every operation first checks, in order: NetworkNotStarted, ClusterShutdown,
 * ClusterDisconnected. Those win over node and balancer errors.
 */
class Client final {
public:
    explicit Client(const ClientFactory& factory) noexcept : factory_(&factory) {}

    /// Send `message` to every node currently reported by the cluster view, once each.
    Result<BroadcastHandle> broadcastMessage(const Message& message) const;

    /// Send `message` to `node`; fails with InvalidNode if no current member has its id.
    Result<SendHandle> sendMessageToNode(const Message& message, const cluster::Node& node) const;

    /// Send `message` to the node chosen by the current load balancer.
    Result<SendHandle> sendMessage(const Message& message) const;

private:
    Status checkPreconditions() const;
    meshroute_detail::unexpected<Error> reject(Error err) const;

    const ClientFactory* factory_;
};

} // namespace meshroute::client
