/**
 * @file client.cpp
 * @brief Precondition gate and routing for Client sends.
 */
#include "meshroute/client/client.hpp"
#include "meshroute/client/client_factory.hpp"

#include <string>
#include <utility>

namespace meshroute::client {

meshroute_detail::unexpected<Error> Client::reject(Error err) const {
    if (auto* o = factory_->observer()) {
        o->record({.type = obs::EventType::CallRejected, .error = err.kind, .detail = err.reason});
    }
    return meshroute_detail::unexpected<Error>(std::move(err));
}

Status Client::checkPreconditions() const {
    switch (factory_->state()) {
        case LifecycleState::NotStarted:
            return reject({ErrorKind::NetworkNotStarted, "client factory not started"});
        case LifecycleState::ShutDown:
            return reject({ErrorKind::ClusterShutdown, "client factory shut down"});
        case LifecycleState::Started:
            break;
    }
    if (!factory_->isConnected()) {
        return reject({ErrorKind::ClusterDisconnected, "cluster view not connected"});
    }
    return {};
}

Result<BroadcastHandle> Client::broadcastMessage(const Message& message) const {
    if (auto st = checkPreconditions(); !st) return meshroute_detail::unexpected<Error>(st.error());

    const cluster::NodeSet nodes = factory_->currentNodes();
    BroadcastHandle out;
    for (const auto& n : nodes) out.add(n.id, factory_->transport().send(n, message));

    if (auto* o = factory_->observer()) {
        o->record({.type = obs::EventType::Broadcast, .node_count = nodes.size(),
                   .detail = message.name});
    }
    return out;
}

Result<SendHandle> Client::sendMessageToNode(const Message& message, const cluster::Node& node) const {
    if (auto st = checkPreconditions(); !st) return meshroute_detail::unexpected<Error>(st.error());

    const cluster::NodeSet nodes = factory_->currentNodes();
    const cluster::Node* member = cluster::find_node(nodes, node.id);
    if (!member) {
        return reject({ErrorKind::InvalidNode,
                       "node " + std::to_string(node.id) + " is not a cluster member"});
    }

    SendHandle h = factory_->transport().send(*member, message);
    if (auto* o = factory_->observer()) {
        o->record({.type = obs::EventType::Dispatched, .node_id = member->id,
                   .node_count = nodes.size(), .detail = message.name});
    }
    return h;
}

Result<SendHandle> Client::sendMessage(const Message& message) const {
    if (auto st = checkPreconditions(); !st) return meshroute_detail::unexpected<Error>(st.error());

    const auto snap = factory_->balancer();
    if (!snap) return reject({ErrorKind::InvalidCluster, "no load balancer has been built"});
    if (!snap->ok()) {
        return reject(snap->failure.value_or(Error{ErrorKind::InvalidCluster, {}}));
    }

    const auto node = snap->balancer->nextNode();
    if (!node) return reject({ErrorKind::NoNodesAvailable, "load balancer has no eligible node"});

    SendHandle h = factory_->transport().send(*node, message);
    if (auto* o = factory_->observer()) {
        o->record({.type = obs::EventType::Dispatched, .node_id = node->id,
                   .generation = snap->generation, .node_count = snap->node_count,
                   .detail = message.name});
    }
    return h;
}

} // namespace meshroute::client
