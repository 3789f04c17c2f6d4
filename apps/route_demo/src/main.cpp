/**
 * @file main.cpp
 * @brief route_demo: drives a ClientFactory against an in-memory cluster.
 *
 * **Bootstrap**
 * - Load config (optional path in argv[1]); build the balancer factory and observer from it.
 * - Construct InMemoryClusterView + a stdout transport; start the factory.
 *
 * **Walkthrough**
 * - Calls before connect fail with ClusterDisconnected.
 * - Connect three nodes; broadcast; balanced and targeted sends.
 * - Membership change rebuilds the balancer; sends follow the new set.
 * - Shutdown releases collaborators; later calls fail with ClusterShutdown.
 *
 * Usage:
 *   ./meshroute_demo [config.toml]    (see apps/route_demo/route_demo.toml)
 */

#include <cstdint>
#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "meshroute/client/client_factory.hpp"
#include "meshroute/cluster/in_memory_cluster_view.hpp"
#include "meshroute/config/config_loader.hpp"
#include "meshroute/obs/observability.hpp"
#include "meshroute/version.hpp"

namespace {

using meshroute::cluster::Node;
using meshroute::cluster::NodeSet;

/// Transport that "delivers" by printing; every send completes immediately.
class StdoutTransport final : public meshroute::client::TransportClient {
public:
    meshroute::client::SendHandle send(const Node& node,
                                       const meshroute::client::Message& message) override {
        std::cout << "  -> node " << node.id << " (" << node.url << "): "
                  << message.name << " [" << message.payload.size() << " bytes]\n";
        std::promise<void> done;
        done.set_value();
        return done.get_future().share();
    }

    meshroute::Status shutdown() override {
        std::cout << "  transport closed\n";
        return {};
    }
};

template <class T>
void report(const char* what, const meshroute::Result<T>& r) {
    if (r) {
        std::cout << what << ": ok\n";
    } else {
        std::cout << what << ": " << meshroute::to_string(r.error().kind)
                  << " (" << r.error().reason << ")\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    namespace cfgns = meshroute::config;
    using meshroute::client::ClientFactory;
    using meshroute::client::Message;

    auto cfg = (argc > 1) ? cfgns::Loader::load_from_file(argv[1])
                          : cfgns::ConfigResult(cfgns::Loader::defaults());
    if (!cfg) {
        std::cerr << "config error (line " << cfg.error().line << "): "
                  << cfg.error().message << "\n";
        return 2;
    }
    // Without a config file the demo echoes every routing event.
    if (argc <= 1) cfg->observer_echo = true;

    std::cout << "meshroute " << meshroute::version_string << " route_demo\n"
              << "strategy=" << meshroute::routing::to_string(cfg->strategy)
              << " seed=" << cfg->seed << "\n"
              << "--------------------------------------------------\n";

    meshroute::cluster::InMemoryClusterView view;
    StdoutTransport transport;
    auto balancers = cfgns::make_balancer_factory(*cfg);
    auto* observer = meshroute::obs::make_simple_observer(cfg->observer_echo);

    ClientFactory factory(view, transport, *balancers, observer);
    if (auto st = factory.start(); !st) {
        std::cerr << "start failed: " << st.error().reason << "\n";
        return 1;
    }
    auto client = factory.newClient();
    if (!client) {
        std::cerr << "newClient failed: " << client.error().reason << "\n";
        return 1;
    }

    const Message ping{.name = "Ping", .payload = {0x01}};
    report("send before connect", client->sendMessage(ping));

    if (auto st = view.connect(NodeSet{Node{.id = 1, .url = "tcp://10.0.0.1:7800"},
                                       Node{.id = 2, .url = "tcp://10.0.0.2:7800"},
                                       Node{.id = 3, .url = "tcp://10.0.0.3:7800"}});
        !st) {
        std::cerr << "connect failed: " << st.error().reason << "\n";
        return 1;
    }

    auto all = client->broadcastMessage(ping);
    report("broadcast", all);
    if (all) {
        all->wait();
        std::cout << "  broadcast reached " << all->size() << " nodes\n";
    }

    for (int i = 0; i < 4; ++i) report("balanced send", client->sendMessage(ping));
    report("targeted send to node 2", client->sendMessageToNode(ping, Node{.id = 2}));
    report("targeted send to node 9", client->sendMessageToNode(ping, Node{.id = 9}));

    // Node 1 leaves, node 4 joins unavailable.
    if (auto st = view.publishNodes(NodeSet{Node{.id = 2, .url = "tcp://10.0.0.2:7800"},
                                            Node{.id = 3, .url = "tcp://10.0.0.3:7800"},
                                            Node{.id = 4, .url = "tcp://10.0.0.4:7800",
                                                 .available = false}});
        !st) {
        std::cerr << "membership change failed: " << st.error().reason << "\n";
        return 1;
    }
    for (int i = 0; i < 3; ++i) report("balanced send", client->sendMessage(ping));
    report("targeted send to node 1", client->sendMessageToNode(ping, Node{.id = 1}));

    if (auto st = factory.shutdown(); !st) {
        std::cerr << "shutdown reported: " << st.error().reason << "\n";
    }
    report("send after shutdown", client->sendMessage(ping));

    const auto c = observer->snapshot();
    std::cout << "--------------------------------------------------\n"
              << "rebuilds=" << c.rebuilds << " dispatches=" << c.dispatches
              << " broadcasts=" << c.broadcasts << " rejected=" << c.rejected_calls << "\n";
    return 0;
}
