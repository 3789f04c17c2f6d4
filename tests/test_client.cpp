/**
 * @file test_client.cpp
 * @brief Tests for Client precondition gating and broadcast / targeted / balanced routing.
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "fakes.hpp"
#include "meshroute/client/client_factory.hpp"

using meshroute::ErrorKind;
using meshroute::client::Client;
using meshroute::client::ClientFactory;
using meshroute::client::Message;
using meshroute::cluster::ClusterEvent;
using meshroute::cluster::ClusterEventKind;
using meshroute::cluster::Node;
using meshroute::cluster::NodeId;
using namespace meshroute::fakes;

namespace {

struct ClientFixture : ::testing::Test {
  FakeClusterView cluster;
  RecordingTransport transport;
  StubBalancerFactory balancers;
  CountingObserver observer;
  ClientFactory factory{cluster, transport, balancers, &observer};
  Message msg{.name = "Ping", .payload = {0x01, 0x02}};

  void SetUp() override {
    cluster.setNodes(three_nodes());
    cluster.connected = true;
  }

  Client startedClient() {
    EXPECT_TRUE(factory.start().has_value());
    auto c = factory.newClient();
    EXPECT_TRUE(c.has_value());
    return *c;
  }
};

} // namespace

// --------------------------- Preconditions ---------------------------------

/**
 * @test Disconnected_AllOperationsFail
 * @brief Every operation fails with ClusterDisconnected and never reaches the transport.
 */
TEST_F(ClientFixture, Disconnected_AllOperationsFail) {
  Client c = startedClient();
  cluster.connected = false;

  auto b = c.broadcastMessage(msg);
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error().kind, ErrorKind::ClusterDisconnected);

  auto t = c.sendMessageToNode(msg, Node{.id = 1});
  ASSERT_FALSE(t.has_value());
  EXPECT_EQ(t.error().kind, ErrorKind::ClusterDisconnected);

  auto s = c.sendMessage(msg);
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().kind, ErrorKind::ClusterDisconnected);

  EXPECT_EQ(transport.sendCount(), 0u);
  EXPECT_EQ(observer.snapshot().rejected_calls, 3u);
}

/**
 * @test ShutDown_AllOperationsFail
 * @brief A client minted before shutdown() fails every call with ClusterShutdown.
 */
TEST_F(ClientFixture, ShutDown_AllOperationsFail) {
  Client c = startedClient();
  ASSERT_TRUE(factory.shutdown().has_value());

  auto b = c.broadcastMessage(msg);
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error().kind, ErrorKind::ClusterShutdown);

  auto t = c.sendMessageToNode(msg, Node{.id = 1});
  ASSERT_FALSE(t.has_value());
  EXPECT_EQ(t.error().kind, ErrorKind::ClusterShutdown);

  auto s = c.sendMessage(msg);
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().kind, ErrorKind::ClusterShutdown);

  EXPECT_EQ(transport.sendCount(), 0u);
}

/**
 * @test ShutDown_WinsOverDisconnected
 * @brief When both hold, ClusterShutdown is reported.
 */
TEST_F(ClientFixture, ShutDown_WinsOverDisconnected) {
  Client c = startedClient();
  ASSERT_TRUE(factory.shutdown().has_value());
  cluster.connected = false;

  auto s = c.sendMessage(msg);
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().kind, ErrorKind::ClusterShutdown);
}

/**
 * @test NotStarted_ClientFromUnstartedFactory
 * @brief A Client bound directly to an unstarted factory reports NetworkNotStarted.
 */
TEST_F(ClientFixture, NotStarted_ClientFromUnstartedFactory) {
  Client c(factory);

  auto b = c.broadcastMessage(msg);
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error().kind, ErrorKind::NetworkNotStarted);

  auto t = c.sendMessageToNode(msg, Node{.id = 1});
  ASSERT_FALSE(t.has_value());
  EXPECT_EQ(t.error().kind, ErrorKind::NetworkNotStarted);

  auto s = c.sendMessage(msg);
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().kind, ErrorKind::NetworkNotStarted);
}

/**
 * @test Disconnected_WinsOverInvalidNode
 * @brief Connectivity is checked before membership.
 */
TEST_F(ClientFixture, Disconnected_WinsOverInvalidNode) {
  Client c = startedClient();
  cluster.connected = false;

  auto t = c.sendMessageToNode(msg, Node{.id = 4});
  ASSERT_FALSE(t.has_value());
  EXPECT_EQ(t.error().kind, ErrorKind::ClusterDisconnected);
}

// --------------------------- broadcastMessage ------------------------------

/**
 * @test Broadcast_OncePerNode
 * @brief One dispatch per current node, returned as one aggregate handle.
 */
TEST_F(ClientFixture, Broadcast_OncePerNode) {
  Client c = startedClient();

  auto b = c.broadcastMessage(msg);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->size(), 3u);
  EXPECT_EQ(b->targets(), (std::vector<NodeId>{1, 2, 3}));
  EXPECT_EQ(transport.targets(), (std::vector<NodeId>{1, 2, 3}));
  EXPECT_TRUE(b->ready());
  EXPECT_NO_THROW(b->get());
  EXPECT_EQ(observer.snapshot().broadcasts, 1u);
}

/**
 * @test Broadcast_ReadsMembershipPerCall
 * @brief A later broadcast follows the cluster's current membership.
 */
TEST_F(ClientFixture, Broadcast_ReadsMembershipPerCall) {
  Client c = startedClient();
  cluster.setNodes({Node{.id = 5, .url = "h5"}});

  auto b = c.broadcastMessage(msg);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->targets(), (std::vector<NodeId>{5}));
}

/**
 * @test Broadcast_PartialFailure_SurfacesThroughHandle
 * @brief A failing node is reported by the aggregate handle, others still dispatched.
 */
TEST_F(ClientFixture, Broadcast_PartialFailure_SurfacesThroughHandle) {
  Client c = startedClient();
  transport.failing_nodes = {2};

  auto b = c.broadcastMessage(msg);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(transport.sendCount(), 3u);
  EXPECT_THROW(b->get(), std::runtime_error);
  EXPECT_NO_THROW(b->handles()[0].get());
}

/**
 * @test Broadcast_EmptyCluster
 * @brief No members: empty handle, no transport calls.
 */
TEST_F(ClientFixture, Broadcast_EmptyCluster) {
  Client c = startedClient();
  cluster.setNodes({});

  auto b = c.broadcastMessage(msg);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->size(), 0u);
  EXPECT_TRUE(b->ready());
  EXPECT_EQ(transport.sendCount(), 0u);
}

// --------------------------- sendMessageToNode -----------------------------

/**
 * @test SendToNode_Member
 * @brief A member id is dispatched exactly once.
 */
TEST_F(ClientFixture, SendToNode_Member) {
  Client c = startedClient();

  auto h = c.sendMessageToNode(msg, Node{.id = 1, .url = "", .available = true});
  ASSERT_TRUE(h.has_value());
  EXPECT_NO_THROW(h->get());
  EXPECT_EQ(transport.targets(), (std::vector<NodeId>{1}));
  EXPECT_EQ(transport.sent[0].message, "Ping");
}

/**
 * @test SendToNode_NonMember
 * @brief An unknown id fails with InvalidNode and never reaches the transport.
 */
TEST_F(ClientFixture, SendToNode_NonMember) {
  Client c = startedClient();

  auto h = c.sendMessageToNode(msg, Node{.id = 4, .url = "", .available = true});
  ASSERT_FALSE(h.has_value());
  EXPECT_EQ(h.error().kind, ErrorKind::InvalidNode);
  EXPECT_EQ(transport.sendCount(), 0u);
}

/**
 * @test SendToNode_MatchesByIdentity
 * @brief Membership is by id; the dispatched node is the member as the cluster reports it.
 */
TEST_F(ClientFixture, SendToNode_MatchesByIdentity) {
  cluster.setNodes({Node{.id = 2, .url = "current:2", .available = true}});
  Client c = startedClient();

  auto h = c.sendMessageToNode(msg, Node{.id = 2, .url = "stale:2", .available = false});
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(transport.targets(), (std::vector<NodeId>{2}));
}

// --------------------------- sendMessage -----------------------------------

/**
 * @test Send_UsesBalancer
 * @brief The balancer's node receives the message.
 */
TEST_F(ClientFixture, Send_UsesBalancer) {
  balancers.answer = Node{.id = 3, .url = "h3"};
  Client c = startedClient();

  auto h = c.sendMessage(msg);
  ASSERT_TRUE(h.has_value());
  ASSERT_TRUE(balancers.last);
  EXPECT_EQ(balancers.last->calls.load(), 1);
  EXPECT_EQ(transport.targets(), (std::vector<NodeId>{3}));
  EXPECT_EQ(observer.snapshot().dispatches, 1u);
}

/**
 * @test Send_RejectedSet_InvalidCluster
 * @brief A recorded rebuild failure surfaces as InvalidCluster with the factory's reason.
 */
TEST_F(ClientFixture, Send_RejectedSet_InvalidCluster) {
  balancers.reject_reason = "overlapping partitions";
  Client c = startedClient();

  auto h = c.sendMessage(msg);
  ASSERT_FALSE(h.has_value());
  EXPECT_EQ(h.error().kind, ErrorKind::InvalidCluster);
  EXPECT_EQ(h.error().reason, "overlapping partitions");
  EXPECT_EQ(transport.sendCount(), 0u);
}

/**
 * @test Send_NoNode_NoNodesAvailable
 * @brief A balancer with nothing to offer yields NoNodesAvailable, no transport call.
 */
TEST_F(ClientFixture, Send_NoNode_NoNodesAvailable) {
  balancers.answer.reset();
  Client c = startedClient();

  auto h = c.sendMessage(msg);
  ASSERT_FALSE(h.has_value());
  EXPECT_EQ(h.error().kind, ErrorKind::NoNodesAvailable);
  EXPECT_EQ(balancers.last->calls.load(), 1);
  EXPECT_EQ(transport.sendCount(), 0u);
}

/**
 * @test Send_FollowsRebuild
 * @brief After a NodesChanged event, an existing client routes through the new balancer.
 */
TEST_F(ClientFixture, Send_FollowsRebuild) {
  Client c = startedClient();
  ASSERT_TRUE(c.sendMessage(msg).has_value());

  balancers.answer = Node{.id = 2, .url = "h2"};
  cluster.emit(ClusterEvent{ClusterEventKind::NodesChanged, three_nodes()});
  ASSERT_TRUE(c.sendMessage(msg).has_value());

  balancers.reject_reason = "gone";
  cluster.emit(ClusterEvent{ClusterEventKind::NodesChanged, three_nodes()});
  auto h = c.sendMessage(msg);
  ASSERT_FALSE(h.has_value());
  EXPECT_EQ(h.error().kind, ErrorKind::InvalidCluster);

  EXPECT_EQ(transport.targets(), (std::vector<NodeId>{1, 2}));
}

/**
 * @test Send_TransportFailure_PassesThrough
 * @brief A delivery failure is returned inside the handle, not as a routing error.
 */
TEST_F(ClientFixture, Send_TransportFailure_PassesThrough) {
  transport.failing_nodes = {1};
  Client c = startedClient();

  auto h = c.sendMessage(msg);
  ASSERT_TRUE(h.has_value());
  EXPECT_THROW(h->get(), std::runtime_error);
}

// --------------------------- Reference scenario ----------------------------

/**
 * @test Scenario_ThreeNodes
 * @brief Nodes {1,2,3}, connected: invalid node, targeted send, empty balancer, broadcast.
 */
TEST_F(ClientFixture, Scenario_ThreeNodes) {
  balancers.answer.reset();
  Client c = startedClient();

  auto bad = c.sendMessageToNode(msg, Node{.id = 4});
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind, ErrorKind::InvalidNode);

  auto one = c.sendMessageToNode(msg, Node{.id = 1});
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(transport.sendCount(), 1u);

  auto none = c.sendMessage(msg);
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error().kind, ErrorKind::NoNodesAvailable);
  EXPECT_EQ(transport.sendCount(), 1u);

  auto all = c.broadcastMessage(msg);
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(transport.targets(), (std::vector<NodeId>{1, 1, 2, 3}));
}
