// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/ec_key.hpp"
#include "dag_builders.hpp"
#include "network/infra/network_test_helpers.hpp"
#include "ledger_service.hpp"
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace dagsync;
using namespace dagsync::test;

namespace {

app::LedgerConfig TestConfig(const std::string &node_id) {
  app::LedgerConfig config;
  config.node_id = node_id;
  config.gossip_config = FastGossipConfig();
  config.sync_config = FastSyncConfig();
  return config;
}

std::vector<uint8_t> Data(const std::string &s) { return {s.begin(), s.end()}; }

struct ServicePair {
  explicit ServicePair(bool b_trusts_a = true) : net(io) {
    auto key_a = crypto::ECKey::Generate();
    const std::string key_a_hex = key_a.PublicKeyHex();

    a = std::make_unique<app::LedgerService>(io, net.CreateEndpoint("A"), std::move(key_a),
                                             TestConfig("A"));
    b = std::make_unique<app::LedgerService>(io, net.CreateEndpoint("B"),
                                             crypto::ECKey::Generate(), TestConfig("B"));
    if (b_trusts_a) {
      b->dag().AddTrustedKey(key_a_hex);
    }
    a->AddPeer("B");
    b->AddPeer("A");
    a->Start();
    b->Start();
  }

  boost::asio::io_context io;
  InMemoryNetwork net;
  std::unique_ptr<app::LedgerService> a;
  std::unique_ptr<app::LedgerService> b;
};

} // namespace

TEST_CASE("LedgerService - Lifecycle", "[service]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  auto &transport = net.CreateEndpoint("S");
  app::LedgerService service(io, transport, crypto::ECKey::Generate(), TestConfig("S"));

  REQUIRE_FALSE(service.IsRunning());
  REQUIRE(service.config().node_id == "S");

  service.Start();
  REQUIRE(service.IsRunning());
  REQUIRE(service.gossip().IsRunning());
  REQUIRE(service.sync().IsRunning());
  REQUIRE(transport.attached());

  service.Stop();
  REQUIRE_FALSE(service.IsRunning());
  REQUIRE_FALSE(service.gossip().IsRunning());
  REQUIRE_FALSE(service.sync().IsRunning());
  REQUIRE_FALSE(transport.attached());

  // Idempotent
  service.Stop();
}

TEST_CASE("LedgerService - Published nodes reach peers", "[service]") {
  ServicePair pair;

  auto root = pair.a->CreateNode(dag::NodeType::BLOCK, {}, Data("genesis"));
  REQUIRE(pair.a->PublishNode(root));
  auto child = pair.a->CreateNode(dag::NodeType::TRANSACTION, {root.node_id}, Data("tx-1"));
  REQUIRE(child.timestamp > root.timestamp);
  REQUIRE(pair.a->PublishNode(child));

  RunFor(pair.io, 300ms);

  REQUIRE(pair.b->dag().Size() == 2);
  auto received = pair.b->dag().GetNode(child.node_id);
  REQUIRE(received.has_value());
  REQUIRE(received->height == 1);
  REQUIRE(received->node_type == dag::NodeType::TRANSACTION);
  REQUIRE(received->data == Data("tx-1"));
  REQUIRE(pair.b->dag().GetTipIds() == std::vector<std::string>{child.node_id});

  // Both broadcasts were acknowledged: no fallback, no pending state
  REQUIRE(pair.a->gossip().PendingAckCount() == 0);
  REQUIRE(pair.net.SentMessages(network::MessageType::FALLBACK_REQUEST).empty());
}

TEST_CASE("LedgerService - Invalid nodes are not published", "[service]") {
  ServicePair pair;

  SECTION("Unknown parent") {
    auto orphan = pair.a->CreateNode(dag::NodeType::BLOCK, {std::string(64, 'a')}, Data("x"));
    dag::ValidationState state;
    REQUIRE_FALSE(pair.a->PublishNode(orphan, state));
    REQUIRE(state.GetRejectReason() == dag::reject::MISSING_PARENT);
  }

  SECTION("Already present") {
    auto root = pair.a->CreateNode(dag::NodeType::BLOCK, {}, Data("genesis"));
    REQUIRE(pair.a->PublishNode(root));
    pair.net.ClearSent();
    REQUIRE_FALSE(pair.a->PublishNode(root));
  }

  REQUIRE(pair.net.SentMessages(network::MessageType::BLOCK).empty());
}

TEST_CASE("LedgerService - Peers reject nodes from untrusted keys", "[service]") {
  ServicePair pair(false);

  auto root = pair.a->CreateNode(dag::NodeType::BLOCK, {}, Data("genesis"));
  REQUIRE(pair.a->PublishNode(root));
  RunFor(pair.io, 200ms);

  REQUIRE(pair.a->dag().Size() == 1);
  REQUIRE(pair.b->dag().Size() == 0);
  // Delivery itself succeeded; rejection happens above the gossip layer
  REQUIRE(pair.b->gossip().HasSeen(
      pair.net.SentMessages(network::MessageType::BLOCK, "B").at(0).message_id));
}

TEST_CASE("LedgerService - Late joiner catches up through sync", "[service][sync]") {
  ServicePair pair;

  // Published while B is offline
  pair.b->Stop();
  auto root = pair.a->CreateNode(dag::NodeType::BLOCK, {}, Data("genesis"));
  REQUIRE(pair.a->PublishNode(root));
  auto child = pair.a->CreateNode(dag::NodeType::BLOCK, {root.node_id}, Data("next"));
  REQUIRE(pair.a->PublishNode(child));
  RunFor(pair.io, 50ms);
  REQUIRE(pair.b->dag().Size() == 0);

  pair.b->Start();
  REQUIRE(pair.b->sync().SyncWithNetwork());
  RunFor(pair.io, 400ms);

  REQUIRE(pair.b->dag().Size() == 2);
  REQUIRE(pair.b->dag().HasNode(child.node_id));
}

TEST_CASE("LedgerService - Periodic pruning", "[service]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  auto config = TestConfig("S");
  config.prune_interval = std::chrono::seconds(1);
  config.prune_max_age = std::chrono::seconds(100);
  app::LedgerService service(io, net.CreateEndpoint("S"), crypto::ECKey::Generate(), config);

  auto root = MakeSignedNode(service.dag(), {}, RecentMillis(200), "old-root");
  REQUIRE(service.dag().AddNode(root));
  auto middle = MakeSignedNode(service.dag(), {root.node_id}, RecentMillis(199), "old-middle");
  REQUIRE(service.dag().AddNode(middle));
  auto tip = service.CreateNode(dag::NodeType::BLOCK, {middle.node_id}, Data("fresh"));
  REQUIRE(service.dag().AddNode(tip));

  service.Start();
  RunFor(io, 1200ms);

  // The sole root and the tip survive
  REQUIRE(service.dag().Size() == 2);
  REQUIRE(service.dag().HasNode(root.node_id));
  REQUIRE(service.dag().HasNode(tip.node_id));
  REQUIRE_FALSE(service.dag().HasNode(middle.node_id));
  REQUIRE(service.dag().CheckConsistency());
}
