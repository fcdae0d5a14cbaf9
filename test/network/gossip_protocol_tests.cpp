// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/infra/mock_transport.hpp"
#include "network/infra/network_test_helpers.hpp"
#include "network/gossip_protocol.hpp"
#include "util/time.hpp"
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace dagsync;
using namespace dagsync::network;
using namespace dagsync::test;

namespace {

// Message as another node would have created it
GossipMessage ForeignMessage(MessageType type, const nlohmann::json &payload,
                             const std::string &sender, int64_t timestamp, int ttl = DEFAULT_TTL) {
  GossipMessage msg;
  msg.type = type;
  msg.payload = payload;
  msg.sender = sender;
  msg.timestamp = timestamp;
  msg.message_id = ComputeMessageId(payload, timestamp, sender);
  msg.ttl = ttl;
  return msg;
}

// Single gossip instance on a MockTransport
struct MockGossip {
  explicit MockGossip(const std::string &id = "self")
      : scheduler(io), gossip(id, transport, scheduler, FastGossipConfig()) {}

  boost::asio::io_context io;
  MockTransport transport;
  util::TaskScheduler scheduler;
  GossipProtocol gossip;
};

} // namespace

TEST_CASE("GossipProtocol - CreateMessage stamps sender, time and ttl", "[gossip]") {
  util::MockTimeScope mock_time(1700000000);
  MockGossip node("node-a");

  const nlohmann::json payload = {{"node_id", "abc"}};
  auto first = node.gossip.CreateMessage(MessageType::BLOCK, payload);
  auto second = node.gossip.CreateMessage(MessageType::BLOCK, payload);

  REQUIRE(first.sender == "node-a");
  REQUIRE(first.timestamp == 1700000000000);
  REQUIRE(first.ttl == DEFAULT_TTL);
  REQUIRE(first.HasValidId());
  REQUIRE(first.message_id == second.message_id);

  auto other = node.gossip.CreateMessage(MessageType::BLOCK, {{"node_id", "abd"}});
  REQUIRE(other.message_id != first.message_id);
}

TEST_CASE("GossipProtocol - Peer and fallback registries", "[gossip]") {
  MockGossip node("self");

  node.gossip.AddPeer("b");
  node.gossip.AddPeer("a");
  node.gossip.AddPeer("a");
  node.gossip.AddPeer("self");
  node.gossip.AddPeer("");
  REQUIRE(node.gossip.GetPeers() == std::vector<std::string>{"a", "b"});

  node.gossip.RemovePeer("a");
  REQUIRE(node.gossip.GetPeers() == std::vector<std::string>{"b"});

  node.gossip.RegisterFallbackNode("f");
  node.gossip.RegisterFallbackNode("self");
  REQUIRE(node.gossip.GetFallbackNodes() == std::vector<std::string>{"f"});
  node.gossip.UnregisterFallbackNode("f");
  REQUIRE(node.gossip.GetFallbackNodes().empty());
}

TEST_CASE("GossipProtocol - Broadcast requires a running protocol", "[gossip]") {
  MockGossip node;
  node.gossip.AddPeer("p1");

  auto msg = node.gossip.CreateMessage(MessageType::BLOCK, {{"node_id", "n1"}});
  REQUIRE_FALSE(node.gossip.Broadcast(msg));
  REQUIRE_FALSE(node.gossip.SendDirect("p1", msg));
  REQUIRE(node.transport.sent_count() == 0);

  node.gossip.Start();
  REQUIRE(node.transport.attached());
  REQUIRE(node.gossip.Broadcast(msg));
  REQUIRE(node.transport.sent_count() == 1);
  REQUIRE(node.gossip.HasSeen(msg.message_id));
  REQUIRE(node.gossip.GetPendingAcks(msg.message_id) == std::set<std::string>{"p1"});

  node.gossip.Stop();
  REQUIRE_FALSE(node.transport.attached());
  REQUIRE(node.gossip.PendingAckCount() == 0);
}

TEST_CASE("GossipProtocol - Inbound messages are deduplicated and acknowledged", "[gossip]") {
  MockGossip node;
  node.gossip.AddPeer("p1");
  node.gossip.AddPeer("p2");
  node.gossip.Start();

  int handled = 0;
  node.gossip.RegisterHandler(MessageType::TRANSACTION,
                              [&](const std::string &from, const GossipMessage &msg) {
                                handled++;
                                return from == "p1";
                              });

  auto msg = ForeignMessage(MessageType::TRANSACTION, {{"tx", 1}}, "origin",
                            util::GetTimeMillis());

  SECTION("Handler runs once, every copy is acked") {
    node.transport.simulate_receive("p1", msg);
    node.transport.simulate_receive("p1", msg);

    REQUIRE(handled == 1);
    REQUIRE(node.gossip.GetStats().duplicates_dropped == 1);

    auto acks = node.transport.sent_messages(MessageType::ACK, "p1");
    REQUIRE(acks.size() == 2);
    REQUIRE(acks[0].payload["original_message_id"] == msg.message_id);
    REQUIRE(acks[0].ttl == 0);
  }

  SECTION("Relay decrements ttl and skips the sender") {
    node.transport.simulate_receive("p1", msg);

    REQUIRE(node.transport.sent_messages(MessageType::TRANSACTION, "p1").empty());
    auto relayed = node.transport.sent_messages(MessageType::TRANSACTION, "p2");
    REQUIRE(relayed.size() == 1);
    REQUIRE(relayed[0].ttl == DEFAULT_TTL - 1);
    REQUIRE(relayed[0].message_id == msg.message_id);
    REQUIRE(node.gossip.GetStats().messages_relayed == 1);
  }

  SECTION("Exhausted ttl is delivered but not relayed") {
    auto last_hop = ForeignMessage(MessageType::TRANSACTION, {{"tx", 2}}, "origin",
                                   util::GetTimeMillis(), 0);
    node.transport.simulate_receive("p1", last_hop);

    REQUIRE(handled == 1);
    REQUIRE(node.transport.sent_messages(MessageType::TRANSACTION).empty());
  }

  SECTION("ACKs are never acknowledged") {
    auto ack = ForeignMessage(MessageType::ACK, {{"original_message_id", "unknown"}}, "p1",
                              util::GetTimeMillis(), 0);
    node.transport.simulate_receive("p1", ack);
    node.transport.simulate_receive("p1", ack);
    REQUIRE(node.transport.sent_count() == 0);
  }
}

TEST_CASE("GossipProtocol - Invalid messages are dropped", "[gossip]") {
  MockGossip node;
  node.gossip.AddPeer("p1");
  node.gossip.Start();

  int handled = 0;
  node.gossip.RegisterHandler(MessageType::BLOCK, [&](const std::string &, const GossipMessage &) {
    handled++;
    return true;
  });

  SECTION("Malformed bytes") {
    const std::string garbage = "{\"type\":\"block\"";
    node.transport.simulate_receive("p1", std::vector<uint8_t>(garbage.begin(), garbage.end()));
  }

  SECTION("Tampered payload") {
    auto msg = ForeignMessage(MessageType::BLOCK, {{"node_id", "n1"}}, "origin",
                              util::GetTimeMillis());
    msg.payload["node_id"] = "n2";
    node.transport.simulate_receive("p1", msg);
  }

  REQUIRE(handled == 0);
  REQUIRE(node.gossip.GetStats().invalid_dropped == 1);
  REQUIRE(node.transport.sent_count() == 0);
  REQUIRE(node.gossip.SeenCount() == 0);
}

TEST_CASE("GossipProtocol - Session completion acks reach the ACK handler", "[gossip]") {
  MockGossip node;
  node.gossip.Start();

  std::string completed_session;
  node.gossip.RegisterHandler(MessageType::ACK, [&](const std::string &, const GossipMessage &msg) {
    completed_session = msg.payload.value("session_id", std::string());
    return true;
  });

  auto ack = ForeignMessage(MessageType::ACK,
                            {{"session_id", "s-1"}, {"received_blocks", nlohmann::json::array()}},
                            "peer", util::GetTimeMillis(), 0);
  node.transport.simulate_receive("peer", ack);
  REQUIRE(completed_session == "s-1");
}

TEST_CASE("GossipProtocol - Sync requests are answered from the providers", "[gossip][sync]") {
  MockGossip node;
  node.gossip.Start();

  node.gossip.SetTipsProvider([]() {
    return GossipProtocol::TipsReport{{"t1"}, {"r", "t1"}};
  });
  node.gossip.SetBlockProvider([](const std::string &id) -> std::optional<nlohmann::json> {
    if (id == "x") {
      return nlohmann::json{{"node_id", "x"}};
    }
    return std::nullopt;
  });

  SECTION("get_tips") {
    auto request = ForeignMessage(MessageType::SYNC_REQUEST,
                                  {{"request_type", SYNC_GET_TIPS}, {"requester", "peer"}, {"pass", 1}},
                                  "peer", util::GetTimeMillis());
    node.transport.simulate_receive("peer", request);

    auto responses = node.transport.sent_messages(MessageType::SYNC_RESPONSE, "peer");
    REQUIRE(responses.size() == 1);
    REQUIRE(responses[0].ttl == 0);
    REQUIRE(responses[0].payload["request_type"] == SYNC_GET_TIPS);
    REQUIRE(responses[0].payload["request_id"] == request.message_id);
    REQUIRE(responses[0].payload["tips"] == nlohmann::json::array({"t1"}));
    REQUIRE(responses[0].payload["known"] == nlohmann::json::array({"r", "t1"}));
  }

  SECTION("missing_blocks falls back to cached BLOCK messages") {
    auto block = ForeignMessage(MessageType::BLOCK, {{"node_id", "y"}, {"height", 4}}, "origin",
                                util::GetTimeMillis());
    node.transport.simulate_receive("peer", block);

    auto request = ForeignMessage(MessageType::SYNC_REQUEST,
                                  {{"missing_blocks", {"x", "y", "z"}},
                                   {"session_id", "s-9"},
                                   {"requester", "peer"}},
                                  "peer", util::GetTimeMillis());
    node.transport.simulate_receive("peer", request);

    auto responses = node.transport.sent_messages(MessageType::SYNC_RESPONSE, "peer");
    REQUIRE(responses.size() == 1);
    const auto &blocks = responses[0].payload["blocks"];
    REQUIRE(blocks.size() == 2);
    REQUIRE(blocks["x"]["node_id"] == "x");
    REQUIRE(blocks["y"]["height"] == 4);
    REQUIRE_FALSE(blocks.contains("z"));
    REQUIRE(responses[0].payload["session_id"] == "s-9");
  }

  SECTION("Sync requests are not relayed") {
    node.gossip.AddPeer("other");
    auto request = ForeignMessage(MessageType::SYNC_REQUEST, {{"request_type", SYNC_GET_TIPS}},
                                  "peer", util::GetTimeMillis());
    node.transport.simulate_receive("peer", request);
    REQUIRE(node.transport.sent_messages(MessageType::SYNC_REQUEST).empty());
  }
}

TEST_CASE("GossipProtocol - Seen cache expires by age", "[gossip]") {
  util::MockTimeScope mock_time(1700000000);
  MockGossip node;
  node.gossip.Start();

  auto block = ForeignMessage(MessageType::BLOCK, {{"node_id", "n1"}}, "origin",
                              util::GetTimeMillis());
  node.transport.simulate_receive("peer", block);
  REQUIRE(node.gossip.SeenCount() == 1);
  REQUIRE(node.gossip.CacheSize() == 1);

  util::SetMockTime(1700000000 + 30 * 60);
  node.gossip.CleanupSeenMessages();
  REQUIRE(node.gossip.SeenCount() == 1);

  util::SetMockTime(1700000000 + 61 * 60);
  node.gossip.CleanupSeenMessages();
  REQUIRE(node.gossip.SeenCount() == 0);
  REQUIRE(node.gossip.CacheSize() == 0);
  REQUIRE_FALSE(node.gossip.GetCachedMessage(block.message_id).has_value());

  // Forgotten messages are accepted again
  node.transport.simulate_receive("peer", block);
  REQUIRE(node.gossip.GetStats().duplicates_dropped == 0);
}

TEST_CASE("GossipProtocol - Acked broadcast completes without fallback", "[gossip][fallback]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  GossipNode a(net, io, "A");
  GossipNode b(net, io, "B");
  GossipNode c(net, io, "C");
  GossipNode f(net, io, "F");

  for (auto *node : {&a, &b, &c, &f}) {
    node->gossip.Start();
  }
  a.gossip.AddPeer("B");
  a.gossip.AddPeer("C");
  a.gossip.RegisterFallbackNode("F");

  std::optional<bool> result;
  auto msg = a.gossip.CreateMessage(MessageType::BLOCK, {{"node_id", "n1"}});
  REQUIRE(a.gossip.Broadcast(msg, true, [&](bool ok) { result = ok; }));

  RunFor(io, 300ms);

  REQUIRE(result == std::optional<bool>(true));
  REQUIRE(a.gossip.PendingAckCount() == 0);
  REQUIRE(a.gossip.GetStats().acks_received == 2);
  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST).empty());
  REQUIRE(b.gossip.HasSeen(msg.message_id));
  REQUIRE(c.gossip.HasSeen(msg.message_id));
}

TEST_CASE("GossipProtocol - Silent peer triggers exactly one fallback", "[gossip][fallback]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  GossipNode a(net, io, "A");
  GossipNode b(net, io, "B");
  GossipNode f(net, io, "F");
  net.CreateEndpoint("P");
  net.SetSilent("P", true);

  for (auto *node : {&a, &b, &f}) {
    node->gossip.Start();
  }
  a.gossip.AddPeer("B");
  a.gossip.AddPeer("F");
  a.gossip.AddPeer("P");
  a.gossip.RegisterFallbackNode("F");

  std::optional<bool> result;
  auto msg = a.gossip.CreateMessage(MessageType::BLOCK, {{"node_id", "n1"}});
  REQUIRE(a.gossip.Broadcast(msg, true, [&](bool ok) { result = ok; }));

  RunFor(io, 50ms);
  REQUIRE(a.gossip.GetPendingAcks(msg.message_id) == std::set<std::string>{"P"});

  RunFor(io, 400ms);

  auto requests = net.SentMessages(MessageType::FALLBACK_REQUEST);
  REQUIRE(requests.size() == 1);
  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST, "F").size() == 1);
  REQUIRE(requests[0].payload["failed_peer"] == "P");
  REQUIRE(requests[0].payload["original_message_id"] == msg.message_id);
  REQUIRE(requests[0].payload["retry_count"] == 0);

  REQUIRE(f.gossip.GetStats().fallback_redeliveries == 1);
  // Original message re-sent by F to P, unchanged
  auto redelivered = net.SentMessages(MessageType::BLOCK, "P");
  REQUIRE(redelivered.size() == 2);
  REQUIRE(redelivered[1].message_id == msg.message_id);

  auto responses = net.SentMessages(MessageType::FALLBACK_RESPONSE, "A");
  REQUIRE(responses.size() == 1);
  REQUIRE(responses[0].payload["delivered"] == true);

  REQUIRE(result == std::optional<bool>(false));
  REQUIRE(a.gossip.PendingAckCount() == 0);
}

TEST_CASE("GossipProtocol - Send failure falls back immediately", "[gossip][fallback]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  GossipNode a(net, io, "A");
  GossipNode b(net, io, "B");
  GossipNode f(net, io, "F");
  net.CreateEndpoint("P");
  net.SetUnreachable("P", true);

  for (auto *node : {&a, &b, &f}) {
    node->gossip.Start();
  }
  a.gossip.AddPeer("B");
  a.gossip.AddPeer("P");
  a.gossip.RegisterFallbackNode("F");

  std::optional<bool> result;
  auto msg = a.gossip.CreateMessage(MessageType::TRANSACTION, {{"tx", "t1"}});
  REQUIRE(a.gossip.Broadcast(msg, true, [&](bool ok) { result = ok; }));

  // Requested before the reactor has run at all
  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST, "F").size() == 1);
  REQUIRE(a.gossip.GetStats().send_failures == 1);
  REQUIRE(a.gossip.GetPendingAcks(msg.message_id) == std::set<std::string>{"B"});

  RunFor(io, 400ms);

  // The ack wait does not request a second fallback for P
  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST).size() == 1);
  REQUIRE(result == std::optional<bool>(false));

  auto responses = net.SentMessages(MessageType::FALLBACK_RESPONSE, "A");
  REQUIRE(responses.size() == 1);
  REQUIRE(responses[0].payload["delivered"] == false);
}

TEST_CASE("GossipProtocol - Control messages do not fall back", "[gossip][fallback]") {
  MockGossip node;
  node.transport.set_failing("p1");
  node.gossip.AddPeer("p1");
  node.gossip.RegisterFallbackNode("f");
  node.gossip.Start();

  auto msg = node.gossip.CreateMessage(MessageType::PEER_DISCOVERY, {{"peers", {"x"}}});
  REQUIRE(node.gossip.Broadcast(msg, false));
  REQUIRE(node.transport.sent_messages(MessageType::FALLBACK_REQUEST).empty());
  REQUIRE(node.gossip.GetStats().send_failures == 1);
}

TEST_CASE("GossipProtocol - No fallback nodes means no fallback requests", "[gossip][fallback]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  GossipNode a(net, io, "A");
  GossipNode b(net, io, "B");
  net.CreateEndpoint("P");
  net.SetSilent("P", true);

  a.gossip.Start();
  b.gossip.Start();
  a.gossip.AddPeer("B");
  a.gossip.AddPeer("P");

  std::optional<bool> result;
  auto msg = a.gossip.CreateMessage(MessageType::BLOCK, {{"node_id", "n1"}});
  REQUIRE(a.gossip.Broadcast(msg, true, [&](bool ok) { result = ok; }));

  RunFor(io, 400ms);

  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST).empty());
  REQUIRE(result == std::optional<bool>(false));
  REQUIRE(a.gossip.PendingAckCount() == 0);
}

TEST_CASE("GossipProtocol - TTL bounds propagation along a line", "[gossip]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  const std::vector<std::string> ids{"A", "B", "C", "D", "E", "F"};

  std::vector<std::unique_ptr<GossipNode>> nodes;
  for (const auto &id : ids) {
    nodes.push_back(std::make_unique<GossipNode>(net, io, id));
  }
  for (size_t i = 0; i < nodes.size(); ++i) {
    if (i > 0) {
      nodes[i]->gossip.AddPeer(ids[i - 1]);
    }
    if (i + 1 < nodes.size()) {
      nodes[i]->gossip.AddPeer(ids[i + 1]);
    }
    nodes[i]->gossip.Start();
  }

  std::map<std::string, int> seen_ttl;
  for (size_t i = 1; i < nodes.size(); ++i) {
    const std::string id = ids[i];
    nodes[i]->gossip.RegisterHandler(MessageType::TRANSACTION,
                                     [&seen_ttl, id](const std::string &, const GossipMessage &msg) {
                                       seen_ttl[id] = msg.ttl;
                                       return true;
                                     });
  }

  auto msg = nodes[0]->gossip.CreateMessage(MessageType::TRANSACTION, {{"tx", "line"}});
  REQUIRE(msg.ttl == 3);
  REQUIRE(nodes[0]->gossip.Broadcast(msg, false));

  RunFor(io, 200ms);

  REQUIRE(seen_ttl["B"] == 3);
  REQUIRE(seen_ttl["C"] == 2);
  REQUIRE(seen_ttl["D"] == 1);
  REQUIRE(seen_ttl["E"] == 0);
  REQUIRE(seen_ttl.count("F") == 0);
  REQUIRE_FALSE(nodes[5]->gossip.HasSeen(msg.message_id));
}

TEST_CASE("GossipProtocol - Stopped protocol ignores traffic", "[gossip]") {
  MockGossip node;
  node.gossip.Start();

  int handled = 0;
  node.gossip.RegisterHandler(MessageType::BLOCK, [&](const std::string &, const GossipMessage &) {
    handled++;
    return true;
  });
  node.gossip.Stop();

  auto msg = ForeignMessage(MessageType::BLOCK, {{"node_id", "n1"}}, "origin",
                            util::GetTimeMillis());
  node.gossip.HandleMessage("peer", msg);
  node.transport.simulate_receive("peer", msg);

  REQUIRE(handled == 0);
  REQUIRE(node.transport.sent_count() == 0);
}

TEST_CASE("GossipProtocol - Unacknowledged control messages fall back too", "[gossip][fallback]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);
  GossipNode a(net, io, "A");
  GossipNode f(net, io, "F");
  net.CreateEndpoint("P");
  net.SetSilent("P", true);

  a.gossip.Start();
  f.gossip.Start();
  a.gossip.AddPeer("F");
  a.gossip.AddPeer("P");
  a.gossip.RegisterFallbackNode("F");

  std::optional<bool> result;
  auto msg = a.gossip.CreateMessage(MessageType::SYNC_REQUEST,
                                    {{"request_type", SYNC_GET_TIPS}, {"requester", "A"}});
  REQUIRE(a.gossip.Broadcast(msg, true, [&](bool ok) { result = ok; }));

  RunFor(io, 400ms);

  auto requests = net.SentMessages(MessageType::FALLBACK_REQUEST);
  REQUIRE(requests.size() == 1);
  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST, "F").size() == 1);
  REQUIRE(requests[0].payload["failed_peer"] == "P");
  REQUIRE(requests[0].payload["original_message_id"] == msg.message_id);

  // F saw the request itself, so it can re-deliver it to P
  REQUIRE(f.gossip.GetStats().fallback_redeliveries == 1);
  REQUIRE(net.SentMessages(MessageType::SYNC_REQUEST, "P").size() == 2);
  REQUIRE(result == std::optional<bool>(false));
  REQUIRE(a.gossip.PendingAckCount() == 0);
}

TEST_CASE("GossipProtocol - Ack monitor expires stale pending entries", "[gossip][fallback]") {
  boost::asio::io_context io;
  InMemoryNetwork net(io);

  // Ack wait longer than the expiry: only the monitor can settle the entry
  auto config = FastGossipConfig();
  config.ack_timeout = 10s;
  config.pending_ack_expiry = 100ms;
  config.ack_monitor_interval = 20ms;

  GossipNode a(net, io, "A", config);
  GossipNode b(net, io, "B");
  GossipNode f(net, io, "F");
  net.CreateEndpoint("P");
  net.SetSilent("P", true);

  for (auto *node : {&a, &b, &f}) {
    node->gossip.Start();
  }
  a.gossip.AddPeer("B");
  a.gossip.AddPeer("P");
  a.gossip.RegisterFallbackNode("F");

  std::optional<bool> result;
  auto msg = a.gossip.CreateMessage(MessageType::BLOCK, {{"node_id", "n-expiry"}});
  REQUIRE(a.gossip.Broadcast(msg, true, [&](bool ok) { result = ok; }));

  RunFor(io, 50ms);
  REQUIRE(a.gossip.GetPendingAcks(msg.message_id) == std::set<std::string>{"P"});
  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST).empty());

  RunFor(io, 300ms);

  auto requests = net.SentMessages(MessageType::FALLBACK_REQUEST, "F");
  REQUIRE(requests.size() == 1);
  REQUIRE(requests[0].payload["failed_peer"] == "P");
  REQUIRE(net.SentMessages(MessageType::FALLBACK_REQUEST).size() == 1);
  REQUIRE(a.gossip.PendingAckCount() == 0);
  REQUIRE(result == std::optional<bool>(false));
  // The cancelled ack wait left no task behind beyond the two repeating ones
  REQUIRE(a.scheduler.ActiveTaskCount() == 2);
}
