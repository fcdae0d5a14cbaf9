#pragma once

#include "network/gossip_message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/transport.hpp"
#include "util/task_scheduler.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace dagsync {
namespace network {

// GossipProtocol - best-effort epidemic dissemination with dedup, acks and fallback
//
// Carries opaque JSON payloads; it has no knowledge of the DAG. Upper layers
// plug in through RegisterHandler (inbound messages by type) and the
// tips/block providers (answers to SYNC_REQUEST).
//
// Message handling:
// - Every inbound message is deduplicated by message_id via seen_messages_.
// - SYNC_REQUEST, FALLBACK_REQUEST and ACK are handled here; every other
//   type is dispatched to its registered handler and, while ttl > 0,
//   relayed onward with ttl - 1 and no ack requirement.
// - Every non-ACK message (duplicates included) is acknowledged to the
//   transport-level sender. ACKs are never acknowledged.
//
// Delivery guarantees for Broadcast(require_ack=true):
// - A peer whose send fails (BLOCK / TRANSACTION) gets one fallback request
//   immediately and is dropped from the pending set.
// - Peers still pending after ack_timeout get one fallback request each,
//   whatever the message type, and the pending entry is cleared. Recovery
//   beyond that is SyncManager's job.
//
// Scheduled tasks (via util::TaskScheduler):
// - cache cleanup, every cleanup_interval: drop seen/cached entries older
//   than message_max_age
// - ack monitor, every ack_monitor_interval: drop empty pending entries,
//   fall back for entries older than pending_ack_expiry
// - ack wait, once per acked broadcast after ack_timeout
//
// THREAD SAFETY: none. All methods must run on the scheduler's io_context
// thread (single-threaded reactor); transport callbacks are expected there too.
class GossipProtocol {
public:
  struct Config {
    Config();
    int default_ttl{DEFAULT_TTL};
    std::chrono::milliseconds ack_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds ack_monitor_interval{std::chrono::seconds(1)};
    std::chrono::milliseconds pending_ack_expiry{std::chrono::seconds(30)};
    std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};
    std::chrono::milliseconds message_max_age{std::chrono::hours(1)};
  };

  struct Stats {
    uint64_t messages_sent{0};
    uint64_t send_failures{0};
    uint64_t messages_received{0};
    uint64_t duplicates_dropped{0};
    uint64_t invalid_dropped{0};
    uint64_t messages_relayed{0};
    uint64_t acks_received{0};
    uint64_t fallback_requests_sent{0};
    uint64_t fallback_redeliveries{0};
  };

  // Answer to a "get_tips" SYNC_REQUEST: tip ids plus every id known locally
  struct TipsReport {
    std::vector<std::string> tips;
    std::vector<std::string> known;
  };
  using TipsProvider = std::function<TipsReport()>;
  // Wire form of the node with the given id, or nullopt if unknown
  using BlockProvider = std::function<std::optional<nlohmann::json>(const std::string &)>;
  // Invoked once per acked broadcast: true if every peer was reached and acked in time
  using CompletionCallback = std::function<void(bool all_acked)>;

  GossipProtocol(std::string node_id, Transport &transport,
                 util::TaskScheduler &scheduler, const Config &config = Config{});
  ~GossipProtocol();

  GossipProtocol(const GossipProtocol &) = delete;
  GossipProtocol &operator=(const GossipProtocol &) = delete;

  // Lifecycle: attaches to the transport and schedules maintenance tasks
  void Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Peers
  void AddPeer(const std::string &peer_id);
  void RemovePeer(const std::string &peer_id);
  std::vector<std::string> GetPeers() const;

  void RegisterFallbackNode(const std::string &node_id);
  void UnregisterFallbackNode(const std::string &node_id);
  std::vector<std::string> GetFallbackNodes() const;

  // Stamp local time, sender and default ttl; derive message_id
  GossipMessage CreateMessage(MessageType type, const nlohmann::json &payload) const;

  // Send to every known peer. Returns false only if the protocol is not running.
  bool Broadcast(const GossipMessage &msg, bool require_ack = true,
                 CompletionCallback on_complete = nullptr);

  // Send to one peer without ack tracking
  bool SendDirect(const std::string &peer_id, const GossipMessage &msg);

  // Inbound entry points (raw bytes from the transport, or a decoded message)
  void HandleMessage(const std::string &from, const std::vector<uint8_t> &data);
  void HandleMessage(const std::string &from, const GossipMessage &msg);

  // Upper-layer hooks
  void RegisterHandler(MessageType type, MessageDispatcher::MessageHandler handler);
  void UnregisterHandler(MessageType type);
  void SetTipsProvider(TipsProvider provider) { tips_provider_ = std::move(provider); }
  void SetBlockProvider(BlockProvider provider) { block_provider_ = std::move(provider); }

  // Inspection
  bool HasSeen(const std::string &message_id) const;
  std::optional<GossipMessage> GetCachedMessage(const std::string &message_id) const;
  std::set<std::string> GetPendingAcks(const std::string &message_id) const;
  size_t PendingAckCount() const { return pending_acks_.size(); }
  size_t SeenCount() const { return seen_messages_.size(); }
  size_t CacheSize() const { return message_cache_.size(); }
  const Stats &GetStats() const { return stats_; }
  const std::string &node_id() const { return node_id_; }

  // Run one cache cleanup pass now (also runs on cleanup_interval)
  void CleanupSeenMessages();

private:
  struct PendingAck {
    std::set<std::string> peers;
    bool send_failed{false};
    std::chrono::steady_clock::time_point created;
    util::TaskScheduler::TaskId timeout_task{util::TaskScheduler::INVALID_TASK};
    CompletionCallback on_complete;
  };

  void Remember(const GossipMessage &msg);
  void Forget(const std::string &message_id);
  bool SendToPeer(const std::string &peer_id, const GossipMessage &msg);
  void Relay(const std::string &from, const GossipMessage &msg);
  void SendAck(const std::string &to, const GossipMessage &msg);

  void HandleTransmissionFailure(const GossipMessage &msg, const std::string &failed_peer);
  void HandleSyncRequest(const std::string &from, const GossipMessage &msg);
  void HandleFallbackRequest(const std::string &from, const GossipMessage &msg);
  void HandleAck(const std::string &from, const GossipMessage &msg);

  void OnAckTimeout(const std::string &message_id);
  void MonitorPendingAcks();
  void FinishPending(const std::string &message_id, bool all_acked);

  const std::string node_id_;
  Transport &transport_;
  util::TaskScheduler &scheduler_;
  const Config config_;
  bool running_{false};

  std::set<std::string> peers_;
  std::set<std::string> fallback_nodes_;

  // message_id -> message timestamp (ms)
  std::unordered_map<std::string, int64_t> seen_messages_;
  std::unordered_map<std::string, GossipMessage> message_cache_;
  // node_id carried by a cached BLOCK -> message_id
  std::unordered_map<std::string, std::string> block_index_;
  std::map<std::string, PendingAck> pending_acks_;

  MessageDispatcher dispatcher_;
  TipsProvider tips_provider_;
  BlockProvider block_provider_;

  util::TaskScheduler::TaskId cleanup_task_{util::TaskScheduler::INVALID_TASK};
  util::TaskScheduler::TaskId ack_monitor_task_{util::TaskScheduler::INVALID_TASK};

  Stats stats_;
};

inline GossipProtocol::Config::Config() = default;

} // namespace network
} // namespace dagsync
