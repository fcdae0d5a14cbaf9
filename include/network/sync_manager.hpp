#pragma once

/*
 * SyncManager - gap detection and reconciliation between DAG replicas
 *
 * Functionality:
 * - One top-level pass at a time: IDLE -> SYNCING -> VALIDATING -> IDLE
 *   (ERROR if the pass throws). A pass requested while another is SYNCING or
 *   VALIDATING is rejected with a warning, never queued.
 * - Discovery: broadcast SYNC_REQUEST{request_type: "get_tips"}, wait
 *   settle_delay, then compare every peer's reported ids against the local
 *   tips. Ids that are neither local tips nor already in the DAG form the
 *   missing set.
 * - Reconciliation: one SyncSession per known peer, each sent the full
 *   missing list by direct SYNC_REQUEST. Delivered nodes are inserted
 *   parents-first (height, then timestamp) and the session is closed when
 *   every id is resolved, or after max_retries re-requests.
 * - Session monitor: sessions idle for longer than session_timeout are
 *   retried while budget remains, otherwise force-closed.
 * - Periodic re-sync every sync_interval bounds the recovery time for gaps
 *   that both direct gossip and fallback delivery missed.
 *
 * THREAD SAFETY: none; runs on the reactor thread with GossipProtocol.
 */

#include "dag/dag_manager.hpp"
#include "network/gossip_protocol.hpp"
#include "util/task_scheduler.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace dagsync {
namespace network {

enum class SyncState {
  IDLE,
  SYNCING,
  VALIDATING,
  ERROR
};

std::string SyncStateToString(SyncState state);

// Per-peer reconciliation exchange; destroyed on resolution, exhaustion or timeout
struct SyncSession {
  std::string peer_id;
  std::string session_id;
  int64_t start_time{0};    // Unix milliseconds
  int64_t last_activity{0}; // Unix milliseconds
  std::set<std::string> missing_blocks;
  std::map<std::string, dag::DAGNode> received_blocks;
  SyncState state{SyncState::SYNCING};
  int retries{0};
};

class SyncManager {
public:
  struct Config {
    Config();
    std::chrono::milliseconds settle_delay{std::chrono::seconds(5)};
    std::chrono::milliseconds session_timeout{std::chrono::seconds(30)};
    int max_retries{3};
    std::chrono::milliseconds monitor_interval{std::chrono::seconds(1)};
    // Periodic full pass (0 = only on demand)
    std::chrono::milliseconds sync_interval{std::chrono::seconds(300)};
    // Run one pass as soon as Start() is called
    bool sync_on_start{true};
  };

  struct SyncStatus {
    SyncState state{SyncState::IDLE};
    size_t active_sessions{0};
    size_t total_missing_blocks{0};
    size_t total_received_blocks{0};
  };

  struct Stats {
    uint64_t passes_started{0};
    uint64_t passes_rejected{0};
    uint64_t sessions_opened{0};
    uint64_t sessions_completed{0};
    uint64_t sessions_failed{0};
    uint64_t retries_sent{0};
    uint64_t nodes_received{0};
  };

  SyncManager(std::string node_id, dag::DAGManager &dag, GossipProtocol &gossip,
              util::TaskScheduler &scheduler, const Config &config = Config{});
  ~SyncManager();

  // Non-copyable, non-movable (reference members)
  SyncManager(const SyncManager &) = delete;
  SyncManager &operator=(const SyncManager &) = delete;

  // Installs gossip hooks (SYNC_RESPONSE handler, tips and block providers)
  // and schedules the session monitor and periodic re-sync
  void Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Begin one discovery/reconciliation pass.
  // @return false if a pass is already in flight or the request could not be sent
  bool SyncWithNetwork();

  // SYNC_RESPONSE handler (tip reports and block deliveries)
  // @return true if the response matched an outstanding request or session
  bool HandleSyncResponse(const std::string &from, const GossipMessage &msg);

  SyncState GetState() const { return state_; }
  SyncStatus GetSyncStatus() const;
  const Stats &GetStats() const { return stats_; }
  size_t ActiveSessionCount() const { return sessions_.size(); }
  bool HasSession(const std::string &peer_id) const { return sessions_.count(peer_id) > 0; }

  // One monitor pass (also runs every monitor_interval)
  void MonitorSessions();

private:
  bool HandleTipsReport(const std::string &from, const GossipMessage &msg);
  void FinishDiscovery();
  std::set<std::string> IdentifyMissingBlocks() const;
  void OpenSessions(const std::set<std::string> &missing);
  void SendSessionRequest(SyncSession &session);
  size_t ApplyBlocks(SyncSession &session, const nlohmann::json &blocks);
  void DropResolved(SyncSession &session);
  void RetryOrClose(const std::string &peer_id, const char *reason);
  void CompleteSession(const std::string &peer_id, bool resolved);

  const std::string node_id_;
  dag::DAGManager &dag_;
  GossipProtocol &gossip_;
  util::TaskScheduler &scheduler_;
  const Config config_;
  bool running_{false};

  SyncState state_{SyncState::IDLE};
  std::string tips_request_id_;
  // peer id -> ids reported by that peer during the current pass
  std::map<std::string, std::set<std::string>> peer_reports_;
  std::map<std::string, SyncSession> sessions_;

  util::TaskScheduler::TaskId initial_task_{util::TaskScheduler::INVALID_TASK};
  util::TaskScheduler::TaskId settle_task_{util::TaskScheduler::INVALID_TASK};
  util::TaskScheduler::TaskId monitor_task_{util::TaskScheduler::INVALID_TASK};
  util::TaskScheduler::TaskId periodic_task_{util::TaskScheduler::INVALID_TASK};

  Stats stats_;
};

inline SyncManager::Config::Config() = default;

} // namespace network
} // namespace dagsync
