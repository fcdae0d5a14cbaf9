#include "network/sync_manager.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <exception>
#include <iterator>
#include <vector>

namespace dagsync {
namespace network {

std::string SyncStateToString(SyncState state) {
  switch (state) {
  case SyncState::IDLE:
    return "idle";
  case SyncState::SYNCING:
    return "syncing";
  case SyncState::VALIDATING:
    return "validating";
  case SyncState::ERROR:
    return "error";
  }
  return "unknown";
}

SyncManager::SyncManager(std::string node_id, dag::DAGManager &dag, GossipProtocol &gossip,
                         util::TaskScheduler &scheduler, const Config &config)
    : node_id_(std::move(node_id)), dag_(dag), gossip_(gossip), scheduler_(scheduler),
      config_(config) {}

SyncManager::~SyncManager() { Stop(); }

void SyncManager::Start() {
  if (running_) {
    return;
  }
  running_ = true;

  gossip_.RegisterHandler(MessageType::SYNC_RESPONSE,
                          [this](const std::string &from, const GossipMessage &msg) {
                            return HandleSyncResponse(from, msg);
                          });

  // Answer peers' sync requests from the local DAG
  gossip_.SetTipsProvider([this]() {
    GossipProtocol::TipsReport report;
    report.tips = dag_.GetTipIds();
    report.known = dag_.GetNodeIds();
    return report;
  });
  gossip_.SetBlockProvider([this](const std::string &id) -> std::optional<nlohmann::json> {
    auto node = dag_.GetNode(id);
    if (!node) {
      return std::nullopt;
    }
    return node->ToJson();
  });

  monitor_task_ = scheduler_.ScheduleRepeating("sync-monitor", config_.monitor_interval,
                                               [this]() { MonitorSessions(); });
  if (config_.sync_interval.count() > 0) {
    periodic_task_ = scheduler_.ScheduleRepeating("sync-periodic", config_.sync_interval,
                                                  [this]() { SyncWithNetwork(); });
  }
  if (config_.sync_on_start) {
    initial_task_ = scheduler_.ScheduleOnce("sync-initial", std::chrono::milliseconds(0),
                                            [this]() {
                                              initial_task_ = util::TaskScheduler::INVALID_TASK;
                                              SyncWithNetwork();
                                            });
  }

  LOG_SYNC_INFO("Sync manager started (interval={}ms, timeout={}ms, max_retries={})",
                config_.sync_interval.count(), config_.session_timeout.count(),
                config_.max_retries);
}

void SyncManager::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;

  for (auto *task : {&initial_task_, &settle_task_, &monitor_task_, &periodic_task_}) {
    scheduler_.Cancel(*task);
    *task = util::TaskScheduler::INVALID_TASK;
  }

  gossip_.UnregisterHandler(MessageType::SYNC_RESPONSE);
  gossip_.SetTipsProvider(nullptr);
  gossip_.SetBlockProvider(nullptr);

  sessions_.clear();
  peer_reports_.clear();
  tips_request_id_.clear();
  if (state_ == SyncState::SYNCING || state_ == SyncState::VALIDATING) {
    state_ = SyncState::IDLE;
  }
  LOG_SYNC_INFO("Sync manager stopped");
}

bool SyncManager::SyncWithNetwork() {
  if (state_ == SyncState::SYNCING || state_ == SyncState::VALIDATING) {
    stats_.passes_rejected++;
    LOG_SYNC_WARN("Sync already in progress ({})", SyncStateToString(state_));
    return false;
  }
  if (!gossip_.IsRunning()) {
    LOG_SYNC_WARN("Cannot sync: gossip layer is not running");
    return false;
  }

  state_ = SyncState::SYNCING;
  stats_.passes_started++;
  peer_reports_.clear();

  try {
    GossipMessage request = gossip_.CreateMessage(
        MessageType::SYNC_REQUEST, {{"request_type", SYNC_GET_TIPS},
                                    {"requester", node_id_},
                                    {"pass", stats_.passes_started}});
    tips_request_id_ = request.message_id;

    if (!gossip_.Broadcast(request, true)) {
      state_ = SyncState::ERROR;
      return false;
    }
    settle_task_ = scheduler_.ScheduleOnce("sync-settle", config_.settle_delay, [this]() {
      settle_task_ = util::TaskScheduler::INVALID_TASK;
      FinishDiscovery();
    });
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Network sync failed to start: {}", e.what());
    state_ = SyncState::ERROR;
    return false;
  }

  LOG_SYNC_DEBUG("Sync pass {} started ({} peers)", stats_.passes_started,
                 gossip_.GetPeers().size());
  return true;
}

void SyncManager::FinishDiscovery() {
  try {
    state_ = SyncState::VALIDATING;
    tips_request_id_.clear();

    const std::set<std::string> missing = IdentifyMissingBlocks();
    if (missing.empty()) {
      LOG_SYNC_DEBUG("No gaps found ({} peers reported)", peer_reports_.size());
    } else {
      LOG_SYNC_INFO("{} missing nodes reported by {} peers", missing.size(),
                    peer_reports_.size());
      OpenSessions(missing);
    }
    peer_reports_.clear();
    state_ = SyncState::IDLE;
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Network sync failed: {}", e.what());
    state_ = SyncState::ERROR;
  }
}

std::set<std::string> SyncManager::IdentifyMissingBlocks() const {
  const std::vector<std::string> tip_ids = dag_.GetTipIds();
  const std::set<std::string> local_tips(tip_ids.begin(), tip_ids.end());

  std::set<std::string> missing;
  for (const auto &[peer, reported] : peer_reports_) {
    for (const auto &id : reported) {
      if (local_tips.count(id) == 0 && !dag_.HasNode(id)) {
        missing.insert(id);
      }
    }
  }
  return missing;
}

void SyncManager::OpenSessions(const std::set<std::string> &missing) {
  const int64_t now = util::GetTimeMillis();

  for (const auto &peer : gossip_.GetPeers()) {
    auto existing = sessions_.find(peer);
    if (existing != sessions_.end()) {
      // Fold the new gaps into the session already open with this peer
      existing->second.missing_blocks.insert(missing.begin(), missing.end());
      SendSessionRequest(existing->second);
      continue;
    }

    SyncSession session;
    session.peer_id = peer;
    session.session_id = node_id_ + "_" + peer + "_" + std::to_string(now);
    session.start_time = now;
    session.last_activity = now;
    session.missing_blocks = missing;
    session.state = SyncState::SYNCING;

    auto [it, inserted] = sessions_.emplace(peer, std::move(session));
    stats_.sessions_opened++;
    SendSessionRequest(it->second);
  }
}

void SyncManager::SendSessionRequest(SyncSession &session) {
  nlohmann::json payload;
  payload["missing_blocks"] =
      std::vector<std::string>(session.missing_blocks.begin(), session.missing_blocks.end());
  payload["session_id"] = session.session_id;
  payload["requester"] = node_id_;
  if (session.retries > 0) {
    payload["retry"] = session.retries;
  }

  session.last_activity = util::GetTimeMillis();
  GossipMessage request = gossip_.CreateMessage(MessageType::SYNC_REQUEST, payload);
  if (!gossip_.SendDirect(session.peer_id, request)) {
    LOG_SYNC_DEBUG("Sync request to {} failed; waiting for session timeout", session.peer_id);
  }
}

bool SyncManager::HandleSyncResponse(const std::string &from, const GossipMessage &msg) {
  const nlohmann::json &payload = msg.payload;
  if (payload.value("request_type", std::string()) == SYNC_GET_TIPS) {
    return HandleTipsReport(from, msg);
  }

  auto it = sessions_.find(from);
  if (it == sessions_.end()) {
    LOG_SYNC_WARN("Received sync response from unknown peer: {}", from);
    return false;
  }
  SyncSession &session = it->second;

  if (payload.contains("session_id") &&
      payload["session_id"] != nlohmann::json(session.session_id)) {
    LOG_SYNC_DEBUG("Ignoring response from {} for stale session", from);
    return false;
  }

  session.last_activity = util::GetTimeMillis();
  session.state = SyncState::VALIDATING;

  size_t added = 0;
  auto blocks = payload.find("blocks");
  if (blocks != payload.end() && blocks->is_object()) {
    added = ApplyBlocks(session, *blocks);
  }
  DropResolved(session);

  LOG_SYNC_DEBUG("Session with {}: {} nodes added, {} still missing", from, added,
                 session.missing_blocks.size());

  if (session.missing_blocks.empty()) {
    session.state = SyncState::IDLE;
    CompleteSession(from, true);
    return true;
  }

  session.state = SyncState::SYNCING;
  RetryOrClose(from, "incomplete response");
  return true;
}

bool SyncManager::HandleTipsReport(const std::string &from, const GossipMessage &msg) {
  const nlohmann::json &payload = msg.payload;
  if (state_ != SyncState::SYNCING ||
      payload.value("request_id", std::string()) != tips_request_id_) {
    LOG_SYNC_DEBUG("Ignoring stale tip report from {}", from);
    return false;
  }

  auto &reported = peer_reports_[from];
  for (const char *key : {"tips", "known"}) {
    auto list = payload.find(key);
    if (list == payload.end() || !list->is_array()) {
      continue;
    }
    for (const auto &id : *list) {
      if (id.is_string()) {
        reported.insert(id.get<std::string>());
      }
    }
  }
  LOG_SYNC_DEBUG("Peer {} reported {} node ids", from, reported.size());
  return true;
}

size_t SyncManager::ApplyBlocks(SyncSession &session, const nlohmann::json &blocks) {
  std::vector<dag::DAGNode> candidates;
  for (const auto &item : blocks.items()) {
    if (session.missing_blocks.count(item.key()) == 0) {
      continue;
    }
    auto node = dag::DAGNode::FromJson(item.value());
    if (!node || node->node_id != item.key()) {
      LOG_SYNC_WARN("Malformed node {} from {}", item.key().substr(0, 16), session.peer_id);
      continue;
    }
    candidates.push_back(std::move(*node));
  }

  // Parents first; the loop below picks up anything still out of order
  std::sort(candidates.begin(), candidates.end(),
            [](const dag::DAGNode &a, const dag::DAGNode &b) {
              if (a.height != b.height) {
                return a.height < b.height;
              }
              return a.timestamp < b.timestamp;
            });

  size_t added = 0;
  bool progress = true;
  while (progress && !candidates.empty()) {
    progress = false;
    for (auto it = candidates.begin(); it != candidates.end();) {
      dag::ValidationState state;
      const bool present = dag_.HasNode(it->node_id);
      if (present || dag_.AddNode(*it, state)) {
        if (!present) {
          ++added;
          stats_.nodes_received++;
        }
        session.missing_blocks.erase(it->node_id);
        session.received_blocks[it->node_id] = *it;
        it = candidates.erase(it);
        progress = true;
        continue;
      }
      if (state.GetRejectReason() != dag::reject::MISSING_PARENT) {
        LOG_SYNC_WARN("Rejected node {} from {}: {}", it->node_id.substr(0, 16),
                      session.peer_id, state.GetRejectReason());
      }
      ++it;
    }
  }
  return added;
}

void SyncManager::DropResolved(SyncSession &session) {
  for (auto it = session.missing_blocks.begin(); it != session.missing_blocks.end();) {
    it = dag_.HasNode(*it) ? session.missing_blocks.erase(it) : std::next(it);
  }
}

void SyncManager::RetryOrClose(const std::string &peer_id, const char *reason) {
  auto it = sessions_.find(peer_id);
  if (it == sessions_.end()) {
    return;
  }
  SyncSession &session = it->second;

  if (session.retries < config_.max_retries) {
    session.retries++;
    stats_.retries_sent++;
    LOG_SYNC_DEBUG("Retrying session with {} after {} (attempt {}/{}, {} missing)", peer_id,
                   reason, session.retries, config_.max_retries,
                   session.missing_blocks.size());
    SendSessionRequest(session);
    return;
  }

  LOG_SYNC_WARN("Sync failed with peer {} after {} retries ({}; {} nodes still missing)",
                peer_id, config_.max_retries, reason, session.missing_blocks.size());
  session.state = SyncState::ERROR;
  CompleteSession(peer_id, false);
}

void SyncManager::CompleteSession(const std::string &peer_id, bool resolved) {
  auto it = sessions_.find(peer_id);
  if (it == sessions_.end()) {
    return;
  }
  SyncSession session = std::move(it->second);
  sessions_.erase(it);

  if (!resolved) {
    stats_.sessions_failed++;
    return;
  }

  stats_.sessions_completed++;
  std::vector<std::string> received;
  received.reserve(session.received_blocks.size());
  for (const auto &[id, node] : session.received_blocks) {
    received.push_back(id);
  }

  GossipMessage ack = gossip_.CreateMessage(
      MessageType::ACK, {{"session_id", session.session_id}, {"received_blocks", received}});
  gossip_.Broadcast(ack, false);

  LOG_SYNC_INFO("Sync session with {} complete ({} nodes received, {} retries)", peer_id,
                received.size(), session.retries);
}

void SyncManager::MonitorSessions() {
  const int64_t now = util::GetTimeMillis();

  std::vector<std::string> peers;
  peers.reserve(sessions_.size());
  for (const auto &[peer, session] : sessions_) {
    peers.push_back(peer);
  }

  for (const auto &peer : peers) {
    auto it = sessions_.find(peer);
    if (it == sessions_.end()) {
      continue;
    }
    SyncSession &session = it->second;

    // Another session or direct gossip may already have delivered the gap
    DropResolved(session);
    if (session.missing_blocks.empty()) {
      CompleteSession(peer, true);
      continue;
    }

    if (now - session.last_activity > config_.session_timeout.count()) {
      RetryOrClose(peer, "timeout");
    }
  }
}

SyncManager::SyncStatus SyncManager::GetSyncStatus() const {
  SyncStatus status;
  status.state = state_;
  status.active_sessions = sessions_.size();
  for (const auto &[peer, session] : sessions_) {
    status.total_missing_blocks += session.missing_blocks.size();
    status.total_received_blocks += session.received_blocks.size();
  }
  return status;
}

} // namespace network
} // namespace dagsync
