#include "network/gossip_protocol.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace dagsync {
namespace network {

namespace {

bool RequiresFallback(MessageType type) {
  return type == MessageType::BLOCK || type == MessageType::TRANSACTION;
}

std::string ShortId(const std::string &id) { return id.substr(0, 16); }

} // namespace

GossipProtocol::GossipProtocol(std::string node_id, Transport &transport,
                               util::TaskScheduler &scheduler, const Config &config)
    : node_id_(std::move(node_id)), transport_(transport), scheduler_(scheduler),
      config_(config) {}

GossipProtocol::~GossipProtocol() { Stop(); }

void GossipProtocol::Start() {
  if (running_) {
    return;
  }
  running_ = true;

  transport_.set_receive_callback(
      [this](const std::string &from, const std::vector<uint8_t> &data) {
        HandleMessage(from, data);
      });

  cleanup_task_ = scheduler_.ScheduleRepeating("gossip-cleanup", config_.cleanup_interval,
                                               [this]() { CleanupSeenMessages(); });
  ack_monitor_task_ = scheduler_.ScheduleRepeating(
      "gossip-ack-monitor", config_.ack_monitor_interval, [this]() { MonitorPendingAcks(); });

  LOG_GOSSIP_INFO("Gossip started on {} ({} peers, {} fallback nodes)", node_id_,
                  peers_.size(), fallback_nodes_.size());
}

void GossipProtocol::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;

  scheduler_.Cancel(cleanup_task_);
  scheduler_.Cancel(ack_monitor_task_);
  cleanup_task_ = util::TaskScheduler::INVALID_TASK;
  ack_monitor_task_ = util::TaskScheduler::INVALID_TASK;

  // Outstanding ack waits are dropped without completion
  for (auto &[id, pending] : pending_acks_) {
    scheduler_.Cancel(pending.timeout_task);
  }
  pending_acks_.clear();

  transport_.set_receive_callback(nullptr);
  LOG_GOSSIP_INFO("Gossip stopped on {}", node_id_);
}

void GossipProtocol::AddPeer(const std::string &peer_id) {
  if (peer_id.empty() || peer_id == node_id_) {
    return;
  }
  if (peers_.insert(peer_id).second) {
    LOG_GOSSIP_DEBUG("Added peer {}", peer_id);
  }
}

void GossipProtocol::RemovePeer(const std::string &peer_id) {
  if (peers_.erase(peer_id) > 0) {
    LOG_GOSSIP_DEBUG("Removed peer {}", peer_id);
  }
}

std::vector<std::string> GossipProtocol::GetPeers() const {
  return {peers_.begin(), peers_.end()};
}

void GossipProtocol::RegisterFallbackNode(const std::string &node_id) {
  if (node_id.empty() || node_id == node_id_) {
    return;
  }
  fallback_nodes_.insert(node_id);
}

void GossipProtocol::UnregisterFallbackNode(const std::string &node_id) {
  fallback_nodes_.erase(node_id);
}

std::vector<std::string> GossipProtocol::GetFallbackNodes() const {
  return {fallback_nodes_.begin(), fallback_nodes_.end()};
}

GossipMessage GossipProtocol::CreateMessage(MessageType type,
                                            const nlohmann::json &payload) const {
  GossipMessage msg;
  msg.type = type;
  msg.payload = payload;
  msg.sender = node_id_;
  msg.timestamp = util::GetTimeMillis();
  msg.message_id = ComputeMessageId(msg.payload, msg.timestamp, msg.sender);
  msg.ttl = config_.default_ttl;
  return msg;
}

void GossipProtocol::Remember(const GossipMessage &msg) {
  seen_messages_[msg.message_id] = util::GetTimeMillis();
  message_cache_[msg.message_id] = msg;

  if (msg.type == MessageType::BLOCK) {
    auto it = msg.payload.find("node_id");
    if (it != msg.payload.end() && it->is_string()) {
      block_index_[it->get<std::string>()] = msg.message_id;
    }
  }
}

void GossipProtocol::Forget(const std::string &message_id) {
  auto cached = message_cache_.find(message_id);
  if (cached != message_cache_.end()) {
    if (cached->second.type == MessageType::BLOCK) {
      auto node = cached->second.payload.find("node_id");
      if (node != cached->second.payload.end() && node->is_string()) {
        auto idx = block_index_.find(node->get<std::string>());
        if (idx != block_index_.end() && idx->second == message_id) {
          block_index_.erase(idx);
        }
      }
    }
    message_cache_.erase(cached);
  }
  seen_messages_.erase(message_id);
}

bool GossipProtocol::SendToPeer(const std::string &peer_id, const GossipMessage &msg) {
  if (!transport_.send(peer_id, msg.Serialize())) {
    stats_.send_failures++;
    LOG_GOSSIP_DEBUG("Send of {} {} to {} failed", MessageTypeToString(msg.type),
                     ShortId(msg.message_id), peer_id);
    return false;
  }
  stats_.messages_sent++;
  return true;
}

bool GossipProtocol::Broadcast(const GossipMessage &msg, bool require_ack,
                               CompletionCallback on_complete) {
  if (!running_) {
    LOG_GOSSIP_WARN("Broadcast of {} {} while gossip is not running",
                    MessageTypeToString(msg.type), ShortId(msg.message_id));
    return false;
  }

  Remember(msg);

  const std::vector<std::string> targets(peers_.begin(), peers_.end());
  const std::string id = msg.message_id;

  if (require_ack && !targets.empty()) {
    auto existing = pending_acks_.find(id);
    if (existing != pending_acks_.end()) {
      // Re-broadcast of the same message restarts ack tracking
      scheduler_.Cancel(existing->second.timeout_task);
      pending_acks_.erase(existing);
    }

    PendingAck pending;
    pending.peers.insert(targets.begin(), targets.end());
    pending.created = util::GetSteadyTime();
    pending.on_complete = std::move(on_complete);
    pending.timeout_task = scheduler_.ScheduleOnce(
        "gossip-ack-wait", config_.ack_timeout, [this, id]() { OnAckTimeout(id); });
    pending_acks_[id] = std::move(pending);
  } else if (on_complete) {
    scheduler_.Post([cb = std::move(on_complete)]() { cb(true); });
  }

  LOG_GOSSIP_DEBUG("Broadcasting {} {} to {} peers (ack={})", MessageTypeToString(msg.type),
                   ShortId(id), targets.size(), require_ack);

  for (const auto &peer : targets) {
    if (SendToPeer(peer, msg)) {
      continue;
    }
    LOG_GOSSIP_WARN("Failed to send {} {} to {}", MessageTypeToString(msg.type), ShortId(id),
                    peer);
    if (!RequiresFallback(msg.type)) {
      continue;
    }
    HandleTransmissionFailure(msg, peer);

    // Fallback already covers this peer; the ack wait must not repeat it
    auto pending = pending_acks_.find(id);
    if (pending != pending_acks_.end()) {
      pending->second.peers.erase(peer);
      pending->second.send_failed = true;
      if (pending->second.peers.empty()) {
        FinishPending(id, false);
      }
    }
  }
  return true;
}

bool GossipProtocol::SendDirect(const std::string &peer_id, const GossipMessage &msg) {
  if (!running_) {
    LOG_GOSSIP_WARN("Direct send of {} to {} while gossip is not running",
                    MessageTypeToString(msg.type), peer_id);
    return false;
  }
  seen_messages_[msg.message_id] = util::GetTimeMillis();
  return SendToPeer(peer_id, msg);
}

void GossipProtocol::HandleMessage(const std::string &from, const std::vector<uint8_t> &data) {
  auto msg = GossipMessage::Deserialize(data);
  if (!msg) {
    stats_.invalid_dropped++;
    LOG_GOSSIP_DEBUG("Dropping malformed message ({} bytes) from {}", data.size(), from);
    return;
  }
  HandleMessage(from, *msg);
}

void GossipProtocol::HandleMessage(const std::string &from, const GossipMessage &msg) {
  if (!running_) {
    return;
  }
  if (!msg.HasValidId()) {
    stats_.invalid_dropped++;
    LOG_GOSSIP_DEBUG("Dropping {} from {}: message_id does not match contents",
                     MessageTypeToString(msg.type), from);
    return;
  }
  stats_.messages_received++;

  if (seen_messages_.count(msg.message_id) > 0) {
    stats_.duplicates_dropped++;
    LOG_GOSSIP_TRACE("Duplicate {} {} from {}", MessageTypeToString(msg.type),
                     ShortId(msg.message_id), from);
    // Relayed copies are still acknowledged so the relaying peer's ack wait settles
    if (msg.type != MessageType::ACK) {
      SendAck(from, msg);
    }
    return;
  }

  Remember(msg);

  try {
    switch (msg.type) {
    case MessageType::SYNC_REQUEST:
      HandleSyncRequest(from, msg);
      break;
    case MessageType::FALLBACK_REQUEST:
      HandleFallbackRequest(from, msg);
      break;
    case MessageType::ACK:
      HandleAck(from, msg);
      break;
    default:
      dispatcher_.Dispatch(from, msg);
      Relay(from, msg);
      break;
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_GOSSIP_WARN("Malformed {} payload from {}: {}", MessageTypeToString(msg.type), from,
                    e.what());
  }

  if (msg.type != MessageType::ACK) {
    SendAck(from, msg);
  }
}

void GossipProtocol::Relay(const std::string &from, const GossipMessage &msg) {
  if (msg.ttl <= 0) {
    return;
  }

  GossipMessage relayed = msg;
  relayed.ttl = msg.ttl - 1;

  for (const auto &peer : peers_) {
    if (peer == from || peer == msg.sender) {
      continue;
    }
    if (SendToPeer(peer, relayed)) {
      stats_.messages_relayed++;
    }
  }
}

void GossipProtocol::SendAck(const std::string &to, const GossipMessage &msg) {
  GossipMessage ack =
      CreateMessage(MessageType::ACK, {{"original_message_id", msg.message_id}});
  ack.ttl = 0;
  SendToPeer(to, ack);
}

void GossipProtocol::HandleTransmissionFailure(const GossipMessage &msg,
                                               const std::string &failed_peer) {
  std::vector<std::string> targets;
  for (const auto &node : fallback_nodes_) {
    if (node != failed_peer) {
      targets.push_back(node);
    }
  }
  if (targets.empty()) {
    LOG_GOSSIP_ERROR("No fallback nodes available for {} to {}", ShortId(msg.message_id),
                     failed_peer);
    return;
  }

  GossipMessage request = CreateMessage(MessageType::FALLBACK_REQUEST,
                                        {{"original_message_id", msg.message_id},
                                         {"failed_peer", failed_peer},
                                         {"retry_count", 0}});
  Remember(request);

  LOG_GOSSIP_INFO("Requesting fallback delivery of {} to {} via {} nodes",
                  ShortId(msg.message_id), failed_peer, targets.size());

  for (const auto &node : targets) {
    if (SendToPeer(node, request)) {
      stats_.fallback_requests_sent++;
    } else {
      LOG_GOSSIP_ERROR("Fallback transmission failed to {}", node);
    }
  }
}

void GossipProtocol::HandleSyncRequest(const std::string &from, const GossipMessage &msg) {
  const nlohmann::json &request = msg.payload;
  nlohmann::json response;

  if (request.value("request_type", std::string()) == SYNC_GET_TIPS) {
    TipsReport report;
    if (tips_provider_) {
      report = tips_provider_();
    } else {
      LOG_GOSSIP_DEBUG("get_tips from {} but no tips provider is installed", from);
    }
    response["request_type"] = SYNC_GET_TIPS;
    response["request_id"] = msg.message_id;
    response["tips"] = report.tips;
    response["known"] = report.known;
  } else if (request.contains("missing_blocks") && request["missing_blocks"].is_array()) {
    nlohmann::json blocks = nlohmann::json::object();
    for (const auto &entry : request["missing_blocks"]) {
      if (!entry.is_string()) {
        continue;
      }
      const std::string block_id = entry.get<std::string>();

      std::optional<nlohmann::json> block;
      if (block_provider_) {
        block = block_provider_(block_id);
      }
      if (!block) {
        auto idx = block_index_.find(block_id);
        if (idx != block_index_.end()) {
          auto cached = message_cache_.find(idx->second);
          if (cached != message_cache_.end()) {
            block = cached->second.payload;
          }
        }
      }
      if (block) {
        blocks[block_id] = std::move(*block);
      }
    }
    LOG_GOSSIP_DEBUG("Answering sync request from {}: {}/{} blocks", from, blocks.size(),
                     request["missing_blocks"].size());
    response["blocks"] = std::move(blocks);
    response["request_id"] = msg.message_id;
    if (request.contains("session_id")) {
      response["session_id"] = request["session_id"];
    }
  } else {
    LOG_GOSSIP_DEBUG("Ignoring unrecognized sync request from {}", from);
    return;
  }

  // Responses go straight back to the requester and are never relayed
  GossipMessage reply = CreateMessage(MessageType::SYNC_RESPONSE, response);
  reply.ttl = 0;
  SendToPeer(from, reply);
}

void GossipProtocol::HandleFallbackRequest(const std::string &from, const GossipMessage &msg) {
  const std::string original_id = msg.payload.at("original_message_id").get<std::string>();
  const std::string failed_peer = msg.payload.at("failed_peer").get<std::string>();

  bool delivered = false;
  auto cached = message_cache_.find(original_id);
  if (cached != message_cache_.end()) {
    const GossipMessage original = cached->second;
    delivered = SendToPeer(failed_peer, original);
    if (delivered) {
      stats_.fallback_redeliveries++;
      LOG_GOSSIP_INFO("Re-delivered {} to {} on behalf of {}", ShortId(original_id),
                      failed_peer, from);
    } else {
      LOG_GOSSIP_ERROR("Fallback transmission of {} to {} failed", ShortId(original_id),
                       failed_peer);
    }
  } else {
    LOG_GOSSIP_DEBUG("Fallback request from {} for uncached message {}", from,
                     ShortId(original_id));
  }

  GossipMessage response = CreateMessage(MessageType::FALLBACK_RESPONSE,
                                         {{"original_message_id", original_id},
                                          {"failed_peer", failed_peer},
                                          {"delivered", delivered}});
  response.ttl = 0;
  SendToPeer(from, response);
}

void GossipProtocol::HandleAck(const std::string &from, const GossipMessage &msg) {
  const std::string original_id = msg.payload.value("original_message_id", std::string());
  if (original_id.empty()) {
    // Session completion acks carry a session summary instead
    dispatcher_.Dispatch(from, msg);
    return;
  }

  auto it = pending_acks_.find(original_id);
  if (it == pending_acks_.end()) {
    return;
  }
  stats_.acks_received++;
  it->second.peers.erase(from);
  if (it->second.peers.empty()) {
    LOG_GOSSIP_DEBUG("All peers acknowledged {}", ShortId(original_id));
    FinishPending(original_id, true);
  }
}

void GossipProtocol::FinishPending(const std::string &message_id, bool all_acked) {
  auto it = pending_acks_.find(message_id);
  if (it == pending_acks_.end()) {
    return;
  }
  PendingAck pending = std::move(it->second);
  pending_acks_.erase(it);

  scheduler_.Cancel(pending.timeout_task);
  if (pending.on_complete) {
    pending.on_complete(all_acked && !pending.send_failed);
  }
}

void GossipProtocol::OnAckTimeout(const std::string &message_id) {
  auto it = pending_acks_.find(message_id);
  if (it == pending_acks_.end()) {
    return;
  }
  it->second.timeout_task = util::TaskScheduler::INVALID_TASK;
  const std::set<std::string> missing = it->second.peers;

  if (!missing.empty()) {
    LOG_GOSSIP_INFO("Ack timeout for {}: {} peers did not acknowledge",
                    ShortId(message_id), missing.size());
    auto cached = message_cache_.find(message_id);
    if (cached != message_cache_.end()) {
      const GossipMessage original = cached->second;
      for (const auto &peer : missing) {
        HandleTransmissionFailure(original, peer);
      }
    }
  }
  FinishPending(message_id, missing.empty());
}

void GossipProtocol::MonitorPendingAcks() {
  const auto now = util::GetSteadyTime();

  std::vector<std::string> settled;
  std::vector<std::string> expired;
  for (const auto &[id, pending] : pending_acks_) {
    if (pending.peers.empty()) {
      settled.push_back(id);
    } else if (now - pending.created > config_.pending_ack_expiry) {
      expired.push_back(id);
    }
  }

  for (const auto &id : settled) {
    FinishPending(id, true);
  }

  for (const auto &id : expired) {
    auto it = pending_acks_.find(id);
    auto cached = message_cache_.find(id);
    if (it != pending_acks_.end() && cached != message_cache_.end()) {
      const GossipMessage original = cached->second;
      const std::set<std::string> missing = it->second.peers;
      LOG_GOSSIP_WARN("Pending acks for {} expired ({} peers)", ShortId(id), missing.size());
      for (const auto &peer : missing) {
        HandleTransmissionFailure(original, peer);
      }
    }
    FinishPending(id, false);
  }
}

void GossipProtocol::CleanupSeenMessages() {
  const int64_t cutoff = util::GetTimeMillis() - config_.message_max_age.count();

  std::vector<std::string> expired;
  for (const auto &[id, seen_at] : seen_messages_) {
    if (seen_at < cutoff) {
      expired.push_back(id);
    }
  }
  for (const auto &id : expired) {
    Forget(id);
  }

  if (!expired.empty()) {
    LOG_GOSSIP_DEBUG("Purged {} expired messages ({} remain)", expired.size(),
                     seen_messages_.size());
  }
}

void GossipProtocol::RegisterHandler(MessageType type,
                                     MessageDispatcher::MessageHandler handler) {
  dispatcher_.RegisterHandler(type, std::move(handler));
}

void GossipProtocol::UnregisterHandler(MessageType type) {
  dispatcher_.UnregisterHandler(type);
}

bool GossipProtocol::HasSeen(const std::string &message_id) const {
  return seen_messages_.count(message_id) > 0;
}

std::optional<GossipMessage> GossipProtocol::GetCachedMessage(
    const std::string &message_id) const {
  auto it = message_cache_.find(message_id);
  if (it == message_cache_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::set<std::string> GossipProtocol::GetPendingAcks(const std::string &message_id) const {
  auto it = pending_acks_.find(message_id);
  if (it == pending_acks_.end()) {
    return {};
  }
  return it->second.peers;
}

} // namespace network
} // namespace dagsync
