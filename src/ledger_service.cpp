#include "ledger_service.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace dagsync {
namespace app {

LedgerService::LedgerService(boost::asio::io_context &io, network::Transport &transport,
                             crypto::ECKey key, const LedgerConfig &config)
    : config_(config) {
  scheduler_ = std::make_unique<util::TaskScheduler>(io);
  dag_ = std::make_unique<dag::DAGManager>(config_.node_id, std::move(key), config_.dag_config);
  gossip_ = std::make_unique<network::GossipProtocol>(config_.node_id, transport, *scheduler_,
                                                      config_.gossip_config);
  sync_ = std::make_unique<network::SyncManager>(config_.node_id, *dag_, *gossip_, *scheduler_,
                                                 config_.sync_config);
}

LedgerService::~LedgerService() { Stop(); }

void LedgerService::Start() {
  if (running_) {
    return;
  }
  LOG_APP_INFO("Starting ledger service {}", config_.node_id);

  gossip_->RegisterHandler(network::MessageType::BLOCK,
                           [this](const std::string &from, const network::GossipMessage &msg) {
                             return HandleBlockMessage(from, msg);
                           });
  gossip_->Start();
  sync_->Start();

  if (config_.prune_interval.count() > 0) {
    prune_task_ = scheduler_->ScheduleRepeating(
        "dag-prune", std::chrono::duration_cast<std::chrono::milliseconds>(config_.prune_interval),
        [this]() { PruneOldNodes(); });
  }

  running_ = true;
  LOG_APP_INFO("Ledger service {} started ({} peers)", config_.node_id, gossip_->GetPeers().size());
}

void LedgerService::Stop() {
  if (!running_) {
    return;
  }
  LOG_APP_INFO("Stopping ledger service {}", config_.node_id);

  scheduler_->Cancel(prune_task_);
  prune_task_ = util::TaskScheduler::INVALID_TASK;

  // Reverse dependency order
  sync_->Stop();
  gossip_->Stop();
  gossip_->UnregisterHandler(network::MessageType::BLOCK);

  running_ = false;
}

dag::DAGNode LedgerService::CreateNode(dag::NodeType type,
                                       const std::vector<std::string> &parents,
                                       const std::vector<uint8_t> &data) const {
  dag::DAGNode node;
  node.node_type = type;
  node.parents = parents;
  node.timestamp = util::GetTimeMillis();
  // Parents must be strictly older; bump past any parent minted this millisecond
  for (const auto &parent_id : parents) {
    if (auto parent = dag_->GetNode(parent_id)) {
      node.timestamp = std::max(node.timestamp, parent->timestamp + 1);
    }
  }
  node.data = data;
  node.node_id = dag::MakeNodeId(node.node_type, node.parents, node.timestamp, node.data);
  dag_->SignNode(node);
  return node;
}

bool LedgerService::PublishNode(const dag::DAGNode &node) {
  dag::ValidationState state;
  return PublishNode(node, state);
}

bool LedgerService::PublishNode(const dag::DAGNode &node, dag::ValidationState &state) {
  if (!dag_->AddNode(node, state)) {
    LOG_APP_ERROR("Refusing to publish node {}: {}", node.node_id.substr(0, 16),
              state.GetRejectReason());
    return false;
  }

  // Announce the stored copy (carries the derived height/weight)
  auto stored = dag_->GetNode(node.node_id);
  const nlohmann::json payload = stored ? stored->ToJson() : node.ToJson();
  network::GossipMessage msg = gossip_->CreateMessage(network::MessageType::BLOCK, payload);
  if (!gossip_->Broadcast(msg, true)) {
    LOG_APP_ERROR("Node {} accepted locally but could not be broadcast", node.node_id.substr(0, 16));
    return false;
  }

  LOG_APP_DEBUG("Published node {} (height={})", node.node_id.substr(0, 16),
            stored ? stored->height : node.height);
  return true;
}

void LedgerService::AddPeer(const std::string &peer_id) { gossip_->AddPeer(peer_id); }

void LedgerService::RegisterFallbackNode(const std::string &node_id) {
  gossip_->RegisterFallbackNode(node_id);
}

bool LedgerService::HandleBlockMessage(const std::string &from,
                                       const network::GossipMessage &msg) {
  auto node = dag::DAGNode::FromJson(msg.payload);
  if (!node) {
    LOG_APP_DEBUG("Malformed block payload from {}", from);
    return false;
  }

  if (dag_->HasNode(node->node_id)) {
    return true;
  }

  dag::ValidationState state;
  if (!dag_->AddNode(*node, state)) {
    // Gaps (missing-parent) are left for the next sync pass
    LOG_APP_DEBUG("Block {} from {} not accepted: {}", node->node_id.substr(0, 16), from,
              state.GetRejectReason());
    return false;
  }
  LOG_APP_DEBUG("Accepted block {} from {}", node->node_id.substr(0, 16), from);
  return true;
}

void LedgerService::PruneOldNodes() {
  const size_t removed = dag_->PruneOldNodes(config_.prune_max_age);
  if (removed > 0) {
    LOG_APP_INFO("Pruned {} nodes ({} remain)", removed, dag_->Size());
  }
}

} // namespace app
} // namespace dagsync
