#pragma once

#include "crypto/ec_key.hpp"
#include "dag/dag_manager.hpp"
#include "network/gossip_protocol.hpp"
#include "network/sync_manager.hpp"
#include "network/transport.hpp"
#include "util/task_scheduler.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dagsync {
namespace app {

// Ledger service configuration
struct LedgerConfig {
  // Identity of this process on the gossip network (REQUIRED)
  std::string node_id;

  dag::DAGManager::Config dag_config;
  network::GossipProtocol::Config gossip_config;
  network::SyncManager::Config sync_config;

  // Periodic pruning (0 = disabled)
  std::chrono::seconds prune_interval{0};
  std::chrono::seconds prune_max_age{std::chrono::hours(24)};
};

// LedgerService - composition root for one ledger replica
// Owns the scheduler and the three core components, wires gossip into the
// DAG (inbound BLOCK messages) and exposes the producer path (PublishNode).
// Constructed explicitly and passed by reference; there is no global instance.
//
// LIFETIME: io_context and transport must outlive the service.
// THREAD SAFETY: call from the io_context thread, like the components it owns.
class LedgerService {
public:
  LedgerService(boost::asio::io_context &io, network::Transport &transport,
                crypto::ECKey key, const LedgerConfig &config);
  ~LedgerService();

  LedgerService(const LedgerService &) = delete;
  LedgerService &operator=(const LedgerService &) = delete;

  // Lifecycle
  void Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Build and sign a node on top of the given parents (local clock)
  dag::DAGNode CreateNode(dag::NodeType type, const std::vector<std::string> &parents,
                          const std::vector<uint8_t> &data) const;

  // Insert locally, then announce to the network as BLOCK
  bool PublishNode(const dag::DAGNode &node);
  bool PublishNode(const dag::DAGNode &node, dag::ValidationState &state);

  // Peers and fallback relays
  void AddPeer(const std::string &peer_id);
  void RegisterFallbackNode(const std::string &node_id);

  // Component access
  dag::DAGManager &dag() { return *dag_; }
  network::GossipProtocol &gossip() { return *gossip_; }
  network::SyncManager &sync() { return *sync_; }
  util::TaskScheduler &scheduler() { return *scheduler_; }
  const LedgerConfig &config() const { return config_; }

private:
  bool HandleBlockMessage(const std::string &from, const network::GossipMessage &msg);
  void PruneOldNodes();

  LedgerConfig config_;
  bool running_{false};

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<util::TaskScheduler> scheduler_;
  std::unique_ptr<dag::DAGManager> dag_;
  std::unique_ptr<network::GossipProtocol> gossip_;
  std::unique_ptr<network::SyncManager> sync_;

  util::TaskScheduler::TaskId prune_task_{util::TaskScheduler::INVALID_TASK};
};

} // namespace app
} // namespace dagsync
