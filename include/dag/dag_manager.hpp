// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/ec_key.hpp"
#include "dag/dag_node.hpp"
#include "dag/validation.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace dagsync {
namespace dag {

/**
 * DAGManager - authoritative local view of the ledger DAG
 *
 * Storage is an id-keyed arena: nodes_ owns every accepted node, edges are
 * parent-id lists plus a child-id index. Cycles are a checkable property of
 * the id graph rather than a pointer hazard.
 *
 * AddNode validation order (short-circuiting):
 *   1. node_id not already present                     (duplicate-node)
 *   2. |now - timestamp| <= max_clock_drift            (time-too-far)
 *   3. every parent present, no parent listed twice    (missing-parent / duplicate-parent)
 *   4. node_id not reachable from its parents          (cycle)
 *   5. every parent strictly older than the node       (parent-time-order)
 *   6. signature verifies against a trusted key        (missing-signature / bad-signature)
 * With validate=false only step 2 is skipped;
 * the structural and signature checks always run.
 *
 * All validation runs against the current table without touching it; state
 * is committed only after every check passed, so a rejected node leaves no
 * trace.
 *
 * Thread-safety: one mutex guards the node table, tips, roots, child index,
 * fork points, suspicious counters and ancestry cache. Every public method
 * takes it, so concurrent AddNode calls are serialized.
 */
class DAGManager {
public:
  struct Config {
    Config();
    std::chrono::seconds max_clock_drift{300};
    // A parent whose fork list grows beyond this marks the newest child suspicious
    size_t fork_suspicion_threshold{3};
    // Ancestry cache bound. Each cached entry holds the node's full ancestor
    // set, so a chain of n nodes costs O(n^2) ids in total. Nodes with more
    // ancestors than this (and their descendants) are not cached and
    // IsAncestor walks the parent links for them instead.
    size_t max_cached_ancestors{4096};
  };

  struct Stats {
    size_t node_count{0};
    size_t tip_count{0};
    size_t root_count{0};
    size_t fork_point_count{0};
    size_t suspicious_count{0};
    size_t cached_ancestry_count{0};
    int max_height{0};
  };

  // LIFETIME: key is owned by the manager; used by SignNode and trusted for verification
  DAGManager(std::string local_id, crypto::ECKey key, const Config &config = Config{});

  DAGManager(const DAGManager &) = delete;
  DAGManager &operator=(const DAGManager &) = delete;

  // Validate and insert. Returns false (no state change) on any rejection.
  bool AddNode(const DAGNode &node, bool validate = true);
  bool AddNode(const DAGNode &node, ValidationState &state, bool validate = true);

  // Sign node with the local key (local process acting as producer)
  void SignNode(DAGNode &node) const;

  // Accept signatures from another producer
  void AddTrustedKey(const std::string &public_key_hex);
  std::string GetPublicKeyHex() const;

  // Queries
  std::vector<DAGNode> GetTips() const;
  std::vector<std::string> GetTipIds() const;
  std::vector<std::string> GetRoots() const;
  std::vector<std::string> GetNodeIds() const;
  std::optional<DAGNode> GetNode(const std::string &node_id) const;
  bool HasNode(const std::string &node_id) const;
  std::vector<std::string> GetChildren(const std::string &node_id) const;
  size_t Size() const;

  // First-parent walk from node_id to a root (inclusive on both ends).
  // Stops early at a parent that has been pruned.
  std::vector<std::string> GetPathToRoot(const std::string &node_id) const;

  // True if ancestor is reachable from descendant via parent links (or equal)
  bool IsAncestor(const std::string &ancestor, const std::string &descendant) const;

  // First id shared by both first-parent chains, nearest to b
  std::optional<std::string> GetCommonAncestor(const std::string &a,
                                               const std::string &b) const;

  // Remove non-tip nodes older than max_age. The last remaining root is kept.
  // Returns number of nodes removed.
  size_t PruneOldNodes(std::chrono::seconds max_age);

  // parent id -> children recorded when they created a fork
  std::map<std::string, std::vector<std::string>> GetForkPoints() const;
  // node id -> number of times it tipped a fork list over the threshold
  std::map<std::string, int> GetSuspiciousNodes() const;

  // Verify derived indexes only reference ids present in the node table
  bool CheckConsistency() const;

  Stats GetStats() const;

  const std::string &local_id() const { return local_id_; }

private:
  // All *Unlocked helpers assume mutex_ is held
  bool ValidateUnlocked(const DAGNode &node, ValidationState &state, bool validate) const;
  bool WouldCreateCycleUnlocked(const DAGNode &node) const;
  bool VerifySignatureUnlocked(const DAGNode &node, ValidationState &state) const;
  void DetectForksUnlocked(const DAGNode &node);
  void RemoveNodeUnlocked(const std::string &node_id);
  bool CheckConsistencyUnlocked() const;
  void RepairIndexesUnlocked();

  const std::string local_id_;
  crypto::ECKey key_;
  const Config config_;

  mutable std::mutex mutex_;

  std::unordered_map<std::string, DAGNode> nodes_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
  std::set<std::string> tips_;
  std::set<std::string> roots_;

  // Ancestry cache: node id -> every ancestor id known at insertion.
  // Absent for nodes past max_cached_ancestors or with an uncached parent.
  std::unordered_map<std::string, std::set<std::string>> validated_paths_;

  std::map<std::string, std::vector<std::string>> fork_points_;
  std::map<std::string, int> suspicious_nodes_;

  std::set<std::string> trusted_keys_;
};

inline DAGManager::Config::Config() = default;

} // namespace dag
} // namespace dagsync
