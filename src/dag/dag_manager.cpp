// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dag/dag_manager.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <iterator>
#include <unordered_set>

namespace dagsync {
namespace dag {

DAGManager::DAGManager(std::string local_id, crypto::ECKey key, const Config &config)
    : local_id_(std::move(local_id)), key_(std::move(key)), config_(config) {
  trusted_keys_.insert(key_.PublicKeyHex());
}

bool DAGManager::AddNode(const DAGNode &node, bool validate) {
  ValidationState state;
  return AddNode(node, state, validate);
}

bool DAGManager::AddNode(const DAGNode &node, ValidationState &state, bool validate) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!ValidateUnlocked(node, state, validate)) {
    LOG_DAG_DEBUG("Rejected node {}: {} {}", node.node_id.substr(0, 16),
                  state.GetRejectReason(), state.GetDebugMessage());
    return false;
  }

  // All checks passed: derive metrics from parents, then commit
  DAGNode accepted = node;
  accepted.height = 0;
  accepted.weight = 1.0;
  std::set<std::string> ancestry;
  bool cache_ancestry = true;
  if (!node.parents.empty()) {
    int max_parent_height = 0;
    double total_parent_weight = 0.0;
    for (const auto &parent_id : node.parents) {
      const DAGNode &parent = nodes_.at(parent_id);
      max_parent_height = std::max(max_parent_height, parent.height);
      total_parent_weight += parent.weight;

      if (!cache_ancestry) {
        continue;
      }
      auto cached = validated_paths_.find(parent_id);
      if (cached == validated_paths_.end()) {
        cache_ancestry = false;
        continue;
      }
      ancestry.insert(parent_id);
      ancestry.insert(cached->second.begin(), cached->second.end());
      if (ancestry.size() > config_.max_cached_ancestors) {
        cache_ancestry = false;
      }
    }
    accepted.height = max_parent_height + 1;
    accepted.weight = 1.0 + total_parent_weight / static_cast<double>(node.parents.size());
  }

  const std::string id = accepted.node_id;
  nodes_.emplace(id, std::move(accepted));
  if (cache_ancestry) {
    validated_paths_.emplace(id, std::move(ancestry));
  }

  for (const auto &parent_id : node.parents) {
    tips_.erase(parent_id);
    children_[parent_id].push_back(id);
  }
  tips_.insert(id);
  if (node.parents.empty()) {
    roots_.insert(id);
  }

  DetectForksUnlocked(node);

  const DAGNode &stored = nodes_.at(id);
  LOG_DAG_DEBUG("Accepted node {} (type={}, height={}, weight={:.3f}, parents={})",
                id.substr(0, 16), NodeTypeToString(stored.node_type), stored.height,
                stored.weight, stored.parents.size());
  return true;
}

bool DAGManager::ValidateUnlocked(const DAGNode &node, ValidationState &state,
                                  bool validate) const {
  if (nodes_.count(node.node_id) > 0) {
    return state.Invalid(reject::DUPLICATE_NODE, node.node_id);
  }

  if (validate) {
    const int64_t now_ms = util::GetTimeMillis();
    const int64_t drift_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.max_clock_drift).count();
    if (std::llabs(now_ms - node.timestamp) > drift_ms) {
      return state.Invalid(reject::TIME_TOO_FAR,
                           "node timestamp " + std::to_string(node.timestamp) +
                               " vs local " + std::to_string(now_ms));
    }
  }

  std::unordered_set<std::string> seen_parents;
  for (const auto &parent_id : node.parents) {
    if (nodes_.count(parent_id) == 0) {
      return state.Invalid(reject::MISSING_PARENT, parent_id);
    }
    if (!seen_parents.insert(parent_id).second) {
      return state.Invalid(reject::DUPLICATE_PARENT, parent_id);
    }
  }

  if (WouldCreateCycleUnlocked(node)) {
    return state.Invalid(reject::CYCLE, node.node_id);
  }

  for (const auto &parent_id : node.parents) {
    if (nodes_.at(parent_id).timestamp >= node.timestamp) {
      return state.Invalid(reject::PARENT_TIME_ORDER, parent_id);
    }
  }

  if (!VerifySignatureUnlocked(node, state)) {
    return false;
  }

  return true;
}

bool DAGManager::WouldCreateCycleUnlocked(const DAGNode &node) const {
  // Read-only DFS over the committed table: the candidate closes a cycle iff
  // its own id is reachable from one of its declared parents.
  std::vector<std::string> stack(node.parents.begin(), node.parents.end());
  std::unordered_set<std::string> visited;

  while (!stack.empty()) {
    std::string current = std::move(stack.back());
    stack.pop_back();

    if (current == node.node_id) {
      return true;
    }
    if (!visited.insert(current).second) {
      continue;
    }
    auto it = nodes_.find(current);
    if (it == nodes_.end()) {
      continue;
    }
    for (const auto &parent_id : it->second.parents) {
      stack.push_back(parent_id);
    }
  }
  return false;
}

bool DAGManager::VerifySignatureUnlocked(const DAGNode &node, ValidationState &state) const {
  if (node.signature.empty()) {
    return state.Invalid(reject::MISSING_SIGNATURE, node.node_id);
  }

  const std::string signing_data = node.SigningData();
  for (const auto &public_key : trusted_keys_) {
    if (crypto::ECKey::Verify(public_key, signing_data, node.signature)) {
      return true;
    }
  }
  return state.Invalid(reject::BAD_SIGNATURE, node.node_id);
}

void DAGManager::DetectForksUnlocked(const DAGNode &node) {
  for (const auto &parent_id : node.parents) {
    auto it = children_.find(parent_id);
    if (it == children_.end() || it->second.size() <= 1) {
      continue;
    }

    auto &fork_list = fork_points_[parent_id];
    fork_list.push_back(node.node_id);
    LOG_DAG_DEBUG("Fork at {}: {} children, new branch {}", parent_id.substr(0, 16),
                  it->second.size(), node.node_id.substr(0, 16));

    if (fork_list.size() > config_.fork_suspicion_threshold) {
      int count = ++suspicious_nodes_[node.node_id];
      LOG_DAG_WARN("Suspicious node {}: fork list of {} has {} entries (flagged {}x)",
                   node.node_id.substr(0, 16), parent_id.substr(0, 16),
                   fork_list.size(), count);
    }
  }
}

void DAGManager::SignNode(DAGNode &node) const {
  node.signature = key_.Sign(node.SigningData());
  if (node.signature.empty()) {
    LOG_DAG_ERROR("Failed to sign node {}", node.node_id.substr(0, 16));
  }
}

void DAGManager::AddTrustedKey(const std::string &public_key_hex) {
  std::lock_guard<std::mutex> lock(mutex_);
  trusted_keys_.insert(public_key_hex);
}

std::string DAGManager::GetPublicKeyHex() const { return key_.PublicKeyHex(); }

std::vector<DAGNode> DAGManager::GetTips() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DAGNode> tips;
  tips.reserve(tips_.size());
  for (const auto &id : tips_) {
    tips.push_back(nodes_.at(id));
  }
  return tips;
}

std::vector<std::string> DAGManager::GetTipIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {tips_.begin(), tips_.end()};
}

std::vector<std::string> DAGManager::GetRoots() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {roots_.begin(), roots_.end()};
}

std::vector<std::string> DAGManager::GetNodeIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(nodes_.size());
  for (const auto &[id, node] : nodes_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::optional<DAGNode> DAGManager::GetNode(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool DAGManager::HasNode(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.count(node_id) > 0;
}

std::vector<std::string> DAGManager::GetChildren(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = children_.find(node_id);
  if (it == children_.end()) {
    return {};
  }
  return it->second;
}

size_t DAGManager::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.size();
}

std::vector<std::string> DAGManager::GetPathToRoot(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> path;
  auto it = nodes_.find(node_id);
  while (it != nodes_.end()) {
    path.push_back(it->first);
    if (roots_.count(it->first) > 0 || it->second.parents.empty()) {
      break;
    }
    // First listed parent is the tie-break for single-path queries
    it = nodes_.find(it->second.parents.front());
  }
  return path;
}

bool DAGManager::IsAncestor(const std::string &ancestor, const std::string &descendant) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (nodes_.count(descendant) == 0) {
    return false;
  }
  if (ancestor == descendant) {
    return true;
  }

  auto cached = validated_paths_.find(descendant);
  if (cached != validated_paths_.end()) {
    return cached->second.count(ancestor) > 0;
  }

  std::vector<std::string> stack{descendant};
  std::unordered_set<std::string> visited;
  while (!stack.empty()) {
    std::string current = std::move(stack.back());
    stack.pop_back();
    if (current == ancestor) {
      return true;
    }
    if (!visited.insert(current).second) {
      continue;
    }
    auto it = nodes_.find(current);
    if (it == nodes_.end()) {
      continue;
    }
    for (const auto &parent_id : it->second.parents) {
      stack.push_back(parent_id);
    }
  }
  return false;
}

std::optional<std::string> DAGManager::GetCommonAncestor(const std::string &a,
                                                         const std::string &b) const {
  // GetPathToRoot takes the lock itself
  if (!HasNode(a) || !HasNode(b)) {
    return std::nullopt;
  }

  std::vector<std::string> path_a = GetPathToRoot(a);
  std::unordered_set<std::string> ancestors_a(path_a.begin(), path_a.end());

  for (const auto &id : GetPathToRoot(b)) {
    if (ancestors_a.count(id) > 0) {
      return id;
    }
  }
  return std::nullopt;
}

size_t DAGManager::PruneOldNodes(std::chrono::seconds max_age) {
  std::lock_guard<std::mutex> lock(mutex_);

  const int64_t cutoff =
      util::GetTimeMillis() -
      std::chrono::duration_cast<std::chrono::milliseconds>(max_age).count();

  std::vector<std::string> candidates;
  for (const auto &[id, node] : nodes_) {
    if (node.timestamp < cutoff && tips_.count(id) == 0) {
      candidates.push_back(id);
    }
  }
  std::sort(candidates.begin(), candidates.end());

  size_t removed = 0;
  for (const auto &id : candidates) {
    // Keep at least one entry point into the graph
    if (roots_.count(id) > 0 && roots_.size() == 1) {
      continue;
    }
    RemoveNodeUnlocked(id);
    ++removed;
  }

  if (!CheckConsistencyUnlocked()) {
    LOG_DAG_ERROR("DAG indexes inconsistent after pruning {} nodes; repairing", removed);
    assert(false && "pruning left dangling DAG index references");
    RepairIndexesUnlocked();
  }

  if (removed > 0) {
    LOG_DAG_INFO("Pruned {} nodes older than {}s ({} remain)", removed, max_age.count(),
                 nodes_.size());
  }
  return removed;
}

void DAGManager::RemoveNodeUnlocked(const std::string &node_id) {
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) {
    return;
  }

  // Strike from each parent's child list; children of other nodes stay as-is
  for (const auto &parent_id : it->second.parents) {
    auto child_it = children_.find(parent_id);
    if (child_it == children_.end()) {
      continue;
    }
    auto &kids = child_it->second;
    kids.erase(std::remove(kids.begin(), kids.end(), node_id), kids.end());
    if (kids.empty()) {
      children_.erase(child_it);
    }
  }
  children_.erase(node_id);

  nodes_.erase(it);
  tips_.erase(node_id);
  roots_.erase(node_id);
  suspicious_nodes_.erase(node_id);

  validated_paths_.erase(node_id);
  for (auto &[id, ancestors] : validated_paths_) {
    ancestors.erase(node_id);
  }

  fork_points_.erase(node_id);
  for (auto fork_it = fork_points_.begin(); fork_it != fork_points_.end();) {
    auto &forks = fork_it->second;
    forks.erase(std::remove(forks.begin(), forks.end(), node_id), forks.end());
    if (forks.empty()) {
      fork_it = fork_points_.erase(fork_it);
    } else {
      ++fork_it;
    }
  }
}

std::map<std::string, std::vector<std::string>> DAGManager::GetForkPoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fork_points_;
}

std::map<std::string, int> DAGManager::GetSuspiciousNodes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suspicious_nodes_;
}

bool DAGManager::CheckConsistency() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CheckConsistencyUnlocked();
}

bool DAGManager::CheckConsistencyUnlocked() const {
  auto present = [this](const std::string &id) { return nodes_.count(id) > 0; };

  for (const auto &id : tips_) {
    if (!present(id)) return false;
  }
  for (const auto &id : roots_) {
    if (!present(id)) return false;
  }
  for (const auto &[parent_id, kids] : children_) {
    if (!present(parent_id)) return false;
    for (const auto &kid : kids) {
      if (!present(kid)) return false;
    }
  }
  for (const auto &[parent_id, forks] : fork_points_) {
    if (!present(parent_id) || forks.empty()) return false;
    for (const auto &fork : forks) {
      if (!present(fork)) return false;
    }
  }
  for (const auto &[id, ancestors] : validated_paths_) {
    if (!present(id)) return false;
    for (const auto &ancestor : ancestors) {
      if (!present(ancestor)) return false;
    }
  }
  for (const auto &[id, count] : suspicious_nodes_) {
    if (!present(id)) return false;
  }
  return true;
}

void DAGManager::RepairIndexesUnlocked() {
  auto absent = [this](const std::string &id) { return nodes_.count(id) == 0; };

  for (auto it = tips_.begin(); it != tips_.end();) {
    it = absent(*it) ? tips_.erase(it) : std::next(it);
  }
  for (auto it = roots_.begin(); it != roots_.end();) {
    it = absent(*it) ? roots_.erase(it) : std::next(it);
  }
  for (auto it = children_.begin(); it != children_.end();) {
    auto &kids = it->second;
    kids.erase(std::remove_if(kids.begin(), kids.end(), absent), kids.end());
    it = (absent(it->first) || kids.empty()) ? children_.erase(it) : std::next(it);
  }
  for (auto it = fork_points_.begin(); it != fork_points_.end();) {
    auto &forks = it->second;
    forks.erase(std::remove_if(forks.begin(), forks.end(), absent), forks.end());
    it = (absent(it->first) || forks.empty()) ? fork_points_.erase(it) : std::next(it);
  }
  for (auto it = validated_paths_.begin(); it != validated_paths_.end();) {
    if (absent(it->first)) {
      it = validated_paths_.erase(it);
      continue;
    }
    auto &ancestors = it->second;
    for (auto a = ancestors.begin(); a != ancestors.end();) {
      a = absent(*a) ? ancestors.erase(a) : std::next(a);
    }
    ++it;
  }
  for (auto it = suspicious_nodes_.begin(); it != suspicious_nodes_.end();) {
    it = absent(it->first) ? suspicious_nodes_.erase(it) : std::next(it);
  }
}

DAGManager::Stats DAGManager::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Stats stats;
  stats.node_count = nodes_.size();
  stats.tip_count = tips_.size();
  stats.root_count = roots_.size();
  stats.fork_point_count = fork_points_.size();
  stats.suspicious_count = suspicious_nodes_.size();
  stats.cached_ancestry_count = validated_paths_.size();
  for (const auto &[id, node] : nodes_) {
    stats.max_height = std::max(stats.max_height, node.height);
  }
  return stats;
}

} // namespace dag
} // namespace dagsync
