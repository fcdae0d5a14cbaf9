// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dagsync {
namespace dag {

// Kind of DAG node; tags the otherwise opaque payload
enum class NodeType : uint8_t {
  BLOCK,
  CHECKPOINT,
  MERGE
};

[[nodiscard]] std::string NodeTypeToString(NodeType type);
[[nodiscard]] std::optional<NodeType> NodeTypeFromString(const std::string &str);

/**
 * DAGNode - one signed vertex of the ledger DAG
 *
 * Edges are stored as parent ids, never pointers; the DAGManager owns
 * every accepted node in an id-keyed table.
 *
 * `data` is an uninterpreted byte payload whose schema belongs to the
 * producer. `height` and `weight` are derived by DAGManager::AddNode and
 * frozen at insertion; values supplied by a peer are ignored.
 */
struct DAGNode {
  std::string node_id;
  NodeType node_type{NodeType::BLOCK};
  std::vector<std::string> parents;
  int64_t timestamp{0}; // Unix milliseconds (producer wall clock)
  std::vector<uint8_t> data;
  std::vector<uint8_t> signature; // DER ECDSA-SHA256 over SigningData()

  int height{0};
  double weight{1.0};

  [[nodiscard]] bool IsRoot() const noexcept { return parents.empty(); }

  /**
   * Canonical encoding covered by the signature:
   * JSON object {data(hex), node_id, parents(sorted), timestamp, type}
   * with keys in lexicographic order and no whitespace.
   */
  [[nodiscard]] std::string SigningData() const;

  // Wire representation (includes signature, height and weight)
  [[nodiscard]] nlohmann::json ToJson() const;

  // Returns std::nullopt for any missing/mistyped field (never throws)
  [[nodiscard]] static std::optional<DAGNode> FromJson(const nlohmann::json &j);

  [[nodiscard]] std::string ToString() const;
};

// Content-derived id: SHA-256 hex over {type, sorted parents, timestamp, data}
[[nodiscard]] std::string MakeNodeId(NodeType type,
                                     const std::vector<std::string> &parents,
                                     int64_t timestamp,
                                     const std::vector<uint8_t> &data);

} // namespace dag
} // namespace dagsync
