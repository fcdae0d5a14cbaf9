// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dag/dag_node.hpp"
#include "crypto/hash.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <sstream>

namespace dagsync {
namespace dag {

std::string NodeTypeToString(NodeType type) {
  switch (type) {
  case NodeType::BLOCK:
    return "block";
  case NodeType::CHECKPOINT:
    return "checkpoint";
  case NodeType::MERGE:
    return "merge";
  }
  return "unknown";
}

std::optional<NodeType> NodeTypeFromString(const std::string &str) {
  if (str == "block") return NodeType::BLOCK;
  if (str == "checkpoint") return NodeType::CHECKPOINT;
  if (str == "merge") return NodeType::MERGE;
  return std::nullopt;
}

std::string DAGNode::SigningData() const {
  std::vector<std::string> sorted_parents = parents;
  std::sort(sorted_parents.begin(), sorted_parents.end());

  // nlohmann::json objects are std::map backed: keys serialize sorted
  nlohmann::json j;
  j["node_id"] = node_id;
  j["type"] = NodeTypeToString(node_type);
  j["parents"] = sorted_parents;
  j["timestamp"] = timestamp;
  j["data"] = util::HexStr(data);
  return j.dump();
}

nlohmann::json DAGNode::ToJson() const {
  nlohmann::json j;
  j["node_id"] = node_id;
  j["type"] = NodeTypeToString(node_type);
  j["parents"] = parents;
  j["timestamp"] = timestamp;
  j["data"] = util::HexStr(data);
  j["signature"] = util::HexStr(signature);
  j["height"] = height;
  j["weight"] = weight;
  return j;
}

std::optional<DAGNode> DAGNode::FromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  try {
    DAGNode node;
    node.node_id = j.at("node_id").get<std::string>();
    if (node.node_id.empty()) {
      return std::nullopt;
    }

    auto type = NodeTypeFromString(j.at("type").get<std::string>());
    if (!type) {
      return std::nullopt;
    }
    node.node_type = *type;

    node.parents = j.at("parents").get<std::vector<std::string>>();
    node.timestamp = j.at("timestamp").get<int64_t>();

    auto data = util::ParseHex(j.at("data").get<std::string>());
    if (!data) {
      return std::nullopt;
    }
    node.data = std::move(*data);

    if (j.contains("signature")) {
      auto sig = util::ParseHex(j.at("signature").get<std::string>());
      if (!sig) {
        return std::nullopt;
      }
      node.signature = std::move(*sig);
    }

    node.height = j.value("height", 0);
    node.weight = j.value("weight", 1.0);
    return node;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

std::string DAGNode::ToString() const {
  std::ostringstream s;
  s << "DAGNode(id=" << node_id.substr(0, 16) << ", type=" << NodeTypeToString(node_type)
    << ", parents=" << parents.size() << ", ts=" << timestamp
    << ", height=" << height << ", weight=" << weight << ")";
  return s.str();
}

std::string MakeNodeId(NodeType type, const std::vector<std::string> &parents,
                       int64_t timestamp, const std::vector<uint8_t> &data) {
  std::vector<std::string> sorted_parents = parents;
  std::sort(sorted_parents.begin(), sorted_parents.end());

  nlohmann::json j;
  j["type"] = NodeTypeToString(type);
  j["parents"] = sorted_parents;
  j["timestamp"] = timestamp;
  j["data"] = util::HexStr(data);
  return crypto::Sha256Hex(j.dump());
}

} // namespace dag
} // namespace dagsync
