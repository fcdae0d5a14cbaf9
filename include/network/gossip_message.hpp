#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dagsync {
namespace network {

// Gossip message types (wire names are the lower-case strings)
enum class MessageType : uint8_t {
  BLOCK,
  TRANSACTION,
  PEER_DISCOVERY,
  SYNC_REQUEST,
  SYNC_RESPONSE,
  FALLBACK_REQUEST,
  FALLBACK_RESPONSE,
  ACK
};

std::string MessageTypeToString(MessageType type);
std::optional<MessageType> MessageTypeFromString(const std::string &str);

// Hop budget stamped by GossipProtocol::CreateMessage
constexpr int DEFAULT_TTL = 3;

// SYNC_REQUEST sub-type asking peers for their tips and known ids
constexpr const char *SYNC_GET_TIPS = "get_tips";

/**
 * GossipMessage - one unit of epidemic dissemination
 *
 * Wire format is a JSON object:
 *   {type, payload, sender, timestamp, message_id, ttl, signature?}
 *
 * message_id = SHA-256 hex of (payload.dump() ++ decimal timestamp ++ sender),
 * so identical inputs always yield the same id and duplicates can be
 * dropped on sight.
 */
struct GossipMessage {
  MessageType type{MessageType::BLOCK};
  nlohmann::json payload = nlohmann::json::object();
  std::string sender;
  int64_t timestamp{0}; // Unix milliseconds
  std::string message_id;
  int ttl{DEFAULT_TTL};
  std::optional<std::string> signature;

  std::vector<uint8_t> Serialize() const;

  // Returns std::nullopt for malformed bytes or missing fields (never throws)
  static std::optional<GossipMessage> Deserialize(const std::vector<uint8_t> &data);

  // Recompute the id from payload/timestamp/sender and compare
  bool HasValidId() const;
};

std::string ComputeMessageId(const nlohmann::json &payload, int64_t timestamp,
                             const std::string &sender);

} // namespace network
} // namespace dagsync
