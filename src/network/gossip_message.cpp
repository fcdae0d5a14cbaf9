#include "network/gossip_message.hpp"
#include "crypto/hash.hpp"
#include "util/logging.hpp"

namespace dagsync {
namespace network {

std::string MessageTypeToString(MessageType type) {
  switch (type) {
  case MessageType::BLOCK:
    return "block";
  case MessageType::TRANSACTION:
    return "transaction";
  case MessageType::PEER_DISCOVERY:
    return "peer_discovery";
  case MessageType::SYNC_REQUEST:
    return "sync_request";
  case MessageType::SYNC_RESPONSE:
    return "sync_response";
  case MessageType::FALLBACK_REQUEST:
    return "fallback_request";
  case MessageType::FALLBACK_RESPONSE:
    return "fallback_response";
  case MessageType::ACK:
    return "ack";
  }
  return "unknown";
}

std::optional<MessageType> MessageTypeFromString(const std::string &str) {
  if (str == "block") return MessageType::BLOCK;
  if (str == "transaction") return MessageType::TRANSACTION;
  if (str == "peer_discovery") return MessageType::PEER_DISCOVERY;
  if (str == "sync_request") return MessageType::SYNC_REQUEST;
  if (str == "sync_response") return MessageType::SYNC_RESPONSE;
  if (str == "fallback_request") return MessageType::FALLBACK_REQUEST;
  if (str == "fallback_response") return MessageType::FALLBACK_RESPONSE;
  if (str == "ack") return MessageType::ACK;
  return std::nullopt;
}

std::string ComputeMessageId(const nlohmann::json &payload, int64_t timestamp,
                             const std::string &sender) {
  return crypto::Sha256Hex(payload.dump() + std::to_string(timestamp) + sender);
}

std::vector<uint8_t> GossipMessage::Serialize() const {
  nlohmann::json j;
  j["type"] = MessageTypeToString(type);
  j["payload"] = payload;
  j["sender"] = sender;
  j["timestamp"] = timestamp;
  j["message_id"] = message_id;
  j["ttl"] = ttl;
  if (signature) {
    j["signature"] = *signature;
  }
  const std::string encoded = j.dump();
  return std::vector<uint8_t>(encoded.begin(), encoded.end());
}

std::optional<GossipMessage> GossipMessage::Deserialize(const std::vector<uint8_t> &data) {
  if (data.empty()) {
    return std::nullopt;
  }

  nlohmann::json j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }

  try {
    auto type = MessageTypeFromString(j.at("type").get<std::string>());
    if (!type) {
      return std::nullopt;
    }

    GossipMessage msg;
    msg.type = *type;
    msg.payload = j.at("payload");
    msg.sender = j.at("sender").get<std::string>();
    msg.timestamp = j.at("timestamp").get<int64_t>();
    msg.message_id = j.at("message_id").get<std::string>();
    msg.ttl = j.at("ttl").get<int>();
    if (j.contains("signature") && !j["signature"].is_null()) {
      msg.signature = j["signature"].get<std::string>();
    }

    if (!msg.payload.is_object() || msg.message_id.empty() || msg.ttl < 0) {
      return std::nullopt;
    }
    return msg;
  } catch (const nlohmann::json::exception &e) {
    LOG_GOSSIP_TRACE("Malformed gossip message: {}", e.what());
    return std::nullopt;
  }
}

bool GossipMessage::HasValidId() const {
  return message_id == ComputeMessageId(payload, timestamp, sender);
}

} // namespace network
} // namespace dagsync
