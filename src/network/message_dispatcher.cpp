#include "network/message_dispatcher.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace dagsync {
namespace network {

void MessageDispatcher::RegisterHandler(MessageType type, MessageHandler handler) {
  // Validate handler is not empty (prevent std::bad_function_call)
  if (!handler) {
    LOG_GOSSIP_ERROR("Attempted to register empty handler for type: {}",
                     MessageTypeToString(type));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[type] = std::move(handler);
  LOG_GOSSIP_DEBUG("Registered handler for type: {}", MessageTypeToString(type));
}

void MessageDispatcher::UnregisterHandler(MessageType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(type) > 0) {
    LOG_GOSSIP_DEBUG("Unregistered handler for type: {}", MessageTypeToString(type));
  }
}

bool MessageDispatcher::Dispatch(const std::string& from, const GossipMessage& msg) {
  // Get handler (lock scope minimized)
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(msg.type);
    if (it == handlers_.end()) {
      LOG_GOSSIP_TRACE("No handler for type: {}", MessageTypeToString(msg.type));
      return false;
    }
    handler = it->second;
  }

  // Execute handler (outside lock - handlers may register/unregister)
  try {
    return handler(from, msg);
  } catch (const std::exception& e) {
    LOG_GOSSIP_ERROR("Handler exception for type {} from {}: {}",
                     MessageTypeToString(msg.type), from, e.what());
    return false;
  }
}

bool MessageDispatcher::HasHandler(MessageType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(type) > 0;
}

std::vector<std::string> MessageDispatcher::GetRegisteredTypes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(handlers_.size());
  for (const auto& [type, _] : handlers_) {
    result.push_back(MessageTypeToString(type));
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace network
} // namespace dagsync
