#ifndef DAGSYNC_NETWORK_MESSAGE_DISPATCHER_HPP
#define DAGSYNC_NETWORK_MESSAGE_DISPATCHER_HPP

#include "network/gossip_message.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dagsync {
namespace network {

/**
 * MessageDispatcher - gossip message routing via handler registry
 *
 * Design:
 * - Upper layers (SyncManager, LedgerService) register handlers for the
 *   message types they consume; GossipProtocol keeps dedup, ack and
 *   fallback handling to itself and forwards the rest here
 * - Thread-safe registration and dispatch
 * - One handler per type; re-registering replaces the previous handler
 *
 * Ownership Model:
 * - Handlers receive the message by const reference (borrowed, not owned)
 * - Handlers that need the message later must copy it
 *
 * Usage:
 *   MessageDispatcher dispatcher;
 *   dispatcher.RegisterHandler(MessageType::SYNC_RESPONSE,
 *     [this](const std::string& from, const GossipMessage& m) {
 *       return sync_->HandleSyncResponse(from, m);
 *     });
 *   dispatcher.Dispatch(from, msg);
 */
class MessageDispatcher {
public:
  // Handler signature: takes transport-level sender + message, returns success
  using MessageHandler = std::function<bool(const std::string&, const GossipMessage&)>;

  MessageDispatcher() = default;
  ~MessageDispatcher() = default;

  // Non-copyable
  MessageDispatcher(const MessageDispatcher&) = delete;
  MessageDispatcher& operator=(const MessageDispatcher&) = delete;

  /**
   * Register handler for a message type
   *
   * @param type Message type to route
   * @param handler Function to handle this message type (required, must not be empty)
   *
   * Note: Empty handlers are rejected to prevent std::bad_function_call
   */
  void RegisterHandler(MessageType type, MessageHandler handler);

  void UnregisterHandler(MessageType type);

  /**
   * Dispatch message to registered handler
   *
   * @return false if no handler found, handler returns false or throws
   */
  bool Dispatch(const std::string& from, const GossipMessage& msg);

  bool HasHandler(MessageType type) const;

  // Sorted wire names of the registered types (for diagnostics)
  std::vector<std::string> GetRegisteredTypes() const;

private:
  mutable std::mutex mutex_;
  std::map<MessageType, MessageHandler> handlers_;
};

} // namespace network
} // namespace dagsync

#endif // DAGSYNC_NETWORK_MESSAGE_DISPATCHER_HPP
