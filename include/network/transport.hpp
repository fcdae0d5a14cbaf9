#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dagsync {
namespace network {

// Abstract transport interface for peer-to-peer delivery
// Allows dependency injection of different implementations:
// - A real socket transport owned by the surrounding node process
// - InMemoryNetwork endpoints for testing (in test/infra/)
//
// Peers are addressed by their node id; connection management belongs to
// the implementation, not to the ledger core.

// Callback for inbound data: `from` is the transport-level sender
using ReceiveCallback =
    std::function<void(const std::string &from, const std::vector<uint8_t> &data)>;

class Transport {
public:
  virtual ~Transport() = default;

  // Send data to a peer (returns false if the peer is unreachable)
  // Semantics:
  // - Returns false if the implementation could not accept the payload at
  //   call time (unknown peer, connection closed).
  // - Returns true if the implementation accepted the send attempt. The
  //   network is silently unreliable: callers must not treat `true` as
  //   "delivered"; acknowledgment is a protocol-level concern.
  // - Must not block and must be safe to call repeatedly; retries are the
  //   caller's responsibility.
  virtual bool send(const std::string &peer_id, const std::vector<uint8_t> &data) = 0;

  // Install the inbound data callback (an empty callback detaches)
  virtual void set_receive_callback(ReceiveCallback callback) = 0;
};

} // namespace network
} // namespace dagsync
